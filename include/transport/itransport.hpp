#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Bytes  = std::vector<std::uint8_t>;
using PeerId = std::string;

enum class Topology
{
    Relay,   // shared topic, every send reaches every member (including the sender)
    Direct,  // one bidirectional connection per peer pair
};

inline const char *topology_name(Topology t)
{
    return t == Topology::Direct ? "direct" : "relay";
}

struct Capabilities
{
    Topology    topology         = Topology::Relay;
    bool        addressed_send   = false;  // send_to reaches only the addressed peer
    bool        lifecycle_events = false;  // PeerConnected means "session peer is reachable"
    bool        echoes_broadcast = true;   // our own broadcasts come back to us
    std::size_t max_message_size = constants::MAX_MESSAGE_SIZE;
};

// Inbound events. In the relay topology PeerConnected/PeerDisconnected are neighbour
// up/down hints only.
struct PeerConnected
{
    PeerId id;
};
struct PeerDisconnected
{
    PeerId id;
};
struct MessageReceived
{
    PeerId from;  // transport-level sender
    Bytes  bytes;
};
// Asynchronous adapter failure (lost relay, connection reset). Informational.
struct TransportError
{
    std::string message;
};

using Event   = std::variant<PeerConnected, PeerDisconnected, MessageReceived, TransportError>;
using OnEvent = std::function<void(const Event &)>;

// Peer transport adapter. Implementations may deliver events on any thread.
struct ITransport
{
    virtual std::string  local_id() const = 0;
    virtual Capabilities caps() const     = 0;

    virtual bool start(OnEvent on_event) = 0;  // subscribe to the event stream
    virtual void stop()                  = 0;  // unsubscribe, idempotent

    // false on send failure (not started, not joined, unknown peer, too large)
    virtual bool broadcast(const Bytes &msg)                   = 0;
    virtual bool send_to(const PeerId &peer, const Bytes &msg) = 0;

    // Session establishment. Tickets are opaque connection descriptors.
    virtual std::optional<std::string> create(const std::string &name)                   = 0;
    virtual bool                       join(const std::string &ticket, const std::string &name) = 0;
    virtual void                       leave()                                            = 0;

    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

}  // namespace transport
