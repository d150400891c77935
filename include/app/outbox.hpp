#pragma once
#include <atomic>
#include <cstdint>
#include <optional>

#include "proto/message.hpp"
#include "transport/itransport.hpp"

namespace app
{

// Lifts a transport event into the protocol's message set. Undecodable payloads
// (foreign traffic, malformed JSON) yield nullopt.
std::optional<proto::Message> to_message(const transport::Event &ev);

// Encodes and sends protocol messages. Every failure (encode, transport error, an
// adapter throwing) is logged and counted here and never reaches the caller's loop.
class Outbox
{
  public:
    explicit Outbox(transport::ITransport &t) : tx_(t) {}

    bool broadcast(const proto::Message &m);
    bool send_to(const proto::PeerId &peer, const proto::Message &m);

    // Addressed when the transport can address peers, otherwise to the whole topic
    bool reply(const proto::PeerId &peer, const proto::Message &m);

    std::uint64_t failures() const { return failures_.load(); }

  private:
    bool send(const proto::PeerId *peer, const proto::Message &m);

    transport::ITransport     &tx_;
    std::atomic<std::uint64_t> failures_{0};
};

}  // namespace app
