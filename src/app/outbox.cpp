#include <exception>

#include "app/outbox.hpp"
#include "proto/codec.hpp"
#include "util/log.hpp"

namespace app
{

std::optional<proto::Message> to_message(const transport::Event &ev)
{
    return std::visit(
        proto::overloaded{
            [](const transport::PeerConnected &e) -> std::optional<proto::Message> {
                return proto::PeerUp{e.id};
            },
            [](const transport::PeerDisconnected &e) -> std::optional<proto::Message> {
                return proto::PeerDown{e.id};
            },
            [](const transport::TransportError &e) -> std::optional<proto::Message> {
                return proto::Error{e.message};
            },
            [](const transport::MessageReceived &e) -> std::optional<proto::Message> {
                return proto::decode(e.bytes);
            },
        },
        ev);
}

bool Outbox::broadcast(const proto::Message &m)
{
    return send(nullptr, m);
}

bool Outbox::send_to(const proto::PeerId &peer, const proto::Message &m)
{
    return send(&peer, m);
}

bool Outbox::reply(const proto::PeerId &peer, const proto::Message &m)
{
    if (tx_.caps().addressed_send)
        return send(&peer, m);
    return send(nullptr, m);
}

bool Outbox::send(const proto::PeerId *peer, const proto::Message &m)
{
    auto bytes = proto::encode(m, tx_.caps().max_message_size);
    if (!bytes)
    {
        LOG_ERROR("[TX] cannot encode %s", proto::type_name(m));
        failures_++;
        return false;
    }

    bool ok = false;
    try
    {
        ok = peer ? tx_.send_to(*peer, *bytes) : tx_.broadcast(*bytes);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("[TX] %s: transport threw: %s", proto::type_name(m), e.what());
        ok = false;
    }

    if (!ok)
    {
        failures_++;
        LOG_WARN("[TX] %s to %s failed", proto::type_name(m),
                 peer ? chunkcast::short_id(*peer).c_str() : "topic");
        return false;
    }
    LOG_DEBUG("[TX] %s to %s (%zu bytes)", proto::type_name(m),
              peer ? chunkcast::short_id(*peer).c_str() : "topic", bytes->size());
    return true;
}

}  // namespace app
