#include "app/session.hpp"
#include "util/log.hpp"

namespace app
{

BroadcasterOptions broadcaster_options(const config::Config &cfg, transport::Topology t)
{
    const bool relay = t == transport::Topology::Relay;

    BroadcasterOptions o;
    o.push              = cfg.push.value_or(relay);
    o.presence_interval = cfg.presence_interval.value_or(config::ms(relay ? 3000 : 5000));
    o.chunk_interval    = cfg.chunk_interval;
    o.name              = cfg.name;
    return o;
}

ViewerOptions viewer_options(const config::Config &cfg, transport::Topology t)
{
    const bool relay = t == transport::Topology::Relay;

    ViewerOptions o;
    o.request_window    = cfg.request_window.value_or(relay ? 5 : 3);
    o.request_interval  = cfg.request_interval.value_or(config::ms(relay ? 500 : 300));
    o.metadata_attempts = cfg.metadata_attempts.value_or(relay ? 10 : 1);
    o.metadata_interval = cfg.metadata_interval;
    // direct: the connection itself gates the first request
    o.wait_for_connect = !relay;
    o.serve_peers      = relay;
    o.announce_chunks  = relay;
    return o;
}

std::unique_ptr<Session> Session::broadcast(transport::ITransport &t, const proto::Bytes &bytes,
                                            const std::string &file_name,
                                            const config::Config &cfg, BroadcasterCallbacks cbs)
{
    auto s    = std::make_unique<Session>(Key{}, t, Role::Broadcaster);
    s->bcast_ = std::make_unique<Broadcaster>(t, broadcaster_options(cfg, t.caps().topology));
    s->bcast_->set_callbacks(std::move(cbs));

    if (!s->bcast_->prepare(bytes, file_name))
        return nullptr;

    auto ticket = t.create(cfg.name);
    if (!ticket)
    {
        LOG_ERROR("transport %s could not create a session", t.name().c_str());
        return nullptr;
    }
    s->ticket_ = *ticket;

    if (!s->bcast_->start())
        return nullptr;  // ~Session leaves
    LOG_INFO("session ticket: %s", s->ticket_.c_str());
    return s;
}

std::unique_ptr<Session> Session::view(transport::ITransport &t, const std::string &ticket,
                                       const config::Config &cfg, ViewerCallbacks cbs)
{
    auto       s    = std::make_unique<Session>(Key{}, t, Role::Viewer);
    const auto opts = viewer_options(cfg, t.caps().topology);
    s->view_        = std::make_unique<Viewer>(t, opts);
    s->view_->set_callbacks(std::move(cbs));
    s->ticket_ = ticket;

    // subscribe before joining so the connection event is not missed
    if (!s->view_->listen())
        return nullptr;
    if (!t.join(ticket, cfg.name))
    {
        LOG_ERROR("cannot join %s", ticket.c_str());
        s->view_->destroy();
        return nullptr;
    }
    if (!opts.wait_for_connect)
        s->view_->request_metadata();
    return s;
}

Session::~Session()
{
    close();
}

void Session::close()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_)
            return;
        closed_ = true;
    }
    if (bcast_)
        bcast_->stop();
    if (view_)
        view_->destroy();
    tx_.leave();
    LOG_DEBUG("session closed");
}

}  // namespace app
