#include <algorithm>
#include <utility>

#include "crypto/encoding.hpp"
#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

static constexpr const char RELAY_PREFIX[]  = "relay:";
static constexpr const char DIRECT_PREFIX[] = "direct:";

static bool strip_prefix(const std::string &s, const char *prefix, std::string &rest)
{
    const std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0 || s.size() == p.size())
        return false;
    rest = s.substr(p.size());
    return true;
}

// ----------------------------------------------------------------------
// LoopbackHub
// ----------------------------------------------------------------------

LoopbackHub::LoopbackHub(Topology t, std::size_t max_message_size)
    : topology_(t), max_message_size_(max_message_size)
{
}

void LoopbackHub::set_fault(FaultFn f)
{
    std::lock_guard<std::mutex> lk(mu_);
    fault_ = std::move(f);
}

std::size_t LoopbackHub::delivered() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return delivered_;
}

std::size_t LoopbackHub::dropped() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

void LoopbackHub::attach(const PeerId &id, const std::shared_ptr<Port> &port)
{
    std::lock_guard<std::mutex> lk(mu_);
    ports_[id] = port;
}

void LoopbackHub::detach(const PeerId &id)
{
    std::vector<std::pair<PeerId, Event>> notify;
    {
        std::lock_guard<std::mutex> lk(mu_);
        leave_locked(id, notify);
        ports_.erase(id);
    }
    for (const auto &n : notify)
        deliver(n.first, n.second);
}

std::optional<std::string> LoopbackHub::create(const PeerId &self)
{
    std::vector<std::pair<PeerId, Event>> notify;
    std::string                           ticket;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (topology_ == Topology::Relay)
        {
            leave_locked(self, notify);
            std::string topic;
            do
            {
                topic = crypto::random_peer_id().substr(0, 32);
            } while (topics_.count(topic));
            topics_[topic].insert(self);
            member_of_[self] = topic;
            ticket           = RELAY_PREFIX + topic;
        }
        else
        {
            listeners_.insert(self);
            ticket = DIRECT_PREFIX + self;
        }
    }
    for (const auto &n : notify)
        deliver(n.first, n.second);
    LOG_DEBUG("[LOOP] %s created %s", chunkcast::short_id(self).c_str(), ticket.c_str());
    return ticket;
}

bool LoopbackHub::join(const PeerId &self, const std::string &ticket)
{
    std::vector<std::pair<PeerId, Event>> notify;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::string                 target;
        if (topology_ == Topology::Relay)
        {
            if (!strip_prefix(ticket, RELAY_PREFIX, target))
            {
                LOG_WARN("[LOOP] not a relay ticket: %s", ticket.c_str());
                return false;
            }
            auto cur = member_of_.find(self);
            if (cur != member_of_.end() && cur->second == target)
                return true;  // already subscribed
            leave_locked(self, notify);

            auto &members = topics_[target];
            for (const auto &m : members)
            {
                notify.emplace_back(m, PeerConnected{self});
                notify.emplace_back(self, PeerConnected{m});
            }
            members.insert(self);
            member_of_[self] = target;
        }
        else
        {
            if (!strip_prefix(ticket, DIRECT_PREFIX, target))
            {
                LOG_WARN("[LOOP] not a direct ticket: %s", ticket.c_str());
                return false;
            }
            if (target == self || !listeners_.count(target) || !ports_.count(target))
            {
                LOG_WARN("[LOOP] no endpoint accepting at %s",
                         chunkcast::short_id(target).c_str());
                return false;
            }
            if (links_[self].insert(target).second)
            {
                links_[target].insert(self);
                // the joiner hears about the connection before anything the listener
                // sends in response to its own PeerConnected
                notify.emplace_back(self, PeerConnected{target});
                notify.emplace_back(target, PeerConnected{self});
            }
        }
    }
    for (const auto &n : notify)
        deliver(n.first, n.second);
    return true;
}

void LoopbackHub::leave(const PeerId &self)
{
    std::vector<std::pair<PeerId, Event>> notify;
    {
        std::lock_guard<std::mutex> lk(mu_);
        leave_locked(self, notify);
    }
    for (const auto &n : notify)
        deliver(n.first, n.second);
}

void LoopbackHub::leave_locked(const PeerId &self, std::vector<std::pair<PeerId, Event>> &notify)
{
    auto mem = member_of_.find(self);
    if (mem != member_of_.end())
    {
        auto &members = topics_[mem->second];
        members.erase(self);
        for (const auto &m : members)
            notify.emplace_back(m, PeerDisconnected{self});
        if (members.empty())
            topics_.erase(mem->second);
        member_of_.erase(mem);
    }

    listeners_.erase(self);
    auto links = links_.find(self);
    if (links != links_.end())
    {
        for (const auto &peer : links->second)
        {
            links_[peer].erase(self);
            notify.emplace_back(peer, PeerDisconnected{self});
            notify.emplace_back(self, PeerDisconnected{peer});
        }
        links_.erase(links);
    }
}

bool LoopbackHub::broadcast(const PeerId &from, const Bytes &msg)
{
    std::vector<PeerId> to;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (topology_ == Topology::Relay)
        {
            auto mem = member_of_.find(from);
            if (mem == member_of_.end())
                return false;  // not subscribed to any topic
            const auto &members = topics_[mem->second];
            to.assign(members.begin(), members.end());  // includes the sender: relay echo
        }
        else
        {
            auto links = links_.find(from);
            if (links != links_.end())
                to.assign(links->second.begin(), links->second.end());
        }
    }
    send_message(from, to, msg);
    return true;
}

bool LoopbackHub::send_to(const PeerId &from, const PeerId &peer, const Bytes &msg)
{
    // a relay has no unicast: everything goes to the topic
    if (topology_ == Topology::Relay)
        return broadcast(from, msg);

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        links = links_.find(from);
        if (links == links_.end() || !links->second.count(peer))
            return false;
    }
    send_message(from, {peer}, msg);
    return true;
}

void LoopbackHub::send_message(const PeerId &from, const std::vector<PeerId> &to, const Bytes &msg)
{
    FaultFn fault;
    {
        std::lock_guard<std::mutex> lk(mu_);
        fault = fault_;
    }
    for (const auto &peer : to)
    {
        const Fault f = fault ? fault(from, peer, msg) : Fault::Deliver;
        if (f == Fault::Drop)
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped_++;
            continue;
        }
        const int copies = (f == Fault::Duplicate) ? 2 : 1;
        for (int i = 0; i < copies; i++)
            deliver(peer, MessageReceived{from, msg});
    }
}

void LoopbackHub::deliver(const PeerId &to, const Event &ev)
{
    std::shared_ptr<Port> port;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = ports_.find(to);
        if (it == ports_.end())
            return;
        port = it->second.lock();
        if (std::holds_alternative<MessageReceived>(ev))
            delivered_++;
    }
    if (!port)
        return;

    OnEvent cb;
    {
        std::lock_guard<std::mutex> lk(port->mu);
        if (!port->cb)
            return;  // not started: nobody listening
        cb = port->cb;
        port->inflight.push_back(std::this_thread::get_id());
    }

    // keep inflight accurate even if a handler throws
    struct Done
    {
        Port *p;
        ~Done()
        {
            std::lock_guard<std::mutex> lk(p->mu);
            auto it = std::find(p->inflight.begin(), p->inflight.end(), std::this_thread::get_id());
            if (it != p->inflight.end())
                p->inflight.erase(it);
            p->cv.notify_all();
        }
    } done{port.get()};

    cb(ev);
}

// ----------------------------------------------------------------------
// LoopbackTransport
// ----------------------------------------------------------------------

LoopbackTransport::LoopbackTransport(LoopbackHub &hub, PeerId id)
    : hub_(hub), id_(id.empty() ? crypto::random_peer_id() : std::move(id)),
      port_(std::make_shared<LoopbackHub::Port>())
{
    hub_.attach(id_, port_);
}

LoopbackTransport::~LoopbackTransport()
{
    stop();
    hub_.detach(id_);
}

Capabilities LoopbackTransport::caps() const
{
    Capabilities c;
    c.topology         = hub_.topology();
    c.max_message_size = hub_.max_message_size();
    if (c.topology == Topology::Direct)
    {
        c.addressed_send   = true;
        c.lifecycle_events = true;
        c.echoes_broadcast = false;
    }
    return c;
}

bool LoopbackTransport::start(OnEvent on_event)
{
    if (!on_event)
        return false;
    {
        std::lock_guard<std::mutex> lk(port_->mu);
        port_->cb = std::move(on_event);
    }
    started_ = true;
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    std::unique_lock<std::mutex> lk(port_->mu);
    port_->cb = nullptr;
    // wait for handlers running on other threads; ours may be the caller
    const auto self = std::this_thread::get_id();
    port_->cv.wait(lk, [&] {
        return std::all_of(port_->inflight.begin(), port_->inflight.end(),
                           [&](const std::thread::id &t) { return t == self; });
    });
}

bool LoopbackTransport::can_send(const Bytes &msg) const
{
    if (!started_)
        return false;
    if (msg.size() > hub_.max_message_size())
    {
        LOG_WARN("[LOOP] message too large (%zu > %zu)", msg.size(), hub_.max_message_size());
        return false;
    }
    return true;
}

bool LoopbackTransport::broadcast(const Bytes &msg)
{
    if (!can_send(msg))
        return false;
    return hub_.broadcast(id_, msg);
}

bool LoopbackTransport::send_to(const PeerId &peer, const Bytes &msg)
{
    if (!can_send(msg))
        return false;
    return hub_.send_to(id_, peer, msg);
}

std::optional<std::string> LoopbackTransport::create(const std::string &name)
{
    LOG_DEBUG("[LOOP] create '%s' on %s", name.c_str(), topology_name(hub_.topology()));
    return hub_.create(id_);
}

bool LoopbackTransport::join(const std::string &ticket, const std::string &name)
{
    LOG_DEBUG("[LOOP] %s joins as '%s'", chunkcast::short_id(id_).c_str(), name.c_str());
    return hub_.join(id_, ticket);
}

void LoopbackTransport::leave()
{
    hub_.leave(id_);
}

}  // namespace transport
