#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "transport/itransport.hpp"

namespace transport
{

enum class Fault
{
    Deliver,
    Drop,
    Duplicate,
};

// Decides the fate of one delivery (one sender -> one receiver copy)
using FaultFn = std::function<Fault(const PeerId &from, const PeerId &to, const Bytes &msg)>;

class LoopbackTransport;

// In-process network shared by LoopbackTransport endpoints: a fake link to run both
// roles in one process (tests, the loopback tool) without a real P2P stack.
// Delivery is synchronous on the sending thread. The hub must outlive its endpoints.
class LoopbackHub
{
  public:
    explicit LoopbackHub(Topology t = Topology::Relay,
                         std::size_t max_message_size = constants::MAX_MESSAGE_SIZE);

    Topology    topology() const { return topology_; }
    std::size_t max_message_size() const { return max_message_size_; }
    void        set_fault(FaultFn f);

    // counters for tests
    std::size_t delivered() const;
    std::size_t dropped() const;

  private:
    friend class LoopbackTransport;

    struct Port
    {
        std::mutex                   mu;
        std::condition_variable      cv;
        OnEvent                      cb;
        std::vector<std::thread::id> inflight;  // threads currently inside cb
    };

    void attach(const PeerId &id, const std::shared_ptr<Port> &port);
    void detach(const PeerId &id);

    std::optional<std::string> create(const PeerId &self);
    bool                       join(const PeerId &self, const std::string &ticket);
    void                       leave(const PeerId &self);
    bool                       broadcast(const PeerId &from, const Bytes &msg);
    bool                       send_to(const PeerId &from, const PeerId &to, const Bytes &msg);

    void leave_locked(const PeerId &self, std::vector<std::pair<PeerId, Event>> &notify);
    void send_message(const PeerId &from, const std::vector<PeerId> &to, const Bytes &msg);
    void deliver(const PeerId &to, const Event &ev);

    const Topology    topology_;
    const std::size_t max_message_size_;

    mutable std::mutex                     mu_;
    FaultFn                                fault_;
    std::map<PeerId, std::weak_ptr<Port>>  ports_;
    std::map<std::string, std::set<PeerId>> topics_;     // relay: topic -> members
    std::map<PeerId, std::string>          member_of_;  // relay: endpoint -> topic
    std::set<PeerId>                       listeners_;  // direct: accepting endpoints
    std::map<PeerId, std::set<PeerId>>     links_;      // direct: adjacency
    std::size_t                            delivered_{0};
    std::size_t                            dropped_{0};
};

class LoopbackTransport final : public ITransport
{
  public:
    // Empty id: a random identity is generated
    explicit LoopbackTransport(LoopbackHub &hub, PeerId id = {});
    ~LoopbackTransport() override;

    std::string  local_id() const override { return id_; }
    Capabilities caps() const override;

    bool start(OnEvent on_event) override;
    void stop() override;

    bool broadcast(const Bytes &msg) override;
    bool send_to(const PeerId &peer, const Bytes &msg) override;

    std::optional<std::string> create(const std::string &name) override;
    bool                       join(const std::string &ticket, const std::string &name) override;
    void                       leave() override;

    std::string name() const override { return "loopback"; }

  private:
    bool can_send(const Bytes &msg) const;

    LoopbackHub                         &hub_;
    PeerId                               id_;
    std::shared_ptr<LoopbackHub::Port>   port_;
    std::atomic_bool                     started_{false};
};

}  // namespace transport
