#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "app/broadcaster.hpp"
#include "app/viewer.hpp"
#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace app
{

// Option structs for one topology; values left unset in cfg take the topology defaults
// (relay: push, 3 s presence, window 5 every 500 ms, 10 metadata attempts;
//  direct: demand, 5 s presence, window 3 every 300 ms, one attempt after connect).
BroadcasterOptions broadcaster_options(const config::Config &cfg, transport::Topology t);
ViewerOptions      viewer_options(const config::Config &cfg, transport::Topology t);

// One role bound to one transport session. Explicitly constructed; any number of
// sessions can live side by side.
class Session
{
    // only the factories below can construct one
    struct Key
    {
        explicit Key() = default;
    };

  public:
    enum class Role
    {
        Broadcaster,
        Viewer,
    };

    // prepare -> create -> start. nullptr on failure (logged).
    static std::unique_ptr<Session> broadcast(transport::ITransport &t, const proto::Bytes &bytes,
                                              const std::string &file_name,
                                              const config::Config &cfg,
                                              BroadcasterCallbacks cbs = {});

    // listen -> join -> request metadata (or wait for the connection in direct mode)
    static std::unique_ptr<Session> view(transport::ITransport &t, const std::string &ticket,
                                         const config::Config &cfg, ViewerCallbacks cbs = {});

    Session(Key, transport::ITransport &t, Role r) : tx_(t), role_(r) {}
    ~Session();

    Session(const Session &)            = delete;
    Session &operator=(const Session &) = delete;

    Role               role() const { return role_; }
    const std::string &ticket() const { return ticket_; }
    Broadcaster       *broadcaster() { return bcast_.get(); }
    Viewer            *viewer() { return view_.get(); }

    // Stops the role (timers, then unsubscribe) and leaves the transport session
    void close();

  private:
    transport::ITransport       &tx_;
    const Role                   role_;
    std::string                  ticket_;
    std::unique_ptr<Broadcaster> bcast_;
    std::unique_ptr<Viewer>      view_;
    std::mutex                   mu_;
    bool                         closed_{false};
};

}  // namespace app
