#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "app/outbox.hpp"
#include "proto/chunker.hpp"
#include "proto/message.hpp"
#include "transport/itransport.hpp"
#include "util/periodic.hpp"

namespace app
{

struct ViewerOptions
{
    std::size_t               request_window{5};  // max outstanding chunk requests
    std::chrono::milliseconds request_interval{500};
    std::uint32_t             metadata_attempts{10};
    std::chrono::milliseconds metadata_interval{1000};
    bool                      wait_for_connect{false};  // first metadata request on PeerConnected
    bool                      serve_peers{true};        // answer other viewers' chunk requests
    bool                      announce_chunks{true};    // HaveChunks every 10 chunks
};

enum class ViewState
{
    Idle,
    AwaitingMetadata,
    Downloading,
    Complete,
    Failed,
};

const char *state_name(ViewState s);

struct ViewerCallbacks
{
    std::function<void(const proto::AssetMetadata &)>                on_metadata;
    std::function<void(std::uint32_t received, std::uint32_t total)>  on_progress;
    std::function<void(const proto::Bytes &)>                        on_complete;
    std::function<void(const std::string &)>                         on_error;
    std::function<void(const proto::PeerId &)>                       on_connected;
    std::function<void(const proto::PeerId &)>                       on_disconnected;
    std::function<void(const proto::PeerId &, const proto::Bytes &)> on_signal;
};

struct ViewerStats
{
    std::uint32_t requests_sent{0};
    std::uint32_t duplicates{0};
    std::uint32_t stale_resets{0};
    std::uint32_t metadata_requests{0};
    std::uint64_t send_failures{0};
};

// Acquisition state machine: fetches one asset chunk by chunk and reassembles it.
// Idle -> AwaitingMetadata -> Downloading -> Complete | Failed.
//
// Requests are pulled by a periodic tick that keeps at most request_window chunks
// outstanding. A tick that cannot issue anything while requests are outstanding treats
// them all as lost and clears them, so the next tick asks again from the lowest gap.
class Viewer
{
  public:
    Viewer(transport::ITransport &t, ViewerOptions opts = {});
    ~Viewer();

    Viewer(const Viewer &)            = delete;
    Viewer &operator=(const Viewer &) = delete;

    void set_callbacks(ViewerCallbacks cb);  // before listen()

    bool listen();             // subscribe: Idle -> AwaitingMetadata
    void request_metadata();   // first attempt now, the rest on the metadata timer
    bool start();              // listen() + request_metadata() unless wait_for_connect
    void destroy();            // safe from any state, idempotent

    // One step of each loop. Driven by the internal timers; public for hosts that
    // disable them (interval 0) and for tests.
    void tick();
    void metadata_tick();

    void on_event(const transport::Event &ev);

    ViewState                                      state() const;
    std::optional<proto::AssetMetadata>            metadata() const;
    std::size_t                                    received_count() const;
    std::size_t                                    pending_count() const;
    std::set<std::uint32_t>                        pending() const;
    double                                         progress() const;  // 0..1
    bool                                           is_complete() const;
    bool                                           is_connected() const;
    bool                                           requesting() const;  // request timer live
    std::map<proto::PeerId, std::set<std::uint32_t>> peer_availability() const;
    ViewerStats                                    stats() const;
    const std::string                             &local_id() const { return self_; }

  private:
    void handle(const proto::Message &m);
    void on_metadata(const proto::Metadata &m);
    void on_chunk(const proto::ChunkData &c);
    void on_peer_request(const proto::RequestChunk &r);
    void on_peer_up(const proto::PeerId &id);
    void on_peer_down(const proto::PeerId &id);
    void finish();
    bool expected_size(std::uint32_t index, std::size_t size) const;  // mu_ held
    static bool consistent(const proto::AssetMetadata &a);
    ViewerCallbacks callbacks() const;

    transport::ITransport &tx_;
    const ViewerOptions    opts_;
    const std::string      self_;
    Outbox                 out_;

    mutable std::mutex                  mu_;
    ViewerCallbacks                     cb_;
    ViewState                           state_{ViewState::Idle};
    std::optional<proto::AssetMetadata> meta_;
    proto::PeerId                       source_;  // sender of the accepted metadata
    proto::ChunkMap                     buffer_;
    std::set<std::uint32_t>             received_;
    std::set<std::uint32_t>             pending_;
    std::uint32_t                       attempts_{0};
    bool                                listening_{false};
    bool                                closing_{false};  // destroy() in progress
    std::set<proto::PeerId>             connected_;
    std::map<proto::PeerId, std::set<std::uint32_t>> availability_;

    util::PeriodicTask meta_timer_;
    util::PeriodicTask req_timer_;

    std::atomic<std::uint32_t> requests_sent_{0};
    std::atomic<std::uint32_t> duplicates_{0};
    std::atomic<std::uint32_t> stale_resets_{0};
    std::atomic<std::uint32_t> metadata_requests_{0};
};

}  // namespace app
