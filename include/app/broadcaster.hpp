#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "app/outbox.hpp"
#include "proto/chunker.hpp"
#include "proto/message.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"
#include "util/periodic.hpp"

namespace app
{

struct BroadcasterOptions
{
    // Push: announce metadata twice, stream every chunk once, then keep serving requests.
    // Demand: only answer RequestMetadata / RequestChunk.
    bool                      push{false};
    std::chrono::milliseconds presence_interval{3000};
    std::chrono::milliseconds chunk_interval{100};  // push pacing
    std::string               name{constants::DEFAULT_NAME};
};

enum class BroadcastState
{
    Idle,
    Prepared,
    Broadcasting,
    Stopped,
};

const char *state_name(BroadcastState s);

struct BroadcasterCallbacks
{
    std::function<void(std::uint32_t sent, std::uint32_t total)>     on_progress;
    std::function<void(const proto::PeerId &, std::uint32_t index)> on_peer_request;
    std::function<void(const proto::PeerId &)>                      on_peer_connected;
    std::function<void(const proto::PeerId &, const proto::Bytes &)> on_signal;
};

struct BroadcasterStats
{
    std::uint32_t chunks_sent{0};  // push + on request, for UI/telemetry
    std::uint32_t metadata_sent{0};
    std::uint32_t invalid_requests{0};
    std::uint64_t send_failures{0};
};

// Distribution state machine: owns one asset and serves it to viewers.
// Idle -> Prepared -> Broadcasting -> Stopped (-> Broadcasting again via start()).
class Broadcaster
{
  public:
    Broadcaster(transport::ITransport &t, BroadcasterOptions opts = {});
    ~Broadcaster();

    Broadcaster(const Broadcaster &)            = delete;
    Broadcaster &operator=(const Broadcaster &) = delete;

    // Splits the asset and computes its metadata. Calling it again with the same bytes
    // is a no-op; a different asset is refused while broadcasting.
    std::optional<proto::AssetMetadata> prepare(const proto::Bytes   &bytes,
                                                const std::string    &file_name = "video",
                                                std::optional<double> duration  = std::nullopt);
    std::optional<proto::AssetMetadata> prepare_file(const std::string &path);

    void set_callbacks(BroadcasterCallbacks cb);  // before start()

    bool start();
    void stop();  // idempotent

    bool send_signal(const proto::Bytes &payload);

    // Entry point for transport events (also used by tests)
    void on_event(const transport::Event &ev);

    BroadcastState                      state() const;
    std::optional<proto::AssetMetadata> metadata() const;
    std::uint32_t                       total_chunks() const;
    std::set<proto::PeerId>             known_peers() const;
    BroadcasterStats                    stats() const;
    const std::string                  &local_id() const { return self_; }

  private:
    void handle(const proto::Message &m);
    void send_metadata(const proto::PeerId *to);
    void send_presence();
    void serve_chunk(const proto::PeerId &peer, std::uint32_t index);
    void push_all();
    bool wait_stop(std::chrono::milliseconds d);
    void stop_push();
    void join_push();  // no-op on the push thread itself

    transport::ITransport   &tx_;
    const BroadcasterOptions opts_;
    const std::string        self_;
    Outbox                   out_;
    BroadcasterCallbacks     cb_;

    // written by prepare() only, read-only while broadcasting
    std::vector<proto::Chunk>           chunks_;
    std::optional<proto::AssetMetadata> meta_;

    mutable std::mutex      mu_;
    BroadcastState          state_{BroadcastState::Idle};
    std::set<proto::PeerId> peers_;

    util::PeriodicTask presence_;

    std::thread             push_thr_;
    std::mutex              push_mu_;
    std::condition_variable push_cv_;
    bool                    push_stop_{false};

    std::atomic<std::uint32_t> chunks_sent_{0};
    std::atomic<std::uint32_t> metadata_sent_{0};
    std::atomic<std::uint32_t> invalid_requests_{0};
};

}  // namespace app
