/* ======================================================================
 * Broadcaster (distribution state machine): overall flow
 *
 *  App thread                 Transport thread(s)             Timer / push thread
 *  ----------                 -------------------             -------------------
 *  prepare(bytes)
 *    └─ split into 64 KiB chunks, compute metadata (Idle -> Prepared)
 *  start()
 *    └─ subscribe to transport events (Prepared -> Broadcasting)
 *    └─ presence every presence_interval ─────────────────────▶  Presence{self, name}
 *    └─ push mode only ───────────────────────────────────────▶  Metadata x2, every chunk once
 *                             on_event(ev)
 *                               └─ decode, drop self-originated
 *                               └─ RequestMetadata  -> reply Metadata (always, no dedupe)
 *                               └─ RequestChunk     -> reply Chunk, or drop if out of range
 *                               └─ PeerConnected    -> direct: send Metadata unprompted
 *  stop()
 *    └─ cancel presence + push, then unsubscribe (Broadcasting -> Stopped)
 *
 *  Notes
 *    └─ chunks_ / meta_ are immutable while Broadcasting: handlers read them unlocked
 *    └─ sends never happen under mu_; a failed send is logged and the loop goes on
 * ====================================================================== */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "app/broadcaster.hpp"
#include "util/log.hpp"

namespace app
{

const char *state_name(BroadcastState s)
{
    switch (s)
    {
        case BroadcastState::Idle:
            return "idle";
        case BroadcastState::Prepared:
            return "prepared";
        case BroadcastState::Broadcasting:
            return "broadcasting";
        case BroadcastState::Stopped:
            return "stopped";
    }
    return "?";
}

Broadcaster::Broadcaster(transport::ITransport &t, BroadcasterOptions opts)
    : tx_(t), opts_(std::move(opts)), self_(t.local_id()), out_(t)
{
}

Broadcaster::~Broadcaster()
{
    stop();
    join_push();
    // only when destroyed from a push callback; nothing else can join it
    if (push_thr_.joinable())
        push_thr_.detach();
}

// ======================================================================
// Function: Broadcaster::prepare
// - In: asset bytes, display name, optional duration in seconds
// - Out: metadata, or nullopt when a different asset is already being served
// - Note: deterministic, so repeating it with the same bytes changes nothing
// ======================================================================
std::optional<proto::AssetMetadata> Broadcaster::prepare(const proto::Bytes   &bytes,
                                                         const std::string    &file_name,
                                                         std::optional<double> duration)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == BroadcastState::Broadcasting)
    {
        bool same = meta_ && meta_->file_size == bytes.size();
        for (std::size_t i = 0; same && i < chunks_.size(); i++)
        {
            const auto  &c     = chunks_[i];
            const size_t start = static_cast<size_t>(c.index) * constants::CHUNK_SIZE;
            same = std::equal(c.payload.begin(), c.payload.end(), bytes.begin() + start);
        }
        if (!same)
        {
            LOG_ERROR("prepare: refusing to swap the asset while broadcasting");
            return std::nullopt;
        }
        return meta_;
    }

    auto chunks = proto::split(bytes, constants::CHUNK_SIZE);
    if (chunks.empty() && !bytes.empty())
        return std::nullopt;

    proto::AssetMetadata m;
    m.file_name    = file_name.empty() ? std::string(constants::DEFAULT_FILE_NAME) : file_name;
    m.file_size    = bytes.size();
    m.mime_type    = proto::mime_type_for(m.file_name);
    m.total_chunks = static_cast<std::uint32_t>(chunks.size());
    m.duration     = duration;

    chunks_ = std::move(chunks);
    meta_   = m;
    if (state_ == BroadcastState::Idle)
        state_ = BroadcastState::Prepared;

    LOG_INFO("prepared '%s': %llu bytes, %u chunks (%s)", m.file_name.c_str(),
             (unsigned long long)m.file_size, m.total_chunks, m.mime_type.c_str());
    return m;
}

std::optional<proto::AssetMetadata> Broadcaster::prepare_file(const std::string &path)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        LOG_ERROR("prepare_file: cannot open %s", path.c_str());
        return std::nullopt;
    }
    proto::Bytes bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        LOG_ERROR("prepare_file: read error on %s", path.c_str());
        return std::nullopt;
    }
    return prepare(bytes, std::filesystem::path(path).filename().string());
}

void Broadcaster::set_callbacks(BroadcasterCallbacks cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    cb_ = std::move(cb);
}

// ======================================================================
// Function: Broadcaster::start
// - In: a prepared asset
// - Out: subscribed and announcing presence; push mode also streams the asset
// - Note: calling it while broadcasting is a no-op
// ======================================================================
bool Broadcaster::start()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == BroadcastState::Broadcasting)
            return true;
        if (!meta_)
        {
            LOG_ERROR("start: nothing prepared");
            return false;
        }
    }

    // a push loop stopped from its own callback is still unwinding
    join_push();
    if (push_thr_.joinable())
    {
        LOG_ERROR("start: cannot restart from a push callback");
        return false;
    }

    if (!tx_.start([this](const transport::Event &ev) { on_event(ev); }))
    {
        LOG_ERROR("start: transport %s refused subscription", tx_.name().c_str());
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        state_ = BroadcastState::Broadcasting;
    }
    LOG_INFO("broadcasting '%s' as %s (%s, %s)", meta_->file_name.c_str(),
             chunkcast::short_id(self_).c_str(),
             transport::topology_name(tx_.caps().topology), opts_.push ? "push" : "demand");

    // keeps relay / NAT state alive between requests
    if (opts_.presence_interval.count() > 0)
        presence_.start(opts_.presence_interval, [this] { send_presence(); });

    if (opts_.push)
    {
        {
            std::lock_guard<std::mutex> lk(push_mu_);
            push_stop_ = false;
        }
        push_thr_ = std::thread([this] { push_all(); });
    }
    return true;
}

// ======================================================================
// Function: Broadcaster::stop
// - In: any state
// - Out: Stopped; presence and push cancelled before unsubscribing
// - Note: chunks stay in memory so start() can resume serving
// ======================================================================
void Broadcaster::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != BroadcastState::Broadcasting)
            return;
        state_ = BroadcastState::Stopped;
    }
    presence_.stop();
    stop_push();
    tx_.stop();
    LOG_INFO("broadcast stopped (%u chunks sent)", chunks_sent_.load());
}

void Broadcaster::stop_push()
{
    {
        std::lock_guard<std::mutex> lk(push_mu_);
        push_stop_ = true;
    }
    push_cv_.notify_all();
    // from a callback on the push thread the loop exits on return; joined later by
    // start() or the destructor
    join_push();
}

void Broadcaster::join_push()
{
    if (push_thr_.joinable() && push_thr_.get_id() != std::this_thread::get_id())
        push_thr_.join();
}

bool Broadcaster::wait_stop(std::chrono::milliseconds d)
{
    std::unique_lock<std::mutex> lk(push_mu_);
    return push_cv_.wait_for(lk, d, [this] { return push_stop_; });
}

void Broadcaster::push_all()
{
    // metadata twice: relay delivery is lossy
    send_metadata(nullptr);
    if (wait_stop(constants::METADATA_HEDGE_DELAY))
        return;
    send_metadata(nullptr);

    const std::uint32_t total = meta_->total_chunks;
    for (std::uint32_t i = 0; i < total; i++)
    {
        {
            std::lock_guard<std::mutex> lk(push_mu_);
            if (push_stop_)
                return;
        }
        if (out_.broadcast(proto::ChunkData{self_, i, chunks_[i].payload}))
            chunks_sent_++;

        BroadcasterCallbacks cb;
        {
            std::lock_guard<std::mutex> lk(mu_);
            cb = cb_;
        }
        if (cb.on_progress)
            cb.on_progress(i + 1, total);

        if (opts_.chunk_interval.count() > 0 && wait_stop(opts_.chunk_interval))
            return;
    }
    LOG_INFO("push complete (%u chunks), still serving requests", total);
}

bool Broadcaster::send_signal(const proto::Bytes &payload)
{
    return out_.broadcast(proto::Signal{self_, payload});
}

void Broadcaster::send_presence()
{
    (void)out_.broadcast(proto::Presence{self_, opts_.name});
}

void Broadcaster::send_metadata(const proto::PeerId *to)
{
    proto::Metadata m{self_, *meta_};
    const bool      ok = to ? out_.reply(*to, m) : out_.broadcast(m);
    if (ok)
        metadata_sent_++;
}

void Broadcaster::serve_chunk(const proto::PeerId &peer, std::uint32_t index)
{
    if (index >= chunks_.size())
    {
        invalid_requests_++;
        LOG_DEBUG("dropping request for chunk %u from %s (total %zu)", index,
                  chunkcast::short_id(peer).c_str(), chunks_.size());
        return;
    }

    BroadcasterCallbacks cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = cb_;
    }
    if (cb.on_peer_request)
        cb.on_peer_request(peer, index);

    LOG_DEBUG("sending chunk %u to %s", index, chunkcast::short_id(peer).c_str());
    if (out_.reply(peer, proto::ChunkData{self_, index, chunks_[index].payload}))
        chunks_sent_++;
}

void Broadcaster::on_event(const transport::Event &ev)
{
    auto msg = to_message(ev);
    if (!msg)
        return;  // not ours

    if (auto from = proto::origin(*msg); from && *from == self_)
    {
        LOG_DEBUG("ignoring own %s", proto::type_name(*msg));
        return;
    }
    handle(*msg);
}

void Broadcaster::handle(const proto::Message &m)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != BroadcastState::Broadcasting)
            return;
        if (auto from = proto::origin(m))
            peers_.insert(*from);
    }

    std::visit(proto::overloaded{
                   [this](const proto::RequestMetadata &r) {
                       LOG_INFO("metadata request from %s", chunkcast::short_id(r.from).c_str());
                       send_metadata(&r.from);
                   },
                   [this](const proto::RequestChunk &r) { serve_chunk(r.from, r.index); },
                   [](const proto::Metadata &r) {
                       LOG_DEBUG("ignoring metadata from another broadcaster %s",
                                 chunkcast::short_id(r.from).c_str());
                   },
                   [](const proto::ChunkData &) {},
                   [](const proto::Presence &r) {
                       LOG_DEBUG("presence from %s '%s'", chunkcast::short_id(r.from).c_str(),
                                 r.name.c_str());
                   },
                   [this](const proto::Signal &r) {
                       BroadcasterCallbacks cb;
                       {
                           std::lock_guard<std::mutex> lk(mu_);
                           cb = cb_;
                       }
                       if (cb.on_signal)
                           cb.on_signal(r.from, r.payload);
                   },
                   [](const proto::HaveChunks &r) {
                       LOG_DEBUG("%s holds %zu chunks", chunkcast::short_id(r.from).c_str(),
                                 r.indices.size());
                   },
                   [this](const proto::PeerUp &r) {
                       BroadcasterCallbacks cb;
                       {
                           std::lock_guard<std::mutex> lk(mu_);
                           peers_.insert(r.id);
                           cb = cb_;
                       }
                       if (!tx_.caps().lifecycle_events)
                           return;  // relay neighbour, not a session peer
                       LOG_INFO("peer connected: %s", chunkcast::short_id(r.id).c_str());
                       if (cb.on_peer_connected)
                           cb.on_peer_connected(r.id);
                       send_metadata(&r.id);
                   },
                   [this](const proto::PeerDown &r) {
                       std::lock_guard<std::mutex> lk(mu_);
                       peers_.erase(r.id);
                       LOG_INFO("peer gone: %s", chunkcast::short_id(r.id).c_str());
                   },
                   [](const proto::Error &r) {
                       LOG_WARN("transport error: %s", r.message.c_str());
                   },
               },
               m);
}

BroadcastState Broadcaster::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::optional<proto::AssetMetadata> Broadcaster::metadata() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return meta_;
}

std::uint32_t Broadcaster::total_chunks() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return meta_ ? meta_->total_chunks : 0;
}

std::set<proto::PeerId> Broadcaster::known_peers() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peers_;
}

BroadcasterStats Broadcaster::stats() const
{
    BroadcasterStats s;
    s.chunks_sent      = chunks_sent_.load();
    s.metadata_sent    = metadata_sent_.load();
    s.invalid_requests = invalid_requests_.load();
    s.send_failures    = out_.failures();
    return s;
}

}  // namespace app
