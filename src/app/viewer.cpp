#include <utility>

#include "app/viewer.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

const char *state_name(ViewState s)
{
    switch (s)
    {
        case ViewState::Idle:
            return "idle";
        case ViewState::AwaitingMetadata:
            return "awaiting-metadata";
        case ViewState::Downloading:
            return "downloading";
        case ViewState::Complete:
            return "complete";
        case ViewState::Failed:
            return "failed";
    }
    return "?";
}

Viewer::Viewer(transport::ITransport &t, ViewerOptions opts)
    : tx_(t), opts_(std::move(opts)), self_(t.local_id()), out_(t)
{
}

Viewer::~Viewer()
{
    destroy();
}

void Viewer::set_callbacks(ViewerCallbacks cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    cb_ = std::move(cb);
}

ViewerCallbacks Viewer::callbacks() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return cb_;
}

bool Viewer::listen()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (listening_)
            return true;
    }
    if (!tx_.start([this](const transport::Event &ev) { on_event(ev); }))
    {
        LOG_ERROR("listen: transport %s refused subscription", tx_.name().c_str());
        return false;
    }
    std::lock_guard<std::mutex> lk(mu_);
    listening_ = true;
    closing_   = false;
    if (state_ == ViewState::Idle)
        state_ = ViewState::AwaitingMetadata;
    LOG_INFO("viewer %s listening (%s)", chunkcast::short_id(self_).c_str(),
             transport::topology_name(tx_.caps().topology));
    return true;
}

bool Viewer::start()
{
    if (!listen())
        return false;
    if (!opts_.wait_for_connect)
        request_metadata();
    return true;
}

void Viewer::request_metadata()
{
    if (meta_timer_.running())
        return;  // retries already scheduled
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closing_ || meta_ || state_ != ViewState::AwaitingMetadata)
            return;
        attempts_ = 0;
    }

    metadata_tick();

    if (opts_.metadata_attempts <= 1 || opts_.metadata_interval.count() <= 0)
        return;
    {
        // answered synchronously
        std::lock_guard<std::mutex> lk(mu_);
        if (closing_ || meta_ || state_ != ViewState::AwaitingMetadata)
            return;
    }
    meta_timer_.start(opts_.metadata_interval, [this] { metadata_tick(); });
}

// Bounded retry: stops as soon as metadata is accepted, even between attempts
void Viewer::metadata_tick()
{
    bool          done      = false;
    bool          exhausted = false;
    std::uint32_t attempt   = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (meta_ || state_ != ViewState::AwaitingMetadata)
            done = true;
        else if (attempts_ >= opts_.metadata_attempts)
            exhausted = true;
        else
            attempt = ++attempts_;
    }
    if (done || exhausted)
    {
        meta_timer_.stop();
        if (exhausted)
            LOG_WARN("no metadata after %u attempts, waiting for an announcement",
                     opts_.metadata_attempts);
        return;
    }

    metadata_requests_++;
    LOG_DEBUG("metadata request %u/%u", attempt, opts_.metadata_attempts);
    (void)out_.broadcast(proto::RequestMetadata{self_});
}

// ======================================================================
// Function: Viewer::tick
// - In: current received / pending sets
// - Out: up to (window - outstanding) new RequestChunk, lowest index first
// - Note: nothing to issue while requests are outstanding means they are stale:
//         pending is cleared and the next tick asks again
// ======================================================================
void Viewer::tick()
{
    std::vector<std::uint32_t> issue;
    proto::PeerId              target;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != ViewState::Downloading || !meta_)
            return;
        const std::uint32_t total = meta_->total_chunks;
        if (received_.size() >= total)
            return;  // assembling

        std::size_t slots =
            pending_.size() < opts_.request_window ? opts_.request_window - pending_.size() : 0;
        for (std::uint32_t i = 0; i < total && slots > 0; i++)
        {
            if (received_.count(i) || pending_.count(i))
                continue;
            issue.push_back(i);
            pending_.insert(i);
            slots--;
        }

        if (issue.empty() && !pending_.empty())
        {
            LOG_DEBUG("no progress, %zu pending requests considered lost", pending_.size());
            pending_.clear();
            stale_resets_++;
            return;
        }
        target = source_;
    }

    for (auto index : issue)
    {
        if (out_.reply(target, proto::RequestChunk{self_, index}))
            requests_sent_++;
    }
}

void Viewer::on_event(const transport::Event &ev)
{
    auto msg = to_message(ev);
    if (!msg)
        return;

    if (auto from = proto::origin(*msg); from && *from == self_)
        return;  // relay echo of our own send
    handle(*msg);
}

void Viewer::handle(const proto::Message &m)
{
    std::visit(proto::overloaded{
                   [this](const proto::Metadata &r) { on_metadata(r); },
                   [this](const proto::ChunkData &r) { on_chunk(r); },
                   [this](const proto::RequestChunk &r) { on_peer_request(r); },
                   [](const proto::RequestMetadata &) {},
                   [](const proto::Presence &r) {
                       LOG_DEBUG("presence from %s '%s'", chunkcast::short_id(r.from).c_str(),
                                 r.name.c_str());
                   },
                   [this](const proto::Signal &r) {
                       auto cb = callbacks();
                       if (cb.on_signal)
                           cb.on_signal(r.from, r.payload);
                   },
                   [this](const proto::HaveChunks &r) {
                       std::lock_guard<std::mutex> lk(mu_);
                       availability_[r.from] =
                           std::set<std::uint32_t>(r.indices.begin(), r.indices.end());
                   },
                   [this](const proto::PeerUp &r) { on_peer_up(r.id); },
                   [this](const proto::PeerDown &r) { on_peer_down(r.id); },
                   [](const proto::Error &r) {
                       LOG_WARN("transport error: %s", r.message.c_str());
                   },
               },
               m);
}

void Viewer::on_metadata(const proto::Metadata &m)
{
    ViewerCallbacks cb;
    bool            empty = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (meta_)
        {
            LOG_DEBUG("metadata from %s ignored, already have '%s'",
                      chunkcast::short_id(m.from).c_str(), meta_->file_name.c_str());
            return;
        }
        if (closing_ || state_ != ViewState::AwaitingMetadata)
            return;
        if (!consistent(m.meta))
        {
            LOG_WARN("rejecting metadata from %s: %u chunks for %llu bytes",
                     chunkcast::short_id(m.from).c_str(), m.meta.total_chunks,
                     (unsigned long long)m.meta.file_size);
            return;
        }

        meta_   = m.meta;
        source_ = m.from;
        state_  = ViewState::Downloading;
        empty   = m.meta.total_chunks == 0;
        cb      = cb_;
        LOG_INFO("metadata from %s: '%s' %llu bytes, %u chunks", chunkcast::short_id(m.from).c_str(),
                 m.meta.file_name.c_str(), (unsigned long long)m.meta.file_size,
                 m.meta.total_chunks);
    }

    meta_timer_.stop();
    if (cb.on_metadata)
        cb.on_metadata(m.meta);

    if (empty)
    {
        finish();
        return;
    }
    if (opts_.request_interval.count() <= 0)
        return;
    {
        // destroy() may have stopped the timers while the callback ran
        std::lock_guard<std::mutex> lk(mu_);
        if (closing_ || state_ != ViewState::Downloading)
            return;
    }
    req_timer_.start(opts_.request_interval, [this] { tick(); }, true);
}

// chunk_count() is 0 for both an empty and an oversize asset
bool Viewer::consistent(const proto::AssetMetadata &a)
{
    if (a.file_size > constants::MAX_ASSET_SIZE)
        return false;
    if (a.file_size > 0 && a.total_chunks == 0)
        return false;
    return a.total_chunks == proto::chunk_count(a.file_size);
}

bool Viewer::expected_size(std::uint32_t index, std::size_t size) const
{
    const std::uint32_t last = meta_->total_chunks - 1;
    if (index < last)
        return size == constants::CHUNK_SIZE;
    return size == meta_->file_size - static_cast<std::uint64_t>(last) * constants::CHUNK_SIZE;
}

void Viewer::on_chunk(const proto::ChunkData &c)
{
    ViewerCallbacks            cb;
    std::uint32_t              count = 0;
    std::uint32_t              total = 0;
    std::vector<std::uint32_t> have;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != ViewState::Downloading || !meta_)
        {
            LOG_DEBUG("chunk %u dropped in state %s", c.index, state_name(state_));
            return;
        }
        total = meta_->total_chunks;
        if (c.index >= total || !expected_size(c.index, c.payload.size()))
        {
            LOG_DEBUG("chunk %u (%zu bytes) from %s does not fit the asset", c.index,
                      c.payload.size(), chunkcast::short_id(c.from).c_str());
            return;
        }
        if (received_.count(c.index))
        {
            duplicates_++;
            return;
        }

        buffer_[c.index] = c.payload;
        received_.insert(c.index);
        pending_.erase(c.index);
        count = static_cast<std::uint32_t>(received_.size());
        if (count == total)
            pending_.clear();
        if (opts_.announce_chunks && count % constants::HAVE_CHUNKS_EVERY == 0)
            have.assign(received_.begin(), received_.end());
        cb = cb_;
    }

    LOG_DEBUG("chunk %u/%u from %s", c.index, total, chunkcast::short_id(c.from).c_str());
    if (cb.on_progress)
        cb.on_progress(count, total);
    if (!have.empty())
        (void)out_.broadcast(proto::HaveChunks{self_, std::move(have)});

    if (count == total)
        finish();
}

// Runs once, after the last chunk (or at metadata time for an empty asset)
void Viewer::finish()
{
    req_timer_.stop();

    ViewerCallbacks             cb;
    proto::AssembleResult       result;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != ViewState::Downloading || !meta_)
            return;
        result = proto::assemble(meta_->total_chunks, buffer_);
        if (std::holds_alternative<proto::Bytes>(result))
        {
            state_ = ViewState::Complete;
            if (!opts_.serve_peers)
                buffer_.clear();
        }
        else
        {
            state_ = ViewState::Failed;
        }
        cb = cb_;
    }

    if (auto *bytes = std::get_if<proto::Bytes>(&result))
    {
        LOG_INFO("download complete: %zu bytes", bytes->size());
        if (cb.on_complete)
            cb.on_complete(*bytes);
        return;
    }

    const auto  gap = std::get<proto::MissingChunk>(result).index;
    std::string err = "missing chunk " + std::to_string(gap);
    LOG_ERROR("assembly failed: %s", err.c_str());
    if (cb.on_error)
        cb.on_error(err);
}

// Another viewer asking for a chunk we already hold
void Viewer::on_peer_request(const proto::RequestChunk &r)
{
    if (!opts_.serve_peers)
        return;
    proto::Bytes payload;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = buffer_.find(r.index);
        if (it == buffer_.end())
            return;
        payload = it->second;
    }
    LOG_DEBUG("serving chunk %u to peer %s", r.index, chunkcast::short_id(r.from).c_str());
    (void)out_.reply(r.from, proto::ChunkData{self_, r.index, std::move(payload)});
}

void Viewer::on_peer_up(const proto::PeerId &id)
{
    if (!tx_.caps().lifecycle_events)
        return;  // relay neighbour, says nothing about the broadcaster

    ViewerCallbacks cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        connected_.insert(id);
        cb = cb_;
    }
    LOG_INFO("connected to %s", chunkcast::short_id(id).c_str());
    if (cb.on_connected)
        cb.on_connected(id);
    if (opts_.wait_for_connect)
        request_metadata();
}

void Viewer::on_peer_down(const proto::PeerId &id)
{
    ViewerCallbacks cb;
    bool            source = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        availability_.erase(id);
        if (!connected_.erase(id))
            return;
        source = id == source_;
        cb     = cb_;
    }
    if (source)
        LOG_WARN("broadcaster %s disconnected", chunkcast::short_id(id).c_str());
    else
        LOG_INFO("disconnected from %s", chunkcast::short_id(id).c_str());
    if (cb.on_disconnected)
        cb.on_disconnected(id);
}

// ======================================================================
// Function: Viewer::destroy
// - Note: timers first, then unsubscribe, then drop state; a tick can never
//         observe a half-cleared session
// - Note: a handler still running on a transport thread sees closing_ and
//         starts no timer; the second stop covers one that got past the check
// ======================================================================
void Viewer::destroy()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        closing_ = true;
    }
    meta_timer_.stop();
    req_timer_.stop();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!listening_ && state_ == ViewState::Idle)
            return;
        listening_ = false;
    }
    tx_.stop();  // waits for in-flight handlers
    meta_timer_.stop();
    req_timer_.stop();

    std::lock_guard<std::mutex> lk(mu_);
    state_ = ViewState::Idle;
    meta_.reset();
    source_.clear();
    buffer_.clear();
    received_.clear();
    pending_.clear();
    connected_.clear();
    availability_.clear();
    attempts_ = 0;
    LOG_DEBUG("viewer %s destroyed", chunkcast::short_id(self_).c_str());
}

ViewState Viewer::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::optional<proto::AssetMetadata> Viewer::metadata() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return meta_;
}

std::size_t Viewer::received_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return received_.size();
}

std::size_t Viewer::pending_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

std::set<std::uint32_t> Viewer::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_;
}

double Viewer::progress() const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!meta_)
        return 0.0;
    if (meta_->total_chunks == 0)
        return state_ == ViewState::Complete ? 1.0 : 0.0;
    return static_cast<double>(received_.size()) / meta_->total_chunks;
}

bool Viewer::is_complete() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_ == ViewState::Complete;
}

bool Viewer::is_connected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (tx_.caps().lifecycle_events)
        return !connected_.empty();
    return listening_;
}

bool Viewer::requesting() const
{
    return req_timer_.running();
}

std::map<proto::PeerId, std::set<std::uint32_t>> Viewer::peer_availability() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return availability_;
}

ViewerStats Viewer::stats() const
{
    ViewerStats s;
    s.requests_sent     = requests_sent_.load();
    s.duplicates        = duplicates_.load();
    s.stale_resets      = stale_resets_.load();
    s.metadata_requests = metadata_requests_.load();
    s.send_failures     = out_.failures();
    return s;
}

}  // namespace app
