#include <utility>

#include "util/log.hpp"
#include "util/periodic.hpp"

namespace util
{

bool PeriodicTask::start(std::chrono::milliseconds interval, std::function<void()> fn,
                         bool fire_now)
{
    if (interval.count() <= 0 || !fn)
    {
        LOG_ERROR("invalid interval (%lld ms) or empty callback", (long long)interval.count());
        return false;
    }
    if (on_worker())
    {
        LOG_ERROR("cannot restart a periodic task from its own callback");
        return false;
    }

    std::lock_guard<std::mutex> ctl(ctl_mu_);
    // restart semantics: make sure any previous worker is gone
    halt_locked();

    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_req_ = false;
        fn_       = std::move(fn);
    }
    running_.store(true);
    thr_ = std::thread([this, interval, fire_now] { loop(interval, fire_now); });
    worker_.store(thr_.get_id());
    return true;
}

PeriodicTask::~PeriodicTask()
{
    stop();
    // only reachable when destroyed from inside the callback
    std::lock_guard<std::mutex> ctl(ctl_mu_);
    if (thr_.joinable())
        thr_.detach();
}

void PeriodicTask::stop()
{
    // called from our own callback: cannot join ourselves, the loop exits on return
    if (on_worker())
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_req_ = true;
        }
        running_.store(false);
        return;
    }
    std::lock_guard<std::mutex> ctl(ctl_mu_);
    halt_locked();
}

void PeriodicTask::halt_locked()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_req_ = true;
    }
    cv_.notify_all();
    running_.store(false);

    if (!thr_.joinable())
        return;
    // the worker may not have published its id yet when its first callback stops it
    if (thr_.get_id() == std::this_thread::get_id())
        return;
    thr_.join();
    worker_.store(std::thread::id{});
}

void PeriodicTask::loop(std::chrono::milliseconds interval, bool fire_now)
{
    bool first = fire_now;
    while (true)
    {
        if (!first)
        {
            std::unique_lock<std::mutex> lk(mu_);
            if (cv_.wait_for(lk, interval, [this] { return stop_req_; }))
                break;
        }
        first = false;

        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_req_)
                break;
            fn = fn_;
        }
        fn();
    }
    running_.store(false);
}

}  // namespace util
