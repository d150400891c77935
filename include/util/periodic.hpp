#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace util
{

// Runs a callback on its own thread every `interval` until stopped.
// stop() is idempotent and may be called from inside the callback; in that case the
// loop exits after the callback returns and the thread is joined by the next stop(),
// start() or the destructor. start() and stop() may race from different threads.
class PeriodicTask
{
  public:
    PeriodicTask() = default;
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask &)            = delete;
    PeriodicTask &operator=(const PeriodicTask &) = delete;

    // Fires the first callback after one interval, unless `fire_now` is set.
    bool start(std::chrono::milliseconds interval, std::function<void()> fn,
               bool fire_now = false);
    void stop();
    bool running() const { return running_.load(); }

  private:
    void loop(std::chrono::milliseconds interval, bool fire_now);
    bool on_worker() const { return worker_.load() == std::this_thread::get_id(); }
    void halt_locked();  // ctl_mu_ held

    std::mutex                   ctl_mu_;  // guards thr_
    std::thread                  thr_;
    std::atomic<std::thread::id> worker_{};
    std::function<void()>        fn_;
    std::mutex                   mu_;
    std::condition_variable      cv_;
    std::atomic_bool             running_{false};
    bool                         stop_req_{false};
};

}  // namespace util
