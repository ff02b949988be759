#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "core/timer_host.hpp"

namespace core {

// Single worker thread that runs posted tasks and timers one at a time, in order.
// Design: posting never blocks. Tasks posted before stop() still run; timers that
//         have not fired by then are dropped.
class EventLoop : public ITimerHost {
public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // True when called from inside a task on this loop
    bool is_loop_thread() const;

    // Queue a task behind everything already posted. Returns false once stopped.
    bool post(std::function<void()> task);

    TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

    size_t pending_tasks() const;
    size_t pending_timers() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        TimerId id;
        std::function<void()> task;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::multimap<Clock::time_point, Timer> timers_;  // ordered by due time
    TimerId next_timer_id_ = 1;
    bool stopping_ = false;

    std::unique_ptr<std::thread> thread_;
    std::thread::id thread_id_;
    std::atomic<bool> running_{false};
};

} // namespace core
