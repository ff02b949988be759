#include "core/event_loop.hpp"
#include "core/logging.hpp"

#include <exception>

namespace core {

EventLoop::~EventLoop() {
    stop();
}

bool EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_) {
        return running_.load();
    }
    stopping_ = false;
    running_.store(true);
    thread_ = std::make_unique<std::thread>(&EventLoop::run, this);
    thread_id_ = thread_->get_id();
    return true;
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_) {
            return;
        }
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();

    if (is_loop_thread()) {
        // Cannot join ourselves; the destructor (or a later stop() from
        // another thread) finishes the shutdown.
        return;
    }

    if (thread_->joinable()) {
        thread_->join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    thread_.reset();
    thread_id_ = std::thread::id();
    running_.store(false);
}

bool EventLoop::is_loop_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_ && std::this_thread::get_id() == thread_id_;
}

bool EventLoop::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || !thread_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, std::function<void()> task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        if (stopping_) {
            return id;  // never fires
        }
        timers_.emplace(Clock::now() + delay, Timer{id, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.id == id) {
            timers_.erase(it);
            return;
        }
    }
}

size_t EventLoop::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        std::function<void()> task;

        if (!tasks_.empty()) {
            task = std::move(tasks_.front());
            tasks_.pop_front();
        } else if (stopping_) {
            break;
        } else if (!timers_.empty() && timers_.begin()->first <= Clock::now()) {
            task = std::move(timers_.begin()->second.task);
            timers_.erase(timers_.begin());
        } else if (!timers_.empty()) {
            cv_.wait_until(lock, timers_.begin()->first);
            continue;
        } else {
            cv_.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            log_error(std::string("Event loop task threw: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace core
