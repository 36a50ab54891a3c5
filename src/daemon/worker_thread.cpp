#include "worker_thread.hpp"

#include <algorithm>
#include <exception>
#include <print>

WorkerThread::WorkerThread()
    : thread_([this](std::stop_token stop) { run(stop); }) {}

WorkerThread::~WorkerThread() {
    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void WorkerThread::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

Executor::TimerId WorkerThread::post_after(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard lock(mutex_);
        id = next_timer_++;
        timers_.emplace(id, std::make_pair(std::chrono::steady_clock::now() + delay, std::move(task)));
        timers_changed_ = true;
    }
    cv_.notify_one();
    return id;
}

void WorkerThread::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    timers_.erase(id);
}

void WorkerThread::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (true) {
        timers_changed_ = false;

        // Promote due timers to the run queue.
        auto now = std::chrono::steady_clock::now();
        auto next_due = TimePoint::max();
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->second.first <= now) {
                tasks_.push_back(std::move(it->second.second));
                it = timers_.erase(it);
            } else {
                next_due = std::min(next_due, it->second.first);
                ++it;
            }
        }

        if (tasks_.empty()) {
            if (stop.stop_requested()) break;
            auto wake = [&] { return !tasks_.empty() || timers_changed_; };
            if (next_due == TimePoint::max()) {
                cv_.wait(lock, stop, wake);
            } else {
                cv_.wait_until(lock, stop, next_due, wake);
            }
            continue;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::println(stderr, "worker: task failed: {}", e.what());
        }
        lock.lock();
    }
}
