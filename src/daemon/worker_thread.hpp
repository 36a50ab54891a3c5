#pragma once

#include "platform/executor.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

// Background executor: one thread draining a FIFO of tasks. Delayed tasks run
// on the same thread once due. Destruction runs what is already queued and joins.
class WorkerThread : public Executor {
public:
    WorkerThread();
    ~WorkerThread() override;

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    void post(Task task) override;
    TimerId post_after(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    void run(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, std::pair<TimePoint, Task>> timers_;
    TimerId next_timer_ = 1;
    bool timers_changed_ = false;
    std::jthread thread_;
};
