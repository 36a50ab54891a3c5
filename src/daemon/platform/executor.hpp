#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Runs tasks on one thread of control. post() may be called from any thread.
class Executor {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~Executor() = default;
    virtual void post(Task task) = 0;
    virtual TimerId post_after(std::chrono::milliseconds delay, Task task) = 0;
    // No-op if the timer already ran or was cancelled.
    virtual void cancel(TimerId id) = 0;
};
