#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace streamview::core {

using TimerId = std::uint64_t;

// Single-threaded cooperative task queue. Every callback runs on the
// scheduler's thread and never overlaps another one.
class Scheduler {
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    // Runs callback once after delay. Returned id is never 0.
    virtual TimerId schedule(std::chrono::milliseconds delay, Callback callback) = 0;

    // Unknown or already fired ids are ignored
    virtual void cancel(TimerId id) = 0;

    // Queues callback to run as soon as possible. Safe to call from any thread.
    virtual void post(Callback callback) = 0;

    // Monotonic milliseconds
    virtual std::chrono::milliseconds now() const = 0;
};

} // namespace streamview::core
