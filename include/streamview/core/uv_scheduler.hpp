#pragma once

#include <deque>
#include <mutex>
#include <unordered_map>

#include <uv.h>

#include <streamview/core/scheduler.hpp>

namespace streamview::core {

// Scheduler on top of a libuv loop. Timers map to uv_timer_t handles, post()
// goes through a uv_async_t so other threads can hand work to the loop.
class UvScheduler : public Scheduler {
public:
    UvScheduler();
    ~UvScheduler() override;

    UvScheduler(const UvScheduler&) = delete;
    UvScheduler& operator=(const UvScheduler&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback callback) override;
    void cancel(TimerId id) override;
    void post(Callback callback) override;
    std::chrono::milliseconds now() const override;

    // Runs the loop until stop() is called or no work is left
    int run();
    void stop();

    uv_loop_t* loop() { return &loop_; }

private:
    struct TimerEntry {
        uv_timer_t handle;
        UvScheduler* owner;
        TimerId id;
        Callback callback;
    };

    static void onTimer(uv_timer_t* handle);
    static void onAsync(uv_async_t* handle);
    static void closeTimer(TimerEntry* entry);
    void drainPosted();

    uv_loop_t loop_;
    uv_async_t async_;
    bool closed_ = false;

    TimerId next_id_ = 1;
    std::unordered_map<TimerId, TimerEntry*> timers_;

    std::mutex posted_mutex_;
    std::deque<Callback> posted_;
};

} // namespace streamview::core
