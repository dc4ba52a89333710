#include <streamview/core/uv_scheduler.hpp>
#include <streamview/core/error.hpp>
#include <streamview/core/logger.hpp>

namespace streamview::core {

UvScheduler::UvScheduler() {
    int result = uv_loop_init(&loop_);
    if (result != 0) {
        throw_error(ErrorCode::Unknown, std::string("Failed to initialize event loop: ") + uv_strerror(result));
    }

    result = uv_async_init(&loop_, &async_, &UvScheduler::onAsync);
    if (result != 0) {
        uv_loop_close(&loop_);
        throw_error(ErrorCode::Unknown, std::string("Failed to initialize async handle: ") + uv_strerror(result));
    }
    async_.data = this;
    // Posting must not keep an otherwise idle loop running
    uv_unref(reinterpret_cast<uv_handle_t*>(&async_));
}

UvScheduler::~UvScheduler() {
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        closed_ = true;
        posted_.clear();
    }

    for (auto& [id, entry] : timers_) {
        closeTimer(entry);
    }
    timers_.clear();

    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);

    // Anything still open at this point belongs to clients that outlived the loop
    uv_walk(&loop_, [](uv_handle_t* handle, void*) {
        if (!uv_is_closing(handle)) {
            uv_close(handle, nullptr);
        }
    }, nullptr);

    uv_run(&loop_, UV_RUN_DEFAULT);
    int result = uv_loop_close(&loop_);
    if (result != 0) {
        Logger::warn("Event loop closed with pending handles: {}", uv_strerror(result));
    }
}

TimerId UvScheduler::schedule(std::chrono::milliseconds delay, Callback callback) {
    auto* entry = new TimerEntry{};
    entry->owner = this;
    entry->id = next_id_++;
    entry->callback = std::move(callback);

    uv_timer_init(&loop_, &entry->handle);
    entry->handle.data = entry;

    auto timeout = delay.count() < 0 ? 0 : static_cast<uint64_t>(delay.count());
    int result = uv_timer_start(&entry->handle, &UvScheduler::onTimer, timeout, 0);
    if (result != 0) {
        closeTimer(entry);
        throw_error(ErrorCode::Unknown, std::string("Failed to start timer: ") + uv_strerror(result));
    }

    timers_[entry->id] = entry;
    return entry->id;
}

void UvScheduler::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    TimerEntry* entry = it->second;
    timers_.erase(it);
    closeTimer(entry);
}

void UvScheduler::post(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        if (closed_) return;
        posted_.push_back(std::move(callback));
    }
    uv_async_send(&async_);
}

std::chrono::milliseconds UvScheduler::now() const {
    return std::chrono::milliseconds(uv_now(&loop_));
}

int UvScheduler::run() {
    // Work posted before the loop started has no pending async wakeup
    drainPosted();
    return uv_run(&loop_, UV_RUN_DEFAULT);
}

void UvScheduler::stop() {
    uv_stop(&loop_);
}

void UvScheduler::onTimer(uv_timer_t* handle) {
    auto* entry = static_cast<TimerEntry*>(handle->data);
    UvScheduler* owner = entry->owner;

    Callback callback = std::move(entry->callback);
    owner->timers_.erase(entry->id);
    closeTimer(entry);

    if (callback) {
        callback();
    }
}

void UvScheduler::onAsync(uv_async_t* handle) {
    static_cast<UvScheduler*>(handle->data)->drainPosted();
}

void UvScheduler::closeTimer(TimerEntry* entry) {
    uv_timer_stop(&entry->handle);
    uv_close(reinterpret_cast<uv_handle_t*>(&entry->handle), [](uv_handle_t* handle) {
        delete static_cast<TimerEntry*>(handle->data);
    });
}

void UvScheduler::drainPosted() {
    std::deque<Callback> pending;
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        pending.swap(posted_);
    }
    for (auto& callback : pending) {
        if (callback) {
            callback();
        }
    }
}

} // namespace streamview::core
