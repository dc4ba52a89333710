#include "streamview/core/log_history.hpp"

#include <utility>

namespace streamview::core {

LogHistory::LogHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void LogHistory::append(LogLevel level, std::string message) {
    Logger::write(level, message);

    entries_.push_back(LogEntry{level, Logger::timestamp(), std::move(message)});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

} // namespace streamview::core
