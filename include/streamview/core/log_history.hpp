#pragma once

#include <cstddef>
#include <deque>
#include <string>

#include <streamview/core/logger.hpp>

namespace streamview::core {

struct LogEntry {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

// Bounded, ordered record of the most recent log lines of one viewer.
// Every entry is also forwarded to Logger.
class LogHistory {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit LogHistory(size_t capacity = kDefaultCapacity);

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        append(LogLevel::DEBUG, Logger::formatString(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        append(LogLevel::INFO, Logger::formatString(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        append(LogLevel::WARN, Logger::formatString(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        append(LogLevel::ERROR, Logger::formatString(format, std::forward<Args>(args)...));
    }

    void append(LogLevel level, std::string message);

    const std::deque<LogEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { entries_.clear(); }

private:
    size_t capacity_;
    std::deque<LogEntry> entries_;
};

} // namespace streamview::core
