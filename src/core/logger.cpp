#include "streamview/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace streamview::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;
std::vector<std::shared_ptr<ILogSink>> Logger::sinks_ = {std::make_shared<ConsoleSink>()};

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

bool parseLogLevel(std::string_view text, LogLevel& level) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") level = LogLevel::DEBUG;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") level = LogLevel::WARN;
    else if (lower == "error") level = LogLevel::ERROR;
    else return false;
    return true;
}

void ConsoleSink::write(const LogMessage& msg) {
    std::cout << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
              << msg.message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::resetSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < current_level_) return;

    LogMessage msg{level, timestamp(), message};
    for (const auto& sink : sinks_) {
        sink->write(msg);
    }
}

} // namespace streamview::core
