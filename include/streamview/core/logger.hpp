#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <memory>
#include <vector>

namespace streamview::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level);

// Parses "debug", "info", "warn"/"warning" and "error" (case-insensitive)
bool parseLogLevel(std::string_view text, LogLevel& level);

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string_view message;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
};

// Writes "[timestamp] [LEVEL] message" lines to std::cout
class ConsoleSink : public ILogSink {
public:
    void write(const LogMessage& msg) override;
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void addSink(std::shared_ptr<ILogSink> sink);
    static void removeSink(const std::shared_ptr<ILogSink>& sink);
    // Drops every sink and reinstalls the console sink
    static void resetSinks();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < getLevel()) return;
        write(level, formatString(format, std::forward<Args>(args)...));
    }

    // Emits an already formatted message, subject to the level filter
    static void write(LogLevel level, const std::string& message);

    static std::string timestamp();

    // Simple "{}" placeholder replacement, one argument per placeholder
    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string partial = format;
            partial.replace(pos, 2, oss.str());
            // Continue after the substituted text so values containing "{}" are left alone
            size_t resume = pos + oss.str().size();
            return partial.substr(0, resume) +
                   formatString(partial.substr(resume), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }

private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static std::vector<std::shared_ptr<ILogSink>> sinks_;
};

} // namespace streamview::core
