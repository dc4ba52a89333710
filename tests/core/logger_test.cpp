#include <gtest/gtest.h>
#include <streamview/core/logger.hpp>

#include <thread>

namespace streamview::core::test {

// Sink that keeps messages in memory for inspection
class TestSink : public ILogSink {
public:
    void write(const LogMessage& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::string(msg.message));
        levels_.push_back(msg.level);
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<LogLevel> levels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return levels_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::vector<LogLevel> levels_;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = Logger::getLevel();
        Logger::setLevel(LogLevel::DEBUG);
        sink_ = std::make_shared<TestSink>();
        Logger::addSink(sink_);
    }

    void TearDown() override {
        Logger::removeSink(sink_);
        Logger::setLevel(previous_level_);
    }

    std::shared_ptr<TestSink> sink_;
    LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, BasicLogging) {
    Logger::info("Test message");
    ASSERT_EQ(sink_->messages().size(), 1u);
    EXPECT_EQ(sink_->messages()[0], "Test message");
    EXPECT_EQ(sink_->levels()[0], LogLevel::INFO);
}

TEST_F(LoggerTest, LogLevels) {
    Logger::setLevel(LogLevel::WARN);

    Logger::debug("Debug message");
    Logger::info("Info message");
    Logger::warn("Warning message");
    Logger::error("Error message");

    auto messages = sink_->messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "Warning message");
    EXPECT_EQ(messages[1], "Error message");
}

TEST_F(LoggerTest, FormatString) {
    Logger::info("Value: {}, String: {}", 42, "test");
    ASSERT_EQ(sink_->messages().size(), 1u);
    EXPECT_EQ(sink_->messages()[0], "Value: 42, String: test");
}

TEST_F(LoggerTest, FormatLeavesSubstitutedBracesAlone) {
    EXPECT_EQ(Logger::formatString("{} and {}", "{}", 7), "{} and 7");
    EXPECT_EQ(Logger::formatString("no placeholders", 1), "no placeholders");
}

TEST_F(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::WARN);
}

TEST_F(LoggerTest, ThreadSafety) {
    constexpr int numThreads = 8;
    constexpr int messagesPerThread = 50;
    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                Logger::debug("Thread {} Message {}", i, j);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(sink_->messages().size(), static_cast<size_t>(numThreads * messagesPerThread));
}

} // namespace streamview::core::test
