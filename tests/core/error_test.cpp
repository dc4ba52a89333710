#include <gtest/gtest.h>
#include <streamview/core/error.hpp>

#include <memory>

namespace streamview::core::test {

TEST(ErrorTest, BasicErrorCode) {
    std::error_code ec = make_error_code(ErrorCode::InvalidArgument);
    EXPECT_EQ(ec.message(), "Invalid argument");
    EXPECT_STREQ(ec.category().name(), "streamview");
}

TEST(ErrorTest, ErrorConditionMapping) {
    EXPECT_TRUE(make_error_code(ErrorCode::FileNotFound) == std::errc::no_such_file_or_directory);
    EXPECT_TRUE(make_error_code(ErrorCode::ConnectionTimeout) == std::errc::timed_out);
}

TEST(ErrorTest, SessionCodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::ValidationError), "ValidationError");
    EXPECT_STREQ(errorCodeName(ErrorCode::SignalingError), "SignalingError");
    EXPECT_STREQ(errorCodeName(ErrorCode::SetupError), "SetupError");
    EXPECT_STREQ(errorCodeName(ErrorCode::TransportFailure), "TransportFailure");
    EXPECT_STREQ(errorCodeName(ErrorCode::PlaybackError), "PlaybackError");
}

TEST(ErrorTest, ErrorException) {
    try {
        throw Error(ErrorCode::ConnectionFailed, "Failed to connect to server");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConnectionFailed);
        EXPECT_STREQ(e.what(), "Failed to connect to server");
        EXPECT_TRUE(e.error_code() == std::errc::connection_refused);
    }
}

TEST(ErrorTest, ThrowErrorHelper) {
    try {
        throw_error(ErrorCode::SetupError, "No answer from server");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SetupError);
        EXPECT_STREQ(e.what(), "No answer from server");
        EXPECT_GT(e.location().line(), 0u);
    }
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> result = 42;
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
    EXPECT_THROW(result.error(), Error);
}

TEST(ErrorTest, ResultError) {
    Result<int> result(ErrorCode::InvalidData, "Invalid integer");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidData);
    EXPECT_THROW(result.value(), Error);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> result;
    EXPECT_TRUE(result.is_ok());
    EXPECT_NO_THROW(result.value());

    Result<void> failure(ErrorCode::NotSupported, "Unsupported URL scheme");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.error().code(), ErrorCode::NotSupported);
    EXPECT_THROW(failure.value(), Error);
}

TEST(ErrorTest, ResultMoveValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(42));
    ASSERT_TRUE(result.is_ok());
    auto ptr = std::move(result).value();
    EXPECT_EQ(*ptr, 42);
}

TEST(ErrorTest, ResultBoolConversion) {
    Result<int> success(42);
    Result<int> failure(ErrorCode::InvalidData, "Invalid integer");

    EXPECT_TRUE(bool(success));
    EXPECT_FALSE(bool(failure));
}

} // namespace streamview::core::test
