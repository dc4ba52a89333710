#include <streamview/core/error.hpp>
#include <unordered_map>

namespace streamview::core {

namespace {
    struct ErrorInfo {
        const char* name;
        const char* message;
    };

    const std::unordered_map<ErrorCode, ErrorInfo> ERROR_INFO = {
        // System errors
        {ErrorCode::Success, {"Success", "Success"}},
        {ErrorCode::Unknown, {"Unknown", "Unknown error"}},
        {ErrorCode::InvalidArgument, {"InvalidArgument", "Invalid argument"}},
        {ErrorCode::InvalidState, {"InvalidState", "Invalid state"}},
        {ErrorCode::NotSupported, {"NotSupported", "Not supported"}},
        {ErrorCode::InvalidData, {"InvalidData", "Invalid data"}},

        // Network errors
        {ErrorCode::NetworkError, {"NetworkError", "Network error"}},
        {ErrorCode::ConnectionFailed, {"ConnectionFailed", "Connection failed"}},
        {ErrorCode::ConnectionClosed, {"ConnectionClosed", "Connection closed"}},
        {ErrorCode::ConnectionTimeout, {"ConnectionTimeout", "Connection timeout"}},
        {ErrorCode::InvalidAddress, {"InvalidAddress", "Invalid address"}},

        // Session errors
        {ErrorCode::ValidationError, {"ValidationError", "Invalid connection parameters"}},
        {ErrorCode::SignalingError, {"SignalingError", "Signaling channel error"}},
        {ErrorCode::SetupError, {"SetupError", "Session setup failed"}},
        {ErrorCode::TransportFailure, {"TransportFailure", "Transport failure"}},
        {ErrorCode::PlaybackError, {"PlaybackError", "Playback error"}},

        // Resource errors
        {ErrorCode::FileNotFound, {"FileNotFound", "File not found"}},
        {ErrorCode::FileAccessDenied, {"FileAccessDenied", "File access denied"}}
    };

    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::NotSupported, std::errc::not_supported},
        {ErrorCode::NetworkError, std::errc::network_unreachable},
        {ErrorCode::ConnectionFailed, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::ConnectionTimeout, std::errc::timed_out},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto it = ERROR_INFO.find(static_cast<ErrorCode>(ev));
    return it != ERROR_INFO.end() ? it->second.message : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto it = ERROR_CONDITIONS.find(static_cast<ErrorCode>(ev));
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

const char* errorCodeName(ErrorCode code) {
    auto it = ERROR_INFO.find(code);
    return it != ERROR_INFO.end() ? it->second.name : "Unknown";
}

} // namespace streamview::core
