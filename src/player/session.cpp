#include <streamview/player/session.hpp>

#include <algorithm>
#include <cctype>

namespace streamview::player {

const char* toString(TransportKind kind) {
    switch (kind) {
        case TransportKind::PeerToPeer: return "WebRTC";
        case TransportKind::SegmentedPull: return "HLS";
        default: return "Unknown";
    }
}

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "Idle";
        case SessionStatus::Connecting: return "Connecting";
        case SessionStatus::Connected: return "Connected";
        case SessionStatus::Disconnected: return "Disconnected";
        default: return "Unknown";
    }
}

std::string statusText(SessionStatus status, TransportKind kind) {
    switch (status) {
        case SessionStatus::Connecting:
            return "Connecting...";
        case SessionStatus::Connected:
            return std::string("Connected via ") + toString(kind);
        case SessionStatus::Idle:
        case SessionStatus::Disconnected:
        default:
            return "Disconnected";
    }
}

std::optional<TransportKind> parseTransportKind(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "webrtc") return TransportKind::PeerToPeer;
    if (lower == "hls") return TransportKind::SegmentedPull;
    return std::nullopt;
}

} // namespace streamview::player
