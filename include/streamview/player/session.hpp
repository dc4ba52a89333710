#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace streamview::player {

enum class TransportKind {
    PeerToPeer,    // WebRTC
    SegmentedPull  // HLS
};

enum class SessionStatus {
    Idle,
    Connecting,
    Connected,
    Disconnected
};

const char* toString(TransportKind kind);
const char* toString(SessionStatus status);

// Caller-facing status line ("Connected via WebRTC")
std::string statusText(SessionStatus status, TransportKind kind);

// Accepts "webrtc" and "hls" (case-insensitive)
std::optional<TransportKind> parseTransportKind(std::string_view text);

struct Session {
    std::string stream_key;
    std::string server_endpoint;
    TransportKind transport_kind = TransportKind::PeerToPeer;
    SessionStatus status = SessionStatus::Idle;
    uint64_t generation = 0;
};

} // namespace streamview::player
