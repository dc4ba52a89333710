#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <streamview/core/error.hpp>

namespace streamview::signaling {

struct Offer {
    std::string stream_key;
    std::string sdp;
};

struct Answer {
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid;
    std::optional<uint32_t> sdp_mline_index;
};

struct ErrorMessage {
    std::string message;
};

// Exactly one variant per message on the wire
using SignalMessage = std::variant<Offer, Answer, IceCandidate, ErrorMessage>;

// Tag used as the single top-level JSON key ("Offer", "Answer", ...)
const char* messageTag(const SignalMessage& message);

// Encodes as {"<Tag>": {...}}
std::string encode(const SignalMessage& message);

// Decodes one wire message. Unknown tags, several tags and malformed payloads
// are InvalidData.
core::Result<SignalMessage> decode(const std::string& text);

// Signaling endpoint for a server endpoint: http→ws, https→wss, a scheme-less
// endpoint gets ws://, then /api/webrtc/ws is appended.
std::string signalingUrl(const std::string& server_endpoint);

} // namespace streamview::signaling
