#include <streamview/signaling/message.hpp>

#include <nlohmann/json.hpp>

namespace streamview::signaling {

namespace {
    using json = nlohmann::json;

    constexpr const char* kSignalingPath = "/api/webrtc/ws";

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool startsWith(const std::string& text, const std::string& prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }

    json payloadOf(const SignalMessage& message) {
        return std::visit(overloaded{
            [](const Offer& offer) {
                return json{{"stream_key", offer.stream_key}, {"sdp", offer.sdp}};
            },
            [](const Answer& answer) {
                return json{{"sdp", answer.sdp}};
            },
            [](const IceCandidate& candidate) {
                json payload = {{"candidate", candidate.candidate}};
                payload["sdp_mid"] = candidate.sdp_mid ? json(*candidate.sdp_mid) : json(nullptr);
                payload["sdp_mline_index"] = candidate.sdp_mline_index
                    ? json(*candidate.sdp_mline_index) : json(nullptr);
                return payload;
            },
            [](const ErrorMessage& error) {
                return json{{"message", error.message}};
            }
        }, message);
    }

    SignalMessage payloadTo(const std::string& tag, const json& payload) {
        if (!payload.is_object()) {
            core::throw_error(core::ErrorCode::InvalidData, tag + " payload must be an object");
        }

        if (tag == "Offer") {
            return Offer{payload.at("stream_key").get<std::string>(), payload.at("sdp").get<std::string>()};
        }
        if (tag == "Answer") {
            return Answer{payload.at("sdp").get<std::string>()};
        }
        if (tag == "IceCandidate") {
            IceCandidate candidate;
            candidate.candidate = payload.at("candidate").get<std::string>();
            auto mid = payload.find("sdp_mid");
            if (mid != payload.end() && !mid->is_null()) {
                candidate.sdp_mid = mid->get<std::string>();
            }
            auto index = payload.find("sdp_mline_index");
            if (index != payload.end() && !index->is_null()) {
                if (!index->is_number_unsigned()) {
                    core::throw_error(core::ErrorCode::InvalidData, "sdp_mline_index must be a non-negative integer");
                }
                candidate.sdp_mline_index = index->get<uint32_t>();
            }
            return candidate;
        }
        if (tag == "Error") {
            return ErrorMessage{payload.at("message").get<std::string>()};
        }

        core::throw_error(core::ErrorCode::InvalidData, "Unknown signaling message: " + tag);
    }
}

const char* messageTag(const SignalMessage& message) {
    return std::visit(overloaded{
        [](const Offer&) { return "Offer"; },
        [](const Answer&) { return "Answer"; },
        [](const IceCandidate&) { return "IceCandidate"; },
        [](const ErrorMessage&) { return "Error"; }
    }, message);
}

std::string encode(const SignalMessage& message) {
    json wire;
    wire[messageTag(message)] = payloadOf(message);
    return wire.dump();
}

core::Result<SignalMessage> decode(const std::string& text) {
    json wire;
    try {
        wire = json::parse(text);
    }
    catch (const json::exception& e) {
        return {core::ErrorCode::InvalidData, "Malformed signaling message: " + std::string(e.what())};
    }

    if (!wire.is_object() || wire.size() != 1) {
        return {core::ErrorCode::InvalidData, "Signaling message must carry exactly one tag"};
    }

    auto item = wire.begin();
    try {
        return payloadTo(item.key(), item.value());
    }
    catch (const json::exception& e) {
        return {core::ErrorCode::InvalidData, "Malformed " + item.key() + " message: " + std::string(e.what())};
    }
    catch (const core::Error& e) {
        return e;
    }
}

std::string signalingUrl(const std::string& server_endpoint) {
    std::string base = server_endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    if (startsWith(base, "https://")) {
        base = "wss://" + base.substr(8);
    } else if (startsWith(base, "http://")) {
        base = "ws://" + base.substr(7);
    } else if (base.find("://") == std::string::npos) {
        base = "ws://" + base;
    }

    return base + kSignalingPath;
}

} // namespace streamview::signaling
