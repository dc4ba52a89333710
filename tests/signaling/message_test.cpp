#include <gtest/gtest.h>
#include <streamview/signaling/message.hpp>

#include <nlohmann/json.hpp>

namespace streamview::signaling::test {

using json = nlohmann::json;

TEST(SignalMessageTest, EncodeOffer) {
    auto wire = json::parse(encode(Offer{"abc", "v=0"}));
    EXPECT_EQ(wire, json::parse(R"({"Offer": {"stream_key": "abc", "sdp": "v=0"}})"));
}

TEST(SignalMessageTest, EncodeCandidateWithMissingFields) {
    auto wire = json::parse(encode(IceCandidate{"candidate:1 1 udp 1 10.0.0.1 5000 typ host", std::nullopt, std::nullopt}));
    ASSERT_TRUE(wire.contains("IceCandidate"));
    EXPECT_TRUE(wire["IceCandidate"]["sdp_mid"].is_null());
    EXPECT_TRUE(wire["IceCandidate"]["sdp_mline_index"].is_null());

    wire = json::parse(encode(IceCandidate{"candidate:2", "0", 1u}));
    EXPECT_EQ(wire["IceCandidate"]["sdp_mid"], "0");
    EXPECT_EQ(wire["IceCandidate"]["sdp_mline_index"], 1);
}

TEST(SignalMessageTest, EncodeTags) {
    EXPECT_STREQ(messageTag(Answer{"x"}), "Answer");
    EXPECT_STREQ(messageTag(ErrorMessage{"boom"}), "Error");
    EXPECT_EQ(json::parse(encode(ErrorMessage{"boom"})), json::parse(R"({"Error": {"message": "boom"}})"));
}

TEST(SignalMessageTest, DecodeAnswer) {
    auto result = decode(R"({"Answer": {"sdp": "v=0\r\n"}})");
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(std::holds_alternative<Answer>(result.value()));
    EXPECT_EQ(std::get<Answer>(result.value()).sdp, "v=0\r\n");
}

TEST(SignalMessageTest, DecodeCandidate) {
    auto result = decode(R"({"IceCandidate": {"candidate": "candidate:1", "sdp_mid": "video", "sdp_mline_index": 1}})");
    ASSERT_TRUE(result.is_ok());
    const auto& candidate = std::get<IceCandidate>(result.value());
    EXPECT_EQ(candidate.candidate, "candidate:1");
    EXPECT_EQ(candidate.sdp_mid, "video");
    EXPECT_EQ(candidate.sdp_mline_index, 1u);

    auto bare = decode(R"({"IceCandidate": {"candidate": "candidate:2", "sdp_mid": null}})");
    ASSERT_TRUE(bare.is_ok());
    EXPECT_FALSE(std::get<IceCandidate>(bare.value()).sdp_mid.has_value());
    EXPECT_FALSE(std::get<IceCandidate>(bare.value()).sdp_mline_index.has_value());
}

TEST(SignalMessageTest, DecodeServerError) {
    auto result = decode(R"({"Error": {"message": "stream not found"}})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(std::get<ErrorMessage>(result.value()).message, "stream not found");
}

TEST(SignalMessageTest, DecodeRejectsUnknownAndMalformed) {
    const char* rejected[] = {
        "not json",
        "[]",
        "{}",
        R"({"Bye": {}})",
        R"({"Answer": {"sdp": "a"}, "Error": {"message": "b"}})",
        R"({"Answer": {}})",
        R"({"Answer": {"sdp": 5}})",
        R"({"Answer": "v=0"})",
        R"({"IceCandidate": {"candidate": "c", "sdp_mline_index": -1}})"
    };

    for (const char* text : rejected) {
        auto result = decode(text);
        ASSERT_TRUE(result.is_error()) << text;
        EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidData) << text;
    }
}

TEST(SignalMessageTest, SignalingUrl) {
    EXPECT_EQ(signalingUrl("http://localhost:8080"), "ws://localhost:8080/api/webrtc/ws");
    EXPECT_EQ(signalingUrl("https://media.example.com/"), "wss://media.example.com/api/webrtc/ws");
    EXPECT_EQ(signalingUrl("localhost:8080"), "ws://localhost:8080/api/webrtc/ws");
    EXPECT_EQ(signalingUrl("ws://already:9000"), "ws://already:9000/api/webrtc/ws");
}

} // namespace streamview::signaling::test
