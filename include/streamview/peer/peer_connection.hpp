#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <streamview/core/error.hpp>

namespace streamview::peer {

enum class SdpType {
    Offer,
    Answer
};

const char* toString(SdpType type);

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid;
    std::optional<uint32_t> sdp_mline_index;
};

enum class PeerConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* toString(PeerConnectionState state);

struct PeerConfiguration {
    std::vector<std::string> ice_servers;
};

struct OfferOptions {
    bool receive_audio = true;
    bool receive_video = true;
};

// One entry of a stats report ("inbound-rtp" / "video" is the one sampled)
struct StatsReport {
    std::string type;
    std::string kind;
    uint64_t bytes_received = 0;
    double timestamp_ms = 0.0;
};

// Remote media delivered to the presentation surface
struct MediaStream {
    std::string id;
    std::vector<std::string> track_kinds;
};

struct TrackEvent {
    std::string kind;
    std::vector<std::shared_ptr<MediaStream>> streams;
};

// Peer session engine. Every callback runs on the scheduler thread.
class PeerConnection {
public:
    using DescriptionCallback = std::function<void(core::Result<SessionDescription>)>;
    using CompletionCallback = std::function<void(core::Result<void>)>;
    using StatsCallback = std::function<void(core::Result<std::vector<StatsReport>>)>;

    struct Handlers {
        std::function<void(const TrackEvent&)> on_track;
        std::function<void(const IceCandidate&)> on_local_candidate;
        std::function<void(PeerConnectionState)> on_state_change;
    };

    virtual ~PeerConnection() = default;

    virtual void setHandlers(Handlers handlers) = 0;

    virtual void createOffer(const OfferOptions& options, DescriptionCallback callback) = 0;
    virtual void setLocalDescription(const SessionDescription& description, CompletionCallback callback) = 0;
    virtual void setRemoteDescription(const SessionDescription& description, CompletionCallback callback) = 0;
    virtual void addIceCandidate(const IceCandidate& candidate, CompletionCallback callback) = 0;
    virtual void getStats(StatsCallback callback) = 0;

    virtual void close() = 0;
    virtual PeerConnectionState state() const = 0;
};

// May throw core::Error when no peer engine can be created
using PeerConnectionFactory =
    std::function<std::shared_ptr<PeerConnection>(const PeerConfiguration&)>;

} // namespace streamview::peer
