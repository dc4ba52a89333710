#pragma once

#include <atomic>
#include <memory>

#include <rtc/rtc.hpp>

#include <streamview/core/scheduler.hpp>
#include <streamview/peer/peer_connection.hpp>

namespace streamview::peer {

// PeerConnection backed by libdatachannel. Receive-only audio and video,
// trickle ICE. libdatachannel runs its own threads; every callback is handed
// to the scheduler with post().
class DataChannelPeer : public PeerConnection,
                        public std::enable_shared_from_this<DataChannelPeer> {
public:
    static std::shared_ptr<DataChannelPeer> create(core::Scheduler& scheduler,
                                                   const PeerConfiguration& config);
    ~DataChannelPeer() override;

    void setHandlers(Handlers handlers) override { handlers_ = std::move(handlers); }

    void createOffer(const OfferOptions& options, DescriptionCallback callback) override;
    void setLocalDescription(const SessionDescription& description, CompletionCallback callback) override;
    void setRemoteDescription(const SessionDescription& description, CompletionCallback callback) override;
    void addIceCandidate(const IceCandidate& candidate, CompletionCallback callback) override;
    void getStats(StatsCallback callback) override;

    void close() override;
    PeerConnectionState state() const override { return state_; }

    static PeerConnectionFactory factory(core::Scheduler& scheduler);

private:
    DataChannelPeer(core::Scheduler& scheduler, const PeerConfiguration& config);

    void attachCallbacks();
    void watchTrack(const std::shared_ptr<rtc::Track>& track, const std::string& kind);

    // Runs fn on the scheduler thread unless the peer is gone or closed
    template<typename Fn>
    void dispatch(Fn fn);

    core::Scheduler& scheduler_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> audio_track_;
    std::shared_ptr<rtc::Track> video_track_;

    Handlers handlers_;
    DescriptionCallback pending_offer_;
    PeerConnectionState state_ = PeerConnectionState::New;
    bool closed_ = false;
    bool track_reported_ = false;

    std::atomic<uint64_t> video_bytes_{0};
};

} // namespace streamview::peer
