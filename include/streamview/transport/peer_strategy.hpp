#pragma once

#include <memory>

#include <streamview/net/message_channel.hpp>
#include <streamview/peer/peer_connection.hpp>
#include <streamview/signaling/channel.hpp>
#include <streamview/transport/strategy.hpp>

namespace streamview::transport {

// WebRTC bootstrap: signaling open → peer → recv-only offer → Offer message.
// Answers and remote candidates from the server are applied to the peer.
class PeerStrategy : public TransportStrategy,
                     public std::enable_shared_from_this<PeerStrategy> {
public:
    PeerStrategy(TransportContext context,
                 net::MessageChannelFactory channel_factory,
                 peer::PeerConnectionFactory peer_factory,
                 peer::PeerConfiguration peer_config);
    ~PeerStrategy() override;

    void start(StrategyEvents events) override;
    void close() override;
    player::TransportKind kind() const override { return player::TransportKind::PeerToPeer; }
    void collectStats(peer::PeerConnection::StatsCallback callback) override;

    const std::shared_ptr<signaling::SignalingChannel>& signalingChannel() const { return signaling_; }
    const std::shared_ptr<peer::PeerConnection>& peerConnection() const { return peer_; }

private:
    void negotiate();
    void sendOffer(const peer::SessionDescription& offer);
    void applyAnswer(const signaling::Answer& answer);
    void applyRemoteCandidate(const signaling::IceCandidate& candidate);
    void onPeerState(peer::PeerConnectionState state);
    void markConnected();
    void fail(const std::string& message);

    TransportContext context_;
    net::MessageChannelFactory channel_factory_;
    peer::PeerConnectionFactory peer_factory_;
    peer::PeerConfiguration peer_config_;

    StrategyEvents events_;
    std::shared_ptr<signaling::SignalingChannel> signaling_;
    std::shared_ptr<peer::PeerConnection> peer_;

    bool connected_ = false;
    bool failed_ = false;
    bool closed_ = false;
};

} // namespace streamview::transport
