#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <streamview/core/error.hpp>
#include <streamview/core/log_history.hpp>
#include <streamview/core/scheduler.hpp>
#include <streamview/net/message_channel.hpp>
#include <streamview/peer/peer_connection.hpp>
#include <streamview/player/presentation.hpp>
#include <streamview/player/session.hpp>
#include <streamview/player/stats_sampler.hpp>
#include <streamview/transport/segment_engine.hpp>
#include <streamview/transport/strategy.hpp>

namespace streamview::player {

struct ControllerOptions {
    std::chrono::milliseconds reconnect_delay{3000};
    std::chrono::milliseconds stats_interval{1000};
    std::vector<std::string> ice_servers{
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302"
    };
    size_t log_history_limit = core::LogHistory::kDefaultCapacity;
};

// State of the caller's connect/disconnect button
struct ConnectAffordance {
    std::string label = "Connect";
    bool enabled = true;

    bool operator==(const ConnectAffordance& other) const {
        return label == other.label && enabled == other.enabled;
    }
};

// Owns the single playback session of one viewer: validates requests,
// drives a transport strategy, samples stats and reconnects after a lost
// transport. Everything runs on the scheduler thread.
class ConnectionController {
public:
    using StatusListener = std::function<void(SessionStatus status)>;
    using StatsListener = std::function<void(const DerivedStats& stats)>;

    ConnectionController(core::Scheduler& scheduler,
                         PresentationSurface& surface,
                         net::MessageChannelFactory channel_factory,
                         peer::PeerConnectionFactory peer_factory,
                         transport::SegmentEngineFactory engine_factory,
                         ControllerOptions options = {});
    ~ConnectionController();

    ConnectionController(const ConnectionController&) = delete;
    ConnectionController& operator=(const ConnectionController&) = delete;

    // Request used by connect() and toggleConnection()
    void setRequest(std::string stream_key, std::string server_endpoint, TransportKind kind);
    void selectTransport(TransportKind kind);

    // Disconnects a live session, connects otherwise
    core::Result<void> toggleConnection();

    core::Result<void> connect();
    core::Result<void> connect(const std::string& stream_key,
                               const std::string& server_endpoint,
                               TransportKind kind);

    // Idempotent; a no-op without a session
    void disconnect();

    SessionStatus status() const;
    const std::optional<Session>& session() const { return session_; }
    const ConnectAffordance& affordance() const { return affordance_; }
    const DerivedStats& stats() const { return stats_; }
    std::string statusText() const;
    // "200 kbps", "-" while unavailable, "N/A" for HLS
    std::string bitrateText() const;
    const core::LogHistory& log() const { return log_; }
    bool reconnectPending() const { return reconnect_timer_ != 0; }

    void setStatusListener(StatusListener listener) { status_listener_ = std::move(listener); }
    void setStatsListener(StatsListener listener) { stats_listener_ = std::move(listener); }

private:
    std::shared_ptr<transport::TransportStrategy> makeStrategy(const Session& session);
    transport::StrategyEvents makeEvents(uint64_t generation);

    void onConnected(uint64_t generation);
    void onStatsAvailable(uint64_t generation);
    void onSetupFailed(uint64_t generation, const std::string& reason);
    void onTransportLost(uint64_t generation, const std::string& reason);
    void onSignalingClosed(uint64_t generation);
    void onSurfaceEvent(SurfaceEvent event, const std::string& detail);

    void scheduleReconnect();
    void cancelReconnect();
    void releaseTransport();
    void setStatus(SessionStatus status);
    void setStats(const DerivedStats& stats);
    void resetStats();
    bool isCurrent(uint64_t generation) const;

    core::Scheduler& scheduler_;
    PresentationSurface& surface_;
    net::MessageChannelFactory channel_factory_;
    peer::PeerConnectionFactory peer_factory_;
    transport::SegmentEngineFactory engine_factory_;
    ControllerOptions options_;

    core::LogHistory log_;
    std::shared_ptr<StatsSampler> sampler_;
    SubscriptionId surface_subscription_ = 0;

    std::string requested_key_;
    std::string requested_endpoint_;
    TransportKind requested_kind_ = TransportKind::PeerToPeer;

    std::optional<Session> session_;
    std::shared_ptr<transport::TransportStrategy> strategy_;
    uint64_t generation_ = 0;
    core::TimerId reconnect_timer_ = 0;

    ConnectAffordance affordance_;
    DerivedStats stats_;

    StatusListener status_listener_;
    StatsListener stats_listener_;
};

} // namespace streamview::player
