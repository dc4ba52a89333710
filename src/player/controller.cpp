#include <streamview/player/controller.hpp>
#include <streamview/transport/peer_strategy.hpp>
#include <streamview/transport/segment_strategy.hpp>

namespace streamview::player {

namespace {
    constexpr const char* kOverlayLoading = "Loading...";
    constexpr const char* kOverlayPlaybackError = "Playback error";
    constexpr const char* kOverlayBuffering = "Buffering...";
    constexpr const char* kOverlayDisconnected = "Disconnected";

    std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t\r\n\f\v");
        if (begin == std::string::npos) return "";
        auto end = text.find_last_not_of(" \t\r\n\f\v");
        return text.substr(begin, end - begin + 1);
    }
}

ConnectionController::ConnectionController(core::Scheduler& scheduler,
                                           PresentationSurface& surface,
                                           net::MessageChannelFactory channel_factory,
                                           peer::PeerConnectionFactory peer_factory,
                                           transport::SegmentEngineFactory engine_factory,
                                           ControllerOptions options)
    : scheduler_(scheduler)
    , surface_(surface)
    , channel_factory_(std::move(channel_factory))
    , peer_factory_(std::move(peer_factory))
    , engine_factory_(std::move(engine_factory))
    , options_(std::move(options))
    , log_(options_.log_history_limit)
    , sampler_(std::make_shared<StatsSampler>(scheduler_, options_.stats_interval)) {
    surface_subscription_ = surface_.subscribe([this](SurfaceEvent event, const std::string& detail) {
        onSurfaceEvent(event, detail);
    });
}

ConnectionController::~ConnectionController() {
    cancelReconnect();
    releaseTransport();
    surface_.unsubscribe(surface_subscription_);
}

void ConnectionController::setRequest(std::string stream_key, std::string server_endpoint, TransportKind kind) {
    requested_key_ = std::move(stream_key);
    requested_endpoint_ = std::move(server_endpoint);
    requested_kind_ = kind;
}

void ConnectionController::selectTransport(TransportKind kind) {
    if (requested_kind_ == kind) {
        return;
    }
    requested_kind_ = kind;
    log_.info("Switched to {} transport", toString(kind));
}

core::Result<void> ConnectionController::toggleConnection() {
    auto current = status();
    if (session_ && (current == SessionStatus::Connecting || current == SessionStatus::Connected)) {
        disconnect();
        return {};
    }
    return connect();
}

core::Result<void> ConnectionController::connect() {
    return connect(requested_key_, requested_endpoint_, requested_kind_);
}

core::Result<void> ConnectionController::connect(const std::string& stream_key,
                                                 const std::string& server_endpoint,
                                                 TransportKind kind) {
    std::string key = trim(stream_key);
    std::string endpoint = trim(server_endpoint);

    if (key.empty()) {
        log_.error("{}: Stream key is required", core::errorCodeName(core::ErrorCode::ValidationError));
        return {core::ErrorCode::ValidationError, "Stream key is required"};
    }
    if (endpoint.empty()) {
        log_.error("{}: Server URL is required", core::errorCodeName(core::ErrorCode::ValidationError));
        return {core::ErrorCode::ValidationError, "Server URL is required"};
    }
    if (status() == SessionStatus::Connecting) {
        log_.warn("Connection attempt already in progress");
        return {core::ErrorCode::InvalidState, "Connection attempt already in progress"};
    }

    cancelReconnect();
    if (session_) {
        releaseTransport();
        surface_.clearMedia();
    }

    ++generation_;
    session_ = Session{key, endpoint, kind, SessionStatus::Connecting, generation_};
    affordance_ = ConnectAffordance{"Connect", false};
    resetStats();
    setStatus(SessionStatus::Connecting);
    log_.info("Connecting to {} via {}", endpoint, toString(kind));

    uint64_t generation = generation_;
    try {
        auto strategy = makeStrategy(*session_);
        strategy_ = strategy;
        strategy->start(makeEvents(generation));
    }
    catch (const std::exception& e) {
        std::string reason = e.what();
        onSetupFailed(generation, reason);
        return {core::ErrorCode::SetupError, reason};
    }
    return {};
}

void ConnectionController::disconnect() {
    if (!session_) {
        return;
    }
    if (session_->status == SessionStatus::Disconnected && !strategy_ && reconnect_timer_ == 0) {
        return;
    }

    log_.info("Disconnecting");
    cancelReconnect();
    ++generation_;
    releaseTransport();

    surface_.clearMedia();
    surface_.showOverlay(kOverlayDisconnected);
    resetStats();
    affordance_ = ConnectAffordance{"Connect", true};
    setStatus(SessionStatus::Disconnected);
    log_.info("Disconnected");
}

SessionStatus ConnectionController::status() const {
    return session_ ? session_->status : SessionStatus::Idle;
}

std::string ConnectionController::statusText() const {
    return player::statusText(status(), session_ ? session_->transport_kind : requested_kind_);
}

std::string ConnectionController::bitrateText() const {
    if (!stats_.applicable) {
        return "N/A";
    }
    if (stats_.bitrate_kbps) {
        return std::to_string(*stats_.bitrate_kbps) + " kbps";
    }
    return "-";
}

std::shared_ptr<transport::TransportStrategy> ConnectionController::makeStrategy(const Session& session) {
    transport::TransportContext context{scheduler_, surface_, log_, session.stream_key, session.server_endpoint};

    switch (session.transport_kind) {
        case TransportKind::PeerToPeer:
            return std::make_shared<transport::PeerStrategy>(
                context, channel_factory_, peer_factory_, peer::PeerConfiguration{options_.ice_servers});
        case TransportKind::SegmentedPull:
            return std::make_shared<transport::SegmentStrategy>(context, engine_factory_);
    }
    core::throw_error(core::ErrorCode::NotSupported, "Unknown transport kind");
}

transport::StrategyEvents ConnectionController::makeEvents(uint64_t generation) {
    transport::StrategyEvents events;
    events.on_connected = [this, generation]() {
        onConnected(generation);
    };
    events.on_stats_available = [this, generation]() {
        onStatsAvailable(generation);
    };
    events.on_failed = [this, generation](const core::Error& error) {
        onSetupFailed(generation, error.what());
    };
    events.on_transport_lost = [this, generation](const std::string& reason) {
        onTransportLost(generation, reason);
    };
    events.on_signaling_closed = [this, generation]() {
        onSignalingClosed(generation);
    };
    return events;
}

void ConnectionController::onConnected(uint64_t generation) {
    if (!isCurrent(generation) || session_->status != SessionStatus::Connecting) {
        return;
    }
    affordance_ = ConnectAffordance{"Disconnect", true};
    setStatus(SessionStatus::Connected);
    log_.info("Connected via {}", toString(session_->transport_kind));
}

void ConnectionController::onStatsAvailable(uint64_t generation) {
    if (!isCurrent(generation) || session_->transport_kind != TransportKind::PeerToPeer) {
        return;
    }
    if (session_->status != SessionStatus::Connected || sampler_->running() || !strategy_) {
        return;
    }

    std::weak_ptr<transport::TransportStrategy> weak = strategy_;
    sampler_->start(
        [weak](peer::PeerConnection::StatsCallback callback) {
            if (auto strategy = weak.lock()) {
                strategy->collectStats(std::move(callback));
            }
        },
        [this](const DerivedStats& stats) {
            setStats(stats);
        });
}

void ConnectionController::onSetupFailed(uint64_t generation, const std::string& reason) {
    if (!isCurrent(generation) || session_->status != SessionStatus::Connecting) {
        return;
    }

    log_.error("{}: Connection failed: {}", core::errorCodeName(core::ErrorCode::SetupError), reason);
    releaseTransport();
    surface_.clearMedia();
    affordance_ = ConnectAffordance{"Connect", true};
    setStatus(SessionStatus::Disconnected);
}

void ConnectionController::onTransportLost(uint64_t generation, const std::string& reason) {
    if (!isCurrent(generation)) {
        return;
    }
    if (session_->status == SessionStatus::Connecting) {
        onSetupFailed(generation, reason);
        return;
    }
    if (session_->status != SessionStatus::Connected) {
        return;
    }

    log_.error("{}: {}", core::errorCodeName(core::ErrorCode::TransportFailure), reason);
    releaseTransport();
    surface_.clearMedia();
    surface_.showOverlay(kOverlayDisconnected);
    resetStats();
    affordance_ = ConnectAffordance{"Connect", true};
    setStatus(SessionStatus::Disconnected);

    log_.info("Connection lost, reconnecting in {} ms", options_.reconnect_delay.count());
    scheduleReconnect();
}

void ConnectionController::onSignalingClosed(uint64_t generation) {
    if (!isCurrent(generation) || session_->status == SessionStatus::Disconnected) {
        return;
    }

    log_.warn("{}: Signaling channel closed", core::errorCodeName(core::ErrorCode::SignalingError));
    ++generation_;
    releaseTransport();
    surface_.clearMedia();
    surface_.showOverlay(kOverlayDisconnected);
    resetStats();
    affordance_ = ConnectAffordance{"Connect", true};
    setStatus(SessionStatus::Disconnected);
}

void ConnectionController::onSurfaceEvent(SurfaceEvent event, const std::string& detail) {
    switch (event) {
        case SurfaceEvent::LoadStart:
            log_.info("Loading stream");
            surface_.showOverlay(kOverlayLoading);
            break;
        case SurfaceEvent::DataLoaded:
            log_.info("Media data loaded");
            surface_.hideOverlay();
            break;
        case SurfaceEvent::Error:
            log_.error("{}: {}", core::errorCodeName(core::ErrorCode::PlaybackError),
                detail.empty() ? std::string("unknown error") : detail);
            surface_.showOverlay(kOverlayPlaybackError);
            break;
        case SurfaceEvent::Waiting:
            surface_.showOverlay(kOverlayBuffering);
            break;
        case SurfaceEvent::Playing:
            surface_.hideOverlay();
            log_.info("Playback started");
            break;
    }
}

void ConnectionController::scheduleReconnect() {
    cancelReconnect();
    uint64_t generation = generation_;
    reconnect_timer_ = scheduler_.schedule(options_.reconnect_delay, [this, generation]() {
        reconnect_timer_ = 0;
        if (!isCurrent(generation) || session_->status != SessionStatus::Disconnected) {
            return;
        }

        Session previous = *session_;
        log_.info("Reconnecting to {}", previous.server_endpoint);
        auto result = connect(previous.stream_key, previous.server_endpoint, previous.transport_kind);
        if (result.is_error()) {
            log_.debug("Reconnect attempt failed: {}", result.error().what());
        }
    });
}

void ConnectionController::cancelReconnect() {
    if (reconnect_timer_ != 0) {
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = 0;
    }
}

void ConnectionController::releaseTransport() {
    sampler_->stop();
    if (strategy_) {
        auto strategy = std::move(strategy_);
        strategy_.reset();
        strategy->close();
    }
}

void ConnectionController::setStatus(SessionStatus status) {
    if (!session_) {
        return;
    }
    session_->status = status;
    if (auto listener = status_listener_) {
        listener(status);
    }
}

void ConnectionController::setStats(const DerivedStats& stats) {
    stats_ = stats;
    if (auto listener = stats_listener_) {
        listener(stats_);
    }
}

void ConnectionController::resetStats() {
    bool applicable = !session_ || session_->transport_kind == TransportKind::PeerToPeer;
    setStats(applicable ? DerivedStats{} : DerivedStats::notApplicable());
}

bool ConnectionController::isCurrent(uint64_t generation) const {
    return session_ && generation == generation_;
}

} // namespace streamview::player
