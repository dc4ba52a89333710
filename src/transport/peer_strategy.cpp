#include <streamview/transport/peer_strategy.hpp>

namespace streamview::transport {

PeerStrategy::PeerStrategy(TransportContext context,
                           net::MessageChannelFactory channel_factory,
                           peer::PeerConnectionFactory peer_factory,
                           peer::PeerConfiguration peer_config)
    : context_(std::move(context))
    , channel_factory_(std::move(channel_factory))
    , peer_factory_(std::move(peer_factory))
    , peer_config_(std::move(peer_config)) {}

PeerStrategy::~PeerStrategy() {
    close();
}

void PeerStrategy::start(StrategyEvents events) {
    if (closed_ || signaling_) {
        core::throw_error(core::ErrorCode::InvalidState, "Peer strategy already started");
    }
    events_ = std::move(events);

    auto transport = channel_factory_ ? channel_factory_() : nullptr;
    if (!transport) {
        core::throw_error(core::ErrorCode::SetupError, "No signaling transport available");
    }

    std::string url = signaling::signalingUrl(context_.server_endpoint);
    signaling_ = std::make_shared<signaling::SignalingChannel>(std::move(transport), url, context_.log);

    std::weak_ptr<PeerStrategy> weak = weak_from_this();
    signaling::SignalingChannel::Handlers handlers;
    handlers.on_open = [weak]() {
        if (auto self = weak.lock(); self && !self->closed_) {
            self->negotiate();
        }
    };
    handlers.on_answer = [weak](const signaling::Answer& answer) {
        if (auto self = weak.lock(); self && !self->closed_) {
            self->applyAnswer(answer);
        }
    };
    handlers.on_ice_candidate = [weak](const signaling::IceCandidate& candidate) {
        if (auto self = weak.lock(); self && !self->closed_) {
            self->applyRemoteCandidate(candidate);
        }
    };
    handlers.on_close = [weak]() {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        if (auto handler = self->events_.on_signaling_closed) {
            handler();
        }
    };
    signaling_->setHandlers(std::move(handlers));

    context_.log.info("Connecting to signaling server {}", url);
    signaling_->open();
}

void PeerStrategy::negotiate() {
    try {
        peer_ = peer_factory_ ? peer_factory_(peer_config_) : nullptr;
    }
    catch (const std::exception& e) {
        fail(std::string("Failed to create peer session: ") + e.what());
        return;
    }
    if (!peer_) {
        fail("WebRTC is not available");
        return;
    }

    std::weak_ptr<PeerStrategy> weak = weak_from_this();
    peer::PeerConnection::Handlers handlers;
    handlers.on_track = [weak](const peer::TrackEvent& event) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->context_.log.info("Received remote {} track", event.kind);
        if (!event.streams.empty()) {
            self->context_.surface.attachStream(event.streams.front());
            self->markConnected();
        }
    };
    handlers.on_local_candidate = [weak](const peer::IceCandidate& candidate) {
        auto self = weak.lock();
        if (!self || self->closed_ || !self->signaling_) return;
        self->signaling_->send(signaling::IceCandidate{
            candidate.candidate, candidate.sdp_mid, candidate.sdp_mline_index});
    };
    handlers.on_state_change = [weak](peer::PeerConnectionState state) {
        if (auto self = weak.lock(); self && !self->closed_) {
            self->onPeerState(state);
        }
    };
    peer_->setHandlers(std::move(handlers));

    peer::OfferOptions options;
    options.receive_audio = true;
    options.receive_video = true;

    peer_->createOffer(options, [weak](core::Result<peer::SessionDescription> result) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        if (result.is_error()) {
            self->fail(std::string("Failed to create offer: ") + result.error().what());
            return;
        }

        peer::SessionDescription offer = result.value();
        self->peer_->setLocalDescription(offer, [weak, offer](core::Result<void> applied) {
            auto self = weak.lock();
            if (!self || self->closed_) return;
            if (applied.is_error()) {
                self->fail(std::string("Failed to set local description: ") + applied.error().what());
                return;
            }
            self->sendOffer(offer);
        });
    });
}

void PeerStrategy::sendOffer(const peer::SessionDescription& offer) {
    context_.log.debug("Sending offer for stream {}", context_.stream_key);
    signaling_->send(signaling::Offer{context_.stream_key, offer.sdp});
}

void PeerStrategy::applyAnswer(const signaling::Answer& answer) {
    if (!peer_) {
        context_.log.warn("Answer received before the peer session exists");
        return;
    }

    std::weak_ptr<PeerStrategy> weak = weak_from_this();
    peer_->setRemoteDescription(peer::SessionDescription{peer::SdpType::Answer, answer.sdp},
        [weak](core::Result<void> result) {
            auto self = weak.lock();
            if (!self || self->closed_) return;
            if (result.is_error()) {
                self->context_.log.error("Failed to apply answer: {}", result.error().what());
                return;
            }
            self->context_.log.info("Remote description applied");
        });
}

void PeerStrategy::applyRemoteCandidate(const signaling::IceCandidate& candidate) {
    if (!peer_) {
        context_.log.warn("ICE candidate received before the peer session exists");
        return;
    }

    std::weak_ptr<PeerStrategy> weak = weak_from_this();
    peer_->addIceCandidate(peer::IceCandidate{candidate.candidate, candidate.sdp_mid, candidate.sdp_mline_index},
        [weak](core::Result<void> result) {
            auto self = weak.lock();
            if (!self || self->closed_) return;
            if (result.is_error()) {
                self->context_.log.error("Failed to add ICE candidate: {}", result.error().what());
            }
        });
}

void PeerStrategy::onPeerState(peer::PeerConnectionState state) {
    context_.log.info("Peer connection state: {}", peer::toString(state));

    switch (state) {
        case peer::PeerConnectionState::Connected:
            markConnected();
            if (closed_) return;
            if (auto handler = events_.on_stats_available) {
                handler();
            }
            break;

        case peer::PeerConnectionState::Failed:
        case peer::PeerConnectionState::Disconnected:
            if (auto handler = events_.on_transport_lost) {
                handler(std::string("Peer connection ") + peer::toString(state));
            }
            break;

        default:
            break;
    }
}

void PeerStrategy::markConnected() {
    if (connected_ || failed_) {
        return;
    }
    connected_ = true;
    if (auto handler = events_.on_connected) {
        handler();
    }
}

void PeerStrategy::fail(const std::string& message) {
    if (failed_ || closed_) {
        return;
    }
    failed_ = true;
    if (auto handler = events_.on_failed) {
        handler(core::Error(core::ErrorCode::SetupError, message));
    }
}

void PeerStrategy::collectStats(peer::PeerConnection::StatsCallback callback) {
    if (!peer_ || closed_) {
        callback(core::Result<std::vector<peer::StatsReport>>(core::ErrorCode::InvalidState,
            "No active peer session"));
        return;
    }
    peer_->getStats(std::move(callback));
}

void PeerStrategy::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    events_ = {};

    if (peer_) {
        peer_->setHandlers({});
        peer_->close();
        peer_.reset();
    }
    if (signaling_) {
        signaling_->close();
        signaling_.reset();
    }
}

} // namespace streamview::transport
