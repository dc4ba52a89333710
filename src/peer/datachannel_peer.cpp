#include <streamview/peer/datachannel_peer.hpp>
#include <streamview/core/logger.hpp>

namespace streamview::peer {

namespace {
    PeerConnectionState mapState(rtc::PeerConnection::State state) {
        switch (state) {
            case rtc::PeerConnection::State::New: return PeerConnectionState::New;
            case rtc::PeerConnection::State::Connecting: return PeerConnectionState::Connecting;
            case rtc::PeerConnection::State::Connected: return PeerConnectionState::Connected;
            case rtc::PeerConnection::State::Disconnected: return PeerConnectionState::Disconnected;
            case rtc::PeerConnection::State::Failed: return PeerConnectionState::Failed;
            case rtc::PeerConnection::State::Closed: return PeerConnectionState::Closed;
        }
        return PeerConnectionState::Closed;
    }

    rtc::Configuration buildConfiguration(const PeerConfiguration& config) {
        rtc::Configuration rtc_config;
        for (const auto& url : config.ice_servers) {
            rtc_config.iceServers.emplace_back(url);
        }
        rtc_config.disableAutoNegotiation = true;
        return rtc_config;
    }
}

std::shared_ptr<DataChannelPeer> DataChannelPeer::create(core::Scheduler& scheduler,
                                                         const PeerConfiguration& config) {
    std::shared_ptr<DataChannelPeer> peer(new DataChannelPeer(scheduler, config));
    peer->attachCallbacks();
    return peer;
}

PeerConnectionFactory DataChannelPeer::factory(core::Scheduler& scheduler) {
    return [&scheduler](const PeerConfiguration& config) -> std::shared_ptr<PeerConnection> {
        return create(scheduler, config);
    };
}

DataChannelPeer::DataChannelPeer(core::Scheduler& scheduler, const PeerConfiguration& config)
    : scheduler_(scheduler) {
    try {
        pc_ = std::make_shared<rtc::PeerConnection>(buildConfiguration(config));
    }
    catch (const std::exception& e) {
        core::throw_error(core::ErrorCode::SetupError,
            std::string("Failed to create peer connection: ") + e.what());
    }
}

DataChannelPeer::~DataChannelPeer() {
    close();
}

template<typename Fn>
void DataChannelPeer::dispatch(Fn fn) {
    std::weak_ptr<DataChannelPeer> weak = weak_from_this();
    scheduler_.post([weak, fn = std::move(fn)]() mutable {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        fn(*self);
    });
}

void DataChannelPeer::attachCallbacks() {
    std::weak_ptr<DataChannelPeer> weak = weak_from_this();

    pc_->onStateChange([weak](rtc::PeerConnection::State state) {
        auto self = weak.lock();
        if (!self) return;
        self->dispatch([state](DataChannelPeer& peer) {
            peer.state_ = mapState(state);
            core::Logger::debug("Peer connection state: {}", toString(peer.state_));
            if (auto handler = peer.handlers_.on_state_change) {
                handler(peer.state_);
            }
        });
    });

    pc_->onLocalDescription([weak](rtc::Description description) {
        auto self = weak.lock();
        if (!self) return;
        std::string sdp = std::string(description);
        self->dispatch([sdp](DataChannelPeer& peer) {
            auto callback = std::move(peer.pending_offer_);
            peer.pending_offer_ = nullptr;
            if (callback) {
                callback(SessionDescription{SdpType::Offer, sdp});
            }
        });
    });

    pc_->onLocalCandidate([weak](rtc::Candidate candidate) {
        auto self = weak.lock();
        if (!self) return;
        IceCandidate local;
        local.candidate = candidate.candidate();
        local.sdp_mid = candidate.mid();
        self->dispatch([local](DataChannelPeer& peer) {
            if (auto handler = peer.handlers_.on_local_candidate) {
                handler(local);
            }
        });
    });

    pc_->onTrack([weak](std::shared_ptr<rtc::Track> track) {
        auto self = weak.lock();
        if (!self || !track) return;
        std::string kind = track->description().type();
        self->dispatch([track, kind](DataChannelPeer& peer) {
            peer.watchTrack(track, kind);
        });
    });
}

void DataChannelPeer::watchTrack(const std::shared_ptr<rtc::Track>& track, const std::string& kind) {
    std::weak_ptr<DataChannelPeer> weak = weak_from_this();

    if (kind == "video") {
        video_track_ = track;
        track->onMessage(
            [weak](rtc::binary data) {
                if (auto self = weak.lock()) {
                    self->video_bytes_.fetch_add(data.size(), std::memory_order_relaxed);
                }
            },
            nullptr);
    } else {
        audio_track_ = track;
    }

    auto report = [weak, kind]() {
        auto self = weak.lock();
        if (!self) return;
        self->dispatch([kind](DataChannelPeer& peer) {
            if (peer.track_reported_) return;
            peer.track_reported_ = true;

            auto stream = std::make_shared<MediaStream>();
            stream->id = "remote";
            if (peer.audio_track_) stream->track_kinds.push_back("audio");
            if (peer.video_track_) stream->track_kinds.push_back("video");

            if (auto handler = peer.handlers_.on_track) {
                handler(TrackEvent{kind, {stream}});
            }
        });
    };

    if (track->isOpen()) {
        report();
    } else {
        track->onOpen(report);
    }
}

void DataChannelPeer::createOffer(const OfferOptions& options, DescriptionCallback callback) {
    if (closed_) {
        callback(core::Result<SessionDescription>(core::ErrorCode::InvalidState, "Peer connection closed"));
        return;
    }
    if (pending_offer_) {
        callback(core::Result<SessionDescription>(core::ErrorCode::InvalidState, "Offer already in progress"));
        return;
    }

    try {
        if (options.receive_audio && !audio_track_) {
            rtc::Description::Audio audio("audio", rtc::Description::Direction::RecvOnly);
            audio.addOpusCodec(111);
            watchTrack(pc_->addTrack(std::move(audio)), "audio");
        }
        if (options.receive_video && !video_track_) {
            rtc::Description::Video video("video", rtc::Description::Direction::RecvOnly);
            video.addH264Codec(102);
            video.addVP8Codec(96);
            watchTrack(pc_->addTrack(std::move(video)), "video");
        }

        pending_offer_ = std::move(callback);
        // Applies the offer locally; onLocalDescription delivers it
        pc_->setLocalDescription(rtc::Description::Type::Offer);
    }
    catch (const std::exception& e) {
        auto pending = callback ? std::move(callback) : std::move(pending_offer_);
        pending_offer_ = nullptr;
        if (pending) {
            pending(core::Result<SessionDescription>(core::ErrorCode::SetupError,
                std::string("Failed to create offer: ") + e.what()));
        }
    }
}

void DataChannelPeer::setLocalDescription(const SessionDescription& description, CompletionCallback callback) {
    // createOffer already applied the local description
    if (closed_) {
        callback(core::Result<void>(core::ErrorCode::InvalidState, "Peer connection closed"));
        return;
    }
    core::Logger::debug("Local {} description confirmed", toString(description.type));
    callback(core::Result<void>());
}

void DataChannelPeer::setRemoteDescription(const SessionDescription& description, CompletionCallback callback) {
    if (closed_) {
        callback(core::Result<void>(core::ErrorCode::InvalidState, "Peer connection closed"));
        return;
    }
    try {
        pc_->setRemoteDescription(rtc::Description(description.sdp, toString(description.type)));
        callback(core::Result<void>());
    }
    catch (const std::exception& e) {
        callback(core::Result<void>(core::ErrorCode::SetupError,
            std::string("Failed to apply remote description: ") + e.what()));
    }
}

void DataChannelPeer::addIceCandidate(const IceCandidate& candidate, CompletionCallback callback) {
    if (closed_) {
        callback(core::Result<void>(core::ErrorCode::InvalidState, "Peer connection closed"));
        return;
    }
    try {
        if (candidate.sdp_mid) {
            pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, *candidate.sdp_mid));
        } else {
            pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate));
        }
        callback(core::Result<void>());
    }
    catch (const std::exception& e) {
        callback(core::Result<void>(core::ErrorCode::InvalidData,
            std::string("Failed to add remote candidate: ") + e.what()));
    }
}

void DataChannelPeer::getStats(StatsCallback callback) {
    if (closed_) {
        callback(core::Result<std::vector<StatsReport>>(core::ErrorCode::InvalidState, "Peer connection closed"));
        return;
    }

    StatsReport video;
    video.type = "inbound-rtp";
    video.kind = "video";
    video.bytes_received = video_bytes_.load(std::memory_order_relaxed);
    video.timestamp_ms = static_cast<double>(scheduler_.now().count());

    callback(std::vector<StatsReport>{video});
}

void DataChannelPeer::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    state_ = PeerConnectionState::Closed;
    pending_offer_ = nullptr;
    handlers_ = {};

    if (pc_) {
        try {
            pc_->close();
        }
        catch (const std::exception& e) {
            core::Logger::warn("Error closing peer connection: {}", e.what());
        }
    }
    audio_track_.reset();
    video_track_.reset();
}

} // namespace streamview::peer
