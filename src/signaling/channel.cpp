#include <streamview/signaling/channel.hpp>

namespace streamview::signaling {

namespace {
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

SignalingChannel::SignalingChannel(std::shared_ptr<net::MessageChannel> transport,
                                   std::string url,
                                   core::LogHistory& log)
    : transport_(std::move(transport))
    , url_(std::move(url))
    , log_(log) {}

SignalingChannel::~SignalingChannel() {
    close();
}

void SignalingChannel::open() {
    if (closed_ || !transport_) {
        core::throw_error(core::ErrorCode::InvalidState, "Signaling channel already closed");
    }

    std::weak_ptr<SignalingChannel> weak = weak_from_this();

    net::MessageChannel::Handlers handlers;
    handlers.on_open = [weak]() {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->log_.info("Signaling connected to {}", self->url_);
        if (auto handler = self->handlers_.on_open) {
            handler();
        }
    };
    handlers.on_message = [weak](const std::string& text) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->handleMessage(text);
    };
    handlers.on_error = [weak](const std::string& reason) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->log_.error("{}: {}", core::errorCodeName(core::ErrorCode::SignalingError), reason);
    };
    handlers.on_close = [weak]() {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->log_.info("Signaling channel closed");
        if (auto handler = self->handlers_.on_close) {
            handler();
        }
    };
    transport_->setHandlers(std::move(handlers));

    log_.debug("Opening signaling channel {}", url_);
    transport_->open(url_);
}

void SignalingChannel::send(const SignalMessage& message) {
    if (closed_ || !transport_ || !transport_->isOpen()) {
        log_.debug("Signaling channel not open, dropping {} message", messageTag(message));
        return;
    }
    if (!transport_->send(encode(message))) {
        log_.debug("Failed to send {} message", messageTag(message));
    }
}

void SignalingChannel::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (transport_) {
        transport_->setHandlers({});
        transport_->close();
        transport_.reset();
    }
}

bool SignalingChannel::isOpen() const {
    return !closed_ && transport_ && transport_->isOpen();
}

void SignalingChannel::handleMessage(const std::string& text) {
    auto decoded = decode(text);
    if (decoded.is_error()) {
        log_.warn("Ignoring signaling message: {}", decoded.error().what());
        return;
    }

    std::visit(overloaded{
        [this](const Offer&) {
            log_.warn("Ignoring unexpected Offer from server");
        },
        [this](const Answer& answer) {
            log_.debug("Received answer");
            if (auto handler = handlers_.on_answer) {
                handler(answer);
            }
        },
        [this](const IceCandidate& candidate) {
            log_.debug("Received ICE candidate");
            if (auto handler = handlers_.on_ice_candidate) {
                handler(candidate);
            }
        },
        [this](const ErrorMessage& error) {
            log_.error("Server error: {}", error.message);
        }
    }, decoded.value());
}

} // namespace streamview::signaling
