#include <streamview/transport/segment_strategy.hpp>

namespace streamview::transport {

namespace {
    bool startsWith(const std::string& text, const std::string& prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }
}

std::string manifestUrl(const std::string& server_endpoint, const std::string& stream_key) {
    std::string base = server_endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    if (startsWith(base, "wss://")) {
        base = "https://" + base.substr(6);
    } else if (startsWith(base, "ws://")) {
        base = "http://" + base.substr(5);
    } else if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }

    return base + "/hls/" + stream_key + "/playlist.m3u8";
}

SegmentStrategy::SegmentStrategy(TransportContext context, SegmentEngineFactory engine_factory)
    : context_(std::move(context))
    , engine_factory_(std::move(engine_factory)) {}

SegmentStrategy::~SegmentStrategy() {
    close();
}

void SegmentStrategy::start(StrategyEvents events) {
    if (closed_) {
        core::throw_error(core::ErrorCode::InvalidState, "Segment strategy already closed");
    }
    events_ = std::move(events);

    std::string url = manifestUrl(context_.server_endpoint, context_.stream_key);
    context_.log.info("Connecting to HLS stream {}", url);

    std::weak_ptr<SegmentStrategy> weak = weak_from_this();

    if (context_.surface.canPlayNatively(kHlsMimeType)) {
        context_.surface.setSource(url);
        // No manifest confirmation is available on this path
        context_.scheduler.post([weak]() {
            if (auto self = weak.lock(); self && !self->closed_) {
                self->markConnected();
            }
        });
        return;
    }

    engine_ = engine_factory_ ? engine_factory_() : nullptr;
    if (!engine_) {
        core::throw_error(core::ErrorCode::SetupError, "HLS playback is not supported");
    }

    SegmentEngine::Handlers handlers;
    handlers.on_manifest_parsed = [weak](size_t segment_count) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        self->context_.log.info("HLS manifest parsed ({} segments)", segment_count);
        self->markConnected();
    };
    handlers.on_error = [weak](const SegmentError& error) {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        if (!error.fatal) {
            self->context_.log.error("HLS error: {}", error.details);
            return;
        }
        self->context_.log.error("HLS fatal error: {} ({})", error.details, error.message);
        self->fail(error);
    };
    engine_->setHandlers(std::move(handlers));
    engine_->load(url, context_.surface);
}

void SegmentStrategy::markConnected() {
    if (connected_) {
        return;
    }
    connected_ = true;
    if (auto handler = events_.on_connected) {
        handler();
    }
}

void SegmentStrategy::fail(const SegmentError& error) {
    std::string reason = error.details + ": " + error.message;
    if (!connected_) {
        if (auto handler = events_.on_failed) {
            handler(core::Error(core::ErrorCode::SetupError, "HLS bootstrap failed, " + reason));
        }
        return;
    }
    if (auto handler = events_.on_transport_lost) {
        handler(reason);
    }
}

void SegmentStrategy::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    events_ = {};

    if (engine_) {
        engine_->setHandlers({});
        engine_->destroy();
        engine_.reset();
    }
}

} // namespace streamview::transport
