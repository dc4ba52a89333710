#include <streamview/net/datachannel_websocket.hpp>
#include <streamview/core/error.hpp>
#include <streamview/core/logger.hpp>
#include <streamview/net/url.hpp>

#include <variant>

namespace streamview::net {

std::shared_ptr<DataChannelWebSocket> DataChannelWebSocket::create(core::Scheduler& scheduler) {
    std::shared_ptr<DataChannelWebSocket> channel(new DataChannelWebSocket(scheduler));
    channel->attachCallbacks();
    return channel;
}

MessageChannelFactory DataChannelWebSocket::factory(core::Scheduler& scheduler) {
    return [&scheduler]() -> std::shared_ptr<MessageChannel> {
        return create(scheduler);
    };
}

rtc::WebSocket::Configuration DataChannelWebSocket::configuration() {
    rtc::WebSocket::Configuration config;
    config.connectionTimeout = kConnectionTimeout;
    config.maxMessageSize = kMaxMessageSize;
    return config;
}

DataChannelWebSocket::DataChannelWebSocket(core::Scheduler& scheduler)
    : scheduler_(scheduler)
    , ws_(std::make_shared<rtc::WebSocket>(configuration())) {}

DataChannelWebSocket::~DataChannelWebSocket() {
    ws_->resetCallbacks();
    close();
}

template<typename Fn>
void DataChannelWebSocket::dispatch(Fn fn) {
    std::weak_ptr<DataChannelWebSocket> weak = weak_from_this();
    scheduler_.post([weak, fn = std::move(fn)]() mutable {
        auto self = weak.lock();
        if (!self || self->closed_) return;
        fn(*self);
    });
}

void DataChannelWebSocket::attachCallbacks() {
    std::weak_ptr<DataChannelWebSocket> weak = weak_from_this();

    ws_->onOpen([weak]() {
        auto self = weak.lock();
        if (!self) return;
        self->dispatch([](DataChannelWebSocket& channel) {
            core::Logger::debug("WebSocket open");
            if (auto handler = channel.handlers_.on_open) {
                handler();
            }
        });
    });

    ws_->onMessage([weak](rtc::message_variant message) {
        auto self = weak.lock();
        if (!self) return;

        std::string text;
        if (auto* str = std::get_if<std::string>(&message)) {
            text = std::move(*str);
        } else {
            const auto& bytes = std::get<rtc::binary>(message);
            text.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        self->dispatch([text = std::move(text)](DataChannelWebSocket& channel) {
            if (auto handler = channel.handlers_.on_message) {
                handler(text);
            }
        });
    });

    ws_->onError([weak](std::string error) {
        auto self = weak.lock();
        if (!self) return;
        self->dispatch([error = std::move(error)](DataChannelWebSocket& channel) {
            core::Logger::warn("WebSocket error: {}", error);
            if (auto handler = channel.handlers_.on_error) {
                handler(error);
            }
        });
    });

    ws_->onClosed([weak]() {
        auto self = weak.lock();
        if (!self) return;
        self->dispatch([](DataChannelWebSocket& channel) {
            core::Logger::debug("WebSocket closed by peer");
            channel.closed_ = true;
            if (auto handler = channel.handlers_.on_close) {
                handler();
            }
        });
    });
}

void DataChannelWebSocket::open(const std::string& url) {
    if (opened_ || closed_) {
        core::throw_error(core::ErrorCode::InvalidState, "WebSocket is already open or closed");
    }

    auto parsed = Url::parse(url);
    if (parsed.is_error()) {
        core::throw_error(core::ErrorCode::InvalidAddress, parsed.error().what());
    }
    if (parsed.value().scheme != "ws" && parsed.value().scheme != "wss") {
        core::throw_error(core::ErrorCode::InvalidAddress, "Not a WebSocket URL: " + url);
    }

    core::Logger::debug("WebSocket connecting to {}", url);
    try {
        ws_->open(url);
    }
    catch (const std::exception& e) {
        core::throw_error(core::ErrorCode::ConnectionFailed,
            "Failed to open WebSocket " + url + ": " + e.what());
    }
    opened_ = true;
}

bool DataChannelWebSocket::send(const std::string& text) {
    if (closed_ || !ws_->isOpen()) {
        return false;
    }
    try {
        return ws_->send(text);
    }
    catch (const std::exception& e) {
        core::Logger::warn("WebSocket send failed: {}", e.what());
        return false;
    }
}

void DataChannelWebSocket::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    handlers_ = {};

    try {
        ws_->close();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Error closing WebSocket: {}", e.what());
    }
}

bool DataChannelWebSocket::isOpen() const {
    return !closed_ && ws_->isOpen();
}

} // namespace streamview::net
