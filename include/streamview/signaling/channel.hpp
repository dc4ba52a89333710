#pragma once

#include <functional>
#include <memory>
#include <string>

#include <streamview/core/log_history.hpp>
#include <streamview/net/message_channel.hpp>
#include <streamview/signaling/message.hpp>

namespace streamview::signaling {

// Control-message exchange with the server's signaling endpoint
class SignalingChannel : public std::enable_shared_from_this<SignalingChannel> {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const Answer&)> on_answer;
        std::function<void(const IceCandidate&)> on_ice_candidate;
        // Remote close or connection loss
        std::function<void()> on_close;
    };

    SignalingChannel(std::shared_ptr<net::MessageChannel> transport,
                     std::string url,
                     core::LogHistory& log);
    ~SignalingChannel();

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;

    void setHandlers(Handlers handlers) { handlers_ = std::move(handlers); }

    // Throws core::Error when the transport rejects the URL
    void open();

    // Best effort: dropped without error when the channel is not open
    void send(const SignalMessage& message);

    // Releases the transport. Safe to call more than once.
    void close();

    bool isOpen() const;
    bool isClosed() const { return closed_; }
    const std::string& url() const { return url_; }

    // Decodes and dispatches one inbound frame
    void handleMessage(const std::string& text);

private:
    std::shared_ptr<net::MessageChannel> transport_;
    std::string url_;
    core::LogHistory& log_;
    Handlers handlers_;
    bool closed_ = false;
};

} // namespace streamview::signaling
