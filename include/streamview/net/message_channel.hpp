#pragma once

#include <functional>
#include <memory>
#include <string>

namespace streamview::net {

// Ordered, connection-oriented text message channel (a WebSocket in practice).
// Handlers run on the scheduler thread.
class MessageChannel {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        std::function<void(const std::string&)> on_error;
        // Remote close or connection loss; not raised by close()
        std::function<void()> on_close;
    };

    virtual ~MessageChannel() = default;

    virtual void setHandlers(Handlers handlers) = 0;

    // Starts connecting; completion is reported through on_open or on_error/on_close
    virtual void open(const std::string& url) = 0;

    // False when the channel is not open
    virtual bool send(const std::string& text) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

using MessageChannelFactory = std::function<std::shared_ptr<MessageChannel>()>;

} // namespace streamview::net
