#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <rtc/rtc.hpp>

#include <streamview/core/scheduler.hpp>
#include <streamview/net/message_channel.hpp>

namespace streamview::net {

// MessageChannel on libdatachannel's WebSocket client (ws:// and wss://).
// libdatachannel runs its own threads; every callback is handed to the
// scheduler with post().
class DataChannelWebSocket : public MessageChannel,
                             public std::enable_shared_from_this<DataChannelWebSocket> {
public:
    // Largest signaling message accepted; bigger ones fail the connection
    static constexpr size_t kMaxMessageSize = 1024 * 1024;
    static constexpr std::chrono::milliseconds kConnectionTimeout{10000};

    static std::shared_ptr<DataChannelWebSocket> create(core::Scheduler& scheduler);
    ~DataChannelWebSocket() override;

    void setHandlers(Handlers handlers) override { handlers_ = std::move(handlers); }

    // Throws core::Error when url is not a ws:// or wss:// URL
    void open(const std::string& url) override;
    bool send(const std::string& text) override;
    void close() override;
    bool isOpen() const override;

    static rtc::WebSocket::Configuration configuration();
    static MessageChannelFactory factory(core::Scheduler& scheduler);

private:
    explicit DataChannelWebSocket(core::Scheduler& scheduler);

    void attachCallbacks();

    template<typename Fn>
    void dispatch(Fn fn);

    core::Scheduler& scheduler_;
    std::shared_ptr<rtc::WebSocket> ws_;
    Handlers handlers_;
    bool opened_ = false;
    bool closed_ = false;
};

} // namespace streamview::net
