#pragma once

#include <memory>

#include <streamview/transport/segment_engine.hpp>
#include <streamview/transport/strategy.hpp>

namespace streamview::transport {

inline constexpr const char* kHlsMimeType = "application/vnd.apple.mpegurl";

// {endpoint with http scheme}/hls/{stream_key}/playlist.m3u8
std::string manifestUrl(const std::string& server_endpoint, const std::string& stream_key);

// HLS bootstrap: native playback when the surface has it, a segment engine
// otherwise.
class SegmentStrategy : public TransportStrategy,
                        public std::enable_shared_from_this<SegmentStrategy> {
public:
    SegmentStrategy(TransportContext context, SegmentEngineFactory engine_factory);
    ~SegmentStrategy() override;

    void start(StrategyEvents events) override;
    void close() override;
    player::TransportKind kind() const override { return player::TransportKind::SegmentedPull; }

    const std::shared_ptr<SegmentEngine>& engine() const { return engine_; }

private:
    void markConnected();
    void fail(const SegmentError& error);

    TransportContext context_;
    SegmentEngineFactory engine_factory_;

    StrategyEvents events_;
    std::shared_ptr<SegmentEngine> engine_;
    bool connected_ = false;
    bool closed_ = false;
};

} // namespace streamview::transport
