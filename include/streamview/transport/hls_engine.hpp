#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

#include <streamview/core/scheduler.hpp>
#include <streamview/net/http_client.hpp>
#include <streamview/transport/hls_playlist.hpp>
#include <streamview/transport/segment_engine.hpp>

namespace streamview::transport {

// Segment engine for HLS over HTTP. Starts near the live edge, fetches
// segments strictly in order and reloads a live playlist every target
// duration until it ends.
class HlsEngine : public SegmentEngine,
                  public std::enable_shared_from_this<HlsEngine> {
public:
    using FetcherFactory = std::function<std::shared_ptr<net::HttpFetcher>()>;

    // Segments behind the newest one where live playback starts
    static constexpr size_t kLiveEdgeSegments = 3;
    static constexpr std::chrono::milliseconds kMinReloadInterval{500};
    // Master playlists followed in a row before the manifest is rejected
    static constexpr size_t kMaxVariantHops = 4;

    HlsEngine(core::Scheduler& scheduler, std::shared_ptr<net::HttpFetcher> fetcher);
    ~HlsEngine() override;

    void setHandlers(Handlers handlers) override { handlers_ = std::move(handlers); }
    void load(const std::string& manifest_url, player::PresentationSurface& surface) override;
    void destroy() override;

    static SegmentEngineFactory factory(core::Scheduler& scheduler, FetcherFactory fetchers);

    bool manifestParsed() const { return manifest_parsed_; }
    const std::string& playlistUrl() const { return playlist_url_; }
    size_t queuedSegments() const { return queue_.size(); }
    uint64_t segmentsAppended() const { return segments_appended_; }

private:
    void fetchPlaylist();
    void onPlaylist(core::Result<net::HttpResponse> result);
    void enqueue(const HlsPlaylist& playlist);
    void fetchNextSegment();
    void onSegment(core::Result<net::HttpResponse> result);
    void scheduleReload(double target_duration);
    void reportError(const std::string& details, const std::string& message, bool fatal);

    core::Scheduler& scheduler_;
    std::shared_ptr<net::HttpFetcher> fetcher_;
    player::PresentationSurface* surface_ = nullptr;
    Handlers handlers_;

    std::string manifest_url_;
    std::string playlist_url_;
    size_t variant_hops_ = 0;
    bool manifest_parsed_ = false;
    bool ended_ = false;
    bool destroyed_ = false;

    std::optional<uint64_t> next_sequence_;
    std::deque<HlsSegment> queue_;
    bool fetching_segment_ = false;
    uint64_t segments_appended_ = 0;

    core::TimerId reload_timer_ = 0;
};

} // namespace streamview::transport
