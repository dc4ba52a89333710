#include <streamview/transport/hls_engine.hpp>
#include <streamview/core/logger.hpp>

#include <algorithm>

namespace streamview::transport {

HlsEngine::HlsEngine(core::Scheduler& scheduler, std::shared_ptr<net::HttpFetcher> fetcher)
    : scheduler_(scheduler)
    , fetcher_(std::move(fetcher)) {}

HlsEngine::~HlsEngine() {
    destroy();
}

SegmentEngineFactory HlsEngine::factory(core::Scheduler& scheduler, FetcherFactory fetchers) {
    return [&scheduler, fetchers]() -> std::shared_ptr<SegmentEngine> {
        auto fetcher = fetchers ? fetchers() : nullptr;
        if (!fetcher) {
            return nullptr;
        }
        return std::make_shared<HlsEngine>(scheduler, std::move(fetcher));
    };
}

void HlsEngine::load(const std::string& manifest_url, player::PresentationSurface& surface) {
    if (destroyed_) {
        core::throw_error(core::ErrorCode::InvalidState, "HLS engine destroyed");
    }
    surface_ = &surface;
    manifest_url_ = manifest_url;
    playlist_url_ = manifest_url;
    variant_hops_ = 0;
    fetchPlaylist();
}

void HlsEngine::destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    handlers_ = {};
    queue_.clear();
    surface_ = nullptr;

    if (reload_timer_ != 0) {
        scheduler_.cancel(reload_timer_);
        reload_timer_ = 0;
    }
    if (fetcher_) {
        fetcher_->cancelAll();
    }
}

void HlsEngine::fetchPlaylist() {
    reload_timer_ = 0;
    core::Logger::debug("Loading playlist {}", playlist_url_);

    std::weak_ptr<HlsEngine> weak = weak_from_this();
    fetcher_->get(playlist_url_, [weak](core::Result<net::HttpResponse> result) {
        auto self = weak.lock();
        if (!self || self->destroyed_) return;
        self->onPlaylist(std::move(result));
    });
}

void HlsEngine::onPlaylist(core::Result<net::HttpResponse> result) {
    if (result.is_error()) {
        bool fatal = !manifest_parsed_;
        reportError("manifestLoadError", result.error().what(), fatal);
        if (!fatal && !destroyed_) {
            scheduleReload(0.0);
        }
        return;
    }

    auto parsed = HlsPlaylist::parse(result.value().body, playlist_url_);
    if (parsed.is_error()) {
        bool fatal = !manifest_parsed_;
        reportError("manifestParsingError", parsed.error().what(), fatal);
        if (!fatal && !destroyed_) {
            scheduleReload(0.0);
        }
        return;
    }
    const HlsPlaylist& playlist = parsed.value();

    if (playlist.isMaster()) {
        if (variant_hops_ >= kMaxVariantHops) {
            bool fatal = !manifest_parsed_;
            reportError("manifestParsingError",
                "Master playlist nesting deeper than " + std::to_string(kMaxVariantHops) + " levels at " + playlist_url_,
                fatal);
            if (!fatal && !destroyed_) {
                playlist_url_ = manifest_url_;
                variant_hops_ = 0;
                scheduleReload(0.0);
            }
            return;
        }
        ++variant_hops_;
        playlist_url_ = playlist.variants.front().uri;
        core::Logger::debug("Master playlist with {} variants, using {}", playlist.variants.size(), playlist_url_);
        fetchPlaylist();
        return;
    }

    variant_hops_ = 0;
    if (!manifest_parsed_) {
        manifest_parsed_ = true;
        if (auto handler = handlers_.on_manifest_parsed) {
            handler(playlist.segments.size());
        }
        if (destroyed_) return;
    }

    ended_ = playlist.end_list;
    enqueue(playlist);
    fetchNextSegment();

    if (!ended_ && !destroyed_) {
        scheduleReload(playlist.target_duration);
    }
}

void HlsEngine::enqueue(const HlsPlaylist& playlist) {
    if (playlist.segments.empty()) {
        return;
    }

    if (!next_sequence_) {
        size_t start = 0;
        if (!playlist.end_list && playlist.segments.size() > kLiveEdgeSegments) {
            start = playlist.segments.size() - kLiveEdgeSegments;
        }
        next_sequence_ = playlist.segments[start].sequence;
    }

    uint64_t first = playlist.segments.front().sequence;
    if (*next_sequence_ < first) {
        core::Logger::warn("Playlist moved past segment {}, skipping to {}", *next_sequence_, first);
        next_sequence_ = first;
    }

    for (const auto& segment : playlist.segments) {
        if (segment.sequence >= *next_sequence_) {
            queue_.push_back(segment);
            next_sequence_ = segment.sequence + 1;
        }
    }
}

void HlsEngine::fetchNextSegment() {
    if (fetching_segment_ || queue_.empty() || destroyed_) {
        return;
    }
    fetching_segment_ = true;

    const HlsSegment& segment = queue_.front();
    core::Logger::debug("Loading segment {} ({})", segment.sequence, segment.uri);

    std::weak_ptr<HlsEngine> weak = weak_from_this();
    fetcher_->get(segment.uri, [weak](core::Result<net::HttpResponse> result) {
        auto self = weak.lock();
        if (!self || self->destroyed_) return;
        self->onSegment(std::move(result));
    });
}

void HlsEngine::onSegment(core::Result<net::HttpResponse> result) {
    fetching_segment_ = false;
    if (queue_.empty()) {
        return;
    }
    HlsSegment segment = queue_.front();
    queue_.pop_front();

    if (result.is_error()) {
        reportError("fragLoadError", result.error().what(), false);
    } else if (surface_) {
        const std::string& body = result.value().body;
        surface_->appendMediaData(std::vector<uint8_t>(body.begin(), body.end()));
        ++segments_appended_;
    }

    if (destroyed_) {
        return;
    }
    if (queue_.empty() && ended_) {
        core::Logger::info("HLS stream ended after segment {}", segment.sequence);
        return;
    }
    fetchNextSegment();
}

void HlsEngine::scheduleReload(double target_duration) {
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(target_duration * 1000.0));
    delay = std::max(delay, kMinReloadInterval);

    std::weak_ptr<HlsEngine> weak = weak_from_this();
    reload_timer_ = scheduler_.schedule(delay, [weak]() {
        auto self = weak.lock();
        if (!self || self->destroyed_) return;
        self->fetchPlaylist();
    });
}

void HlsEngine::reportError(const std::string& details, const std::string& message, bool fatal) {
    core::Logger::debug("HLS {} ({}): {}", details, fatal ? "fatal" : "non-fatal", message);

    SegmentError error;
    error.type = "networkError";
    error.details = details;
    error.message = message;
    error.fatal = fatal;

    if (auto handler = handlers_.on_error) {
        handler(error);
    }
}

} // namespace streamview::transport
