#include <streamview/player/stats_sampler.hpp>
#include <streamview/core/logger.hpp>

#include <cmath>

namespace streamview::player {

StatsSampler::StatsSampler(core::Scheduler& scheduler, std::chrono::milliseconds interval)
    : scheduler_(scheduler)
    , interval_(interval) {}

StatsSampler::~StatsSampler() {
    if (timer_ != 0) {
        scheduler_.cancel(timer_);
    }
}

void StatsSampler::start(StatsSource source, Listener listener) {
    stop();

    source_ = std::move(source);
    listener_ = std::move(listener);
    running_ = true;
    ++generation_;
    scheduleTick();
}

void StatsSampler::stop() {
    if (timer_ != 0) {
        scheduler_.cancel(timer_);
        timer_ = 0;
    }
    ++generation_;
    running_ = false;
    source_ = nullptr;
    listener_ = nullptr;
    previous_.reset();
    latest_ = DerivedStats{};
}

std::optional<int64_t> StatsSampler::computeBitrateKbps(const StatsSample& previous,
                                                        const StatsSample& current) {
    double elapsed_ms = current.timestamp_ms - previous.timestamp_ms;
    if (elapsed_ms <= 0.0) {
        return std::nullopt;
    }

    double bytes = static_cast<double>(current.bytes_received) - static_cast<double>(previous.bytes_received);
    int64_t kbps = std::llround(8.0 * bytes / (elapsed_ms / 1000.0) / 1000.0);
    if (kbps <= 0) {
        return std::nullopt;
    }
    return kbps;
}

void StatsSampler::scheduleTick() {
    std::weak_ptr<StatsSampler> weak = weak_from_this();
    uint64_t generation = generation_;
    timer_ = scheduler_.schedule(interval_, [weak, generation]() {
        if (auto self = weak.lock()) {
            self->tick(generation);
        }
    });
}

void StatsSampler::tick(uint64_t generation) {
    if (!running_ || generation != generation_) {
        return;
    }
    timer_ = 0;
    scheduleTick();

    if (!source_) {
        return;
    }

    std::weak_ptr<StatsSampler> weak = weak_from_this();
    source_([weak, generation](core::Result<std::vector<peer::StatsReport>> result) {
        auto self = weak.lock();
        if (!self || !self->running_ || generation != self->generation_) {
            return;
        }
        if (result.is_error()) {
            core::Logger::debug("Stats unavailable: {}", result.error().what());
            return;
        }
        self->ingest(result.value());
    });
}

void StatsSampler::ingest(const std::vector<peer::StatsReport>& reports) {
    const peer::StatsReport* video = nullptr;
    for (const auto& report : reports) {
        if (report.type == "inbound-rtp" && report.kind == "video") {
            video = &report;
            break;
        }
    }
    if (!video) {
        return;
    }

    StatsSample current{video->bytes_received, video->timestamp_ms};
    if (previous_) {
        latest_.bitrate_kbps = computeBitrateKbps(*previous_, current);
    }
    previous_ = current;

    if (auto listener = listener_) {
        listener(latest_);
    }
}

} // namespace streamview::player
