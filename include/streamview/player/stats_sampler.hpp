#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <streamview/core/scheduler.hpp>
#include <streamview/peer/peer_connection.hpp>

namespace streamview::player {

struct StatsSample {
    uint64_t bytes_received = 0;
    double timestamp_ms = 0.0;
};

struct DerivedStats {
    std::optional<int64_t> bitrate_kbps;
    std::optional<int64_t> viewer_count;
    std::optional<double> latency_ms;
    // False for transports that expose no counters
    bool applicable = true;

    static DerivedStats notApplicable() {
        DerivedStats stats;
        stats.applicable = false;
        return stats;
    }
};

// Derives the receive bitrate of the active peer session once per interval.
// Only the latest sample is kept; stop() forgets it.
class StatsSampler : public std::enable_shared_from_this<StatsSampler> {
public:
    using StatsSource = std::function<void(peer::PeerConnection::StatsCallback)>;
    using Listener = std::function<void(const DerivedStats&)>;

    static constexpr std::chrono::milliseconds kDefaultInterval{1000};

    StatsSampler(core::Scheduler& scheduler,
                 std::chrono::milliseconds interval = kDefaultInterval);
    ~StatsSampler();

    StatsSampler(const StatsSampler&) = delete;
    StatsSampler& operator=(const StatsSampler&) = delete;

    void start(StatsSource source, Listener listener);
    void stop();

    bool running() const { return running_; }
    const DerivedStats& latest() const { return latest_; }
    const std::optional<StatsSample>& previousSample() const { return previous_; }

    // round(8 * dBytes / (dMs / 1000) / 1000). Unavailable when the
    // timestamps do not increase or the result is not positive.
    static std::optional<int64_t> computeBitrateKbps(const StatsSample& previous,
                                                     const StatsSample& current);

    // Feeds one report set as if a tick had produced it
    void ingest(const std::vector<peer::StatsReport>& reports);

private:
    void scheduleTick();
    void tick(uint64_t generation);

    core::Scheduler& scheduler_;
    std::chrono::milliseconds interval_;

    StatsSource source_;
    Listener listener_;
    bool running_ = false;
    uint64_t generation_ = 0;
    core::TimerId timer_ = 0;

    std::optional<StatsSample> previous_;
    DerivedStats latest_;
};

} // namespace streamview::player
