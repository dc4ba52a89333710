#pragma once

#include <functional>
#include <string>

#include <streamview/core/error.hpp>
#include <streamview/core/log_history.hpp>
#include <streamview/core/scheduler.hpp>
#include <streamview/peer/peer_connection.hpp>
#include <streamview/player/presentation.hpp>
#include <streamview/player/session.hpp>

namespace streamview::transport {

// Outcome reports from a strategy to its owner. Each report runs on the
// scheduler thread and is never raised after close().
struct StrategyEvents {
    std::function<void()> on_connected;
    // The peer session is up and counters can be sampled
    std::function<void()> on_stats_available;
    // Bootstrap failed; reported at most once
    std::function<void(const core::Error&)> on_failed;
    // An established transport went away
    std::function<void(const std::string& reason)> on_transport_lost;
    std::function<void()> on_signaling_closed;
};

struct TransportContext {
    core::Scheduler& scheduler;
    player::PresentationSurface& surface;
    core::LogHistory& log;
    std::string stream_key;
    std::string server_endpoint;
};

// One way of bringing media to the surface
class TransportStrategy {
public:
    virtual ~TransportStrategy() = default;

    // Throws core::Error when setup fails synchronously
    virtual void start(StrategyEvents events) = 0;

    // Releases every resource. Safe to call more than once.
    virtual void close() = 0;

    virtual player::TransportKind kind() const = 0;

    // Raw counters for the stats sampler
    virtual void collectStats(peer::PeerConnection::StatsCallback callback) {
        callback(core::Result<std::vector<peer::StatsReport>>(core::ErrorCode::NotSupported,
            "Transport exposes no statistics"));
    }
};

} // namespace streamview::transport
