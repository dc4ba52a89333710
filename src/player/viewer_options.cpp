#include <streamview/player/viewer_options.hpp>

namespace streamview::player {

core::Result<ViewerOptions> ViewerOptions::fromConfig(const core::Config& config) {
    ViewerOptions options;

    auto stream_key = config.getOr<std::string>("stream_key", options.stream_key);
    if (!stream_key) return stream_key.error();
    options.stream_key = stream_key.value();

    auto server_url = config.getOr<std::string>("server_url", options.server_url);
    if (!server_url) return server_url.error();
    options.server_url = server_url.value();

    auto transport = config.getOr<std::string>("transport", "webrtc");
    if (!transport) return transport.error();
    auto kind = parseTransportKind(transport.value());
    if (!kind) {
        return core::Error(core::ErrorCode::InvalidData, "Unknown transport: " + transport.value());
    }
    options.transport = *kind;

    auto reconnect = config.getOr<int64_t>("reconnect_delay_ms", options.controller.reconnect_delay.count());
    if (!reconnect) return reconnect.error();
    if (reconnect.value() < 0) {
        return core::Error(core::ErrorCode::InvalidData, "reconnect_delay_ms must not be negative");
    }
    options.controller.reconnect_delay = std::chrono::milliseconds(reconnect.value());

    auto interval = config.getOr<int64_t>("stats_interval_ms", options.controller.stats_interval.count());
    if (!interval) return interval.error();
    if (interval.value() <= 0) {
        return core::Error(core::ErrorCode::InvalidData, "stats_interval_ms must be positive");
    }
    options.controller.stats_interval = std::chrono::milliseconds(interval.value());

    auto ice_servers = config.getOr<std::vector<std::string>>("ice_servers", options.controller.ice_servers);
    if (!ice_servers) return ice_servers.error();
    options.controller.ice_servers = ice_servers.value();

    auto history = config.getOr<int64_t>("log_history_limit",
        static_cast<int64_t>(options.controller.log_history_limit));
    if (!history) return history.error();
    if (history.value() <= 0) {
        return core::Error(core::ErrorCode::InvalidData, "log_history_limit must be positive");
    }
    options.controller.log_history_limit = static_cast<size_t>(history.value());

    auto level = config.getOr<std::string>("log_level", "info");
    if (!level) return level.error();
    if (!core::parseLogLevel(level.value(), options.log_level)) {
        return core::Error(core::ErrorCode::InvalidData, "Unknown log level: " + level.value());
    }

    if (config.has("output")) {
        auto output = config.get<std::string>("output");
        if (!output) return output.error();
        if (!output.value().empty()) {
            options.output = std::filesystem::path(output.value());
        }
    }

    return options;
}

} // namespace streamview::player
