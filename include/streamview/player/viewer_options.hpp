#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <streamview/core/config.hpp>
#include <streamview/core/logger.hpp>
#include <streamview/player/controller.hpp>
#include <streamview/player/session.hpp>

namespace streamview::player {

// Everything a viewer process needs to start a session
struct ViewerOptions {
    std::string stream_key;
    std::string server_url = "http://localhost:8080";
    TransportKind transport = TransportKind::PeerToPeer;
    ControllerOptions controller;
    core::LogLevel log_level = core::LogLevel::INFO;
    std::optional<std::filesystem::path> output;

    // Missing keys keep their defaults. Wrong types and unknown enum values
    // are InvalidData.
    static core::Result<ViewerOptions> fromConfig(const core::Config& config);
};

} // namespace streamview::player
