#include <streamview/core/config.hpp>
#include <streamview/core/logger.hpp>
#include <streamview/core/uv_scheduler.hpp>
#include <streamview/net/datachannel_websocket.hpp>
#include <streamview/net/http_client.hpp>
#include <streamview/peer/datachannel_peer.hpp>
#include <streamview/player/controller.hpp>
#include <streamview/player/file_surface.hpp>
#include <streamview/player/viewer_options.hpp>
#include <streamview/transport/hls_engine.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <uv.h>

using namespace streamview;

namespace {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::string> stream_key;
    std::optional<std::string> server_url;
    std::optional<std::string> transport;
    std::optional<std::string> output;
    std::optional<std::string> log_level;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE          JSON configuration file\n"
              << "  --stream-key KEY       Stream to play\n"
              << "  --server URL           Streaming server (default http://localhost:8080)\n"
              << "  --transport KIND       webrtc or hls (default webrtc)\n"
              << "  --output FILE          Write received HLS segments to FILE\n"
              << "  --log-level LEVEL      debug, info, warn or error\n"
              << "  --help                 Show this message\n";
}

core::Result<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
            continue;
        }

        std::optional<std::string>* target = nullptr;
        if (arg == "--config") target = &cli.config_path;
        else if (arg == "--stream-key") target = &cli.stream_key;
        else if (arg == "--server") target = &cli.server_url;
        else if (arg == "--transport") target = &cli.transport;
        else if (arg == "--output") target = &cli.output;
        else if (arg == "--log-level") target = &cli.log_level;

        if (!target) {
            return {core::ErrorCode::InvalidArgument, "Unknown option: " + arg};
        }
        if (i + 1 >= argc) {
            return {core::ErrorCode::InvalidArgument, "Missing value for " + arg};
        }
        *target = argv[++i];
    }

    return cli;
}

// Keys given on the command line win over the configuration file
void applyOverrides(const CommandLine& cli, core::Config& config) {
    if (cli.stream_key) config.set("stream_key", *cli.stream_key);
    if (cli.server_url) config.set("server_url", *cli.server_url);
    if (cli.transport) config.set("transport", *cli.transport);
    if (cli.output) config.set("output", *cli.output);
    if (cli.log_level) config.set("log_level", *cli.log_level);
}

struct ShutdownContext {
    core::UvScheduler* scheduler;
    player::ConnectionController* controller;
};

void onSignal(uv_signal_t* handle, int signum) {
    auto* context = static_cast<ShutdownContext*>(handle->data);
    core::Logger::info("Received signal {}, disconnecting...", signum);
    context->controller->disconnect();
    context->scheduler->stop();
}

} // namespace

int main(int argc, char* argv[]) {
    auto cli = parseCommandLine(argc, argv);
    if (cli.is_error()) {
        std::cerr << cli.error().what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    }
    if (cli.value().help) {
        printUsage(argv[0]);
        return 0;
    }

    core::Config config;
    if (cli.value().config_path) {
        auto loaded = config.loadFromFile(*cli.value().config_path);
        if (loaded.is_error()) {
            core::Logger::error("{}", loaded.error().what());
            return 1;
        }
    }
    applyOverrides(cli.value(), config);

    auto options = player::ViewerOptions::fromConfig(config);
    if (options.is_error()) {
        core::Logger::error("Invalid configuration: {}", options.error().what());
        return 1;
    }
    const player::ViewerOptions& viewer = options.value();
    core::Logger::setLevel(viewer.log_level);

    try {
        core::UvScheduler scheduler;
        uv_loop_t* loop = scheduler.loop();

        player::FileSurface surface(viewer.output);

        auto channels = net::DataChannelWebSocket::factory(scheduler);
        auto engines = transport::HlsEngine::factory(scheduler,
            [loop]() -> std::shared_ptr<net::HttpFetcher> {
                return net::HttpClient::create(loop);
            });

        player::ConnectionController controller(scheduler, surface, channels,
            peer::DataChannelPeer::factory(scheduler), engines, viewer.controller);

        controller.setStatusListener([&](player::SessionStatus status) {
            core::Logger::info("Status: {}", controller.statusText());
            if (status != player::SessionStatus::Disconnected) {
                return;
            }
            // Reconnect scheduling happens after the status change
            scheduler.post([&]() {
                if (controller.status() == player::SessionStatus::Disconnected &&
                    !controller.reconnectPending()) {
                    scheduler.stop();
                }
            });
        });
        controller.setStatsListener([&](const player::DerivedStats&) {
            core::Logger::debug("Bitrate: {}", controller.bitrateText());
        });

        ShutdownContext shutdown{&scheduler, &controller};
        uv_signal_t sigint;
        uv_signal_init(loop, &sigint);
        sigint.data = &shutdown;
        uv_signal_start(&sigint, &onSignal, SIGINT);
        uv_unref(reinterpret_cast<uv_handle_t*>(&sigint));

        controller.setRequest(viewer.stream_key, viewer.server_url, viewer.transport);
        auto connected = controller.connect();
        if (connected.is_error() && connected.error().code() == core::ErrorCode::ValidationError) {
            core::Logger::error("{}", connected.error().what());
            uv_close(reinterpret_cast<uv_handle_t*>(&sigint), nullptr);
            scheduler.run();
            return 1;
        }

        scheduler.run();

        controller.disconnect();
        uv_signal_stop(&sigint);
        uv_close(reinterpret_cast<uv_handle_t*>(&sigint), nullptr);
        scheduler.run();

        core::Logger::info("Viewer stopped");
        return 0;
    }
    catch (const std::exception& ex) {
        core::Logger::error("Error: {}", ex.what());
        return 1;
    }
}
