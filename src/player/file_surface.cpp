#include <streamview/player/file_surface.hpp>
#include <streamview/core/logger.hpp>

namespace streamview::player {

FileSurface::FileSurface(std::optional<std::filesystem::path> output)
    : output_path_(std::move(output)) {}

FileSurface::~FileSurface() = default;

void FileSurface::showOverlay(const std::string& message) {
    if (overlay_visible_ && overlay_ == message) {
        return;
    }
    overlay_ = message;
    overlay_visible_ = true;
    core::Logger::info("[overlay] {}", message);
}

void FileSurface::hideOverlay() {
    overlay_visible_ = false;
}

void FileSurface::attachStream(std::shared_ptr<peer::MediaStream> stream) {
    stream_ = std::move(stream);
    playing_ = false;
    if (!stream_) {
        return;
    }

    std::string kinds;
    for (const auto& kind : stream_->track_kinds) {
        if (!kinds.empty()) kinds += ",";
        kinds += kind;
    }
    core::Logger::info("Attached remote stream {} ({})", stream_->id, kinds);

    emit(SurfaceEvent::LoadStart);
    emit(SurfaceEvent::DataLoaded);
    playing_ = true;
    emit(SurfaceEvent::Playing);
}

void FileSurface::setSource(const std::string& url) {
    source_ = url;
    playing_ = false;
    emit(SurfaceEvent::LoadStart, url);
}

bool FileSurface::canPlayNatively(const std::string&) const {
    return false;
}

void FileSurface::appendMediaData(const std::vector<uint8_t>& data) {
    if (!playing_) {
        emit(SurfaceEvent::LoadStart);
    }

    if (output_path_) {
        if (!output_.is_open()) {
            auto opened = openOutput();
            if (opened.is_error()) {
                emit(SurfaceEvent::Error, std::string(core::errorCodeName(opened.error().code())) +
                    ": " + opened.error().what());
                return;
            }
        }
        output_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        output_.flush();
        if (!output_) {
            emit(SurfaceEvent::Error, "Write to " + output_path_->string() + " failed");
            return;
        }
    }
    bytes_written_ += data.size();

    if (!playing_) {
        emit(SurfaceEvent::DataLoaded);
        playing_ = true;
        emit(SurfaceEvent::Playing);
    }
}

// The first open starts a fresh recording; reopening after clearMedia()
// continues it so a reconnect keeps what was already received.
core::Result<void> FileSurface::openOutput() {
    auto mode = std::ios::binary | (output_started_ ? std::ios::app : std::ios::trunc);
    output_.clear();
    output_.open(*output_path_, mode);
    if (!output_) {
        output_.clear();
        core::Logger::error("{}: cannot open {}",
            core::errorCodeName(core::ErrorCode::FileAccessDenied), output_path_->string());
        return {core::ErrorCode::FileAccessDenied, "Cannot open " + output_path_->string()};
    }
    output_started_ = true;
    return {};
}

void FileSurface::clearMedia() {
    stream_.reset();
    source_.clear();
    playing_ = false;
    if (output_.is_open()) {
        output_.close();
    }
}

SubscriptionId FileSurface::subscribe(EventHandler handler) {
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void FileSurface::unsubscribe(SubscriptionId id) {
    handlers_.erase(id);
}

void FileSurface::emit(SurfaceEvent event, const std::string& detail) {
    core::Logger::debug("Surface event: {}", toString(event));
    auto handlers = handlers_;
    for (const auto& [id, handler] : handlers) {
        if (handler) {
            handler(event, detail);
        }
    }
}

} // namespace streamview::player
