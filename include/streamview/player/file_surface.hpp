#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>

#include <streamview/core/error.hpp>
#include <streamview/player/presentation.hpp>

namespace streamview::player {

// Presentation surface for a terminal viewer. Overlay changes go to the log,
// segment data is appended to an output file when one is configured.
class FileSurface : public PresentationSurface {
public:
    explicit FileSurface(std::optional<std::filesystem::path> output = std::nullopt);
    ~FileSurface() override;

    void showOverlay(const std::string& message) override;
    void hideOverlay() override;

    void attachStream(std::shared_ptr<peer::MediaStream> stream) override;
    void setSource(const std::string& url) override;
    bool canPlayNatively(const std::string& mime_type) const override;
    void appendMediaData(const std::vector<uint8_t>& data) override;
    void clearMedia() override;

    SubscriptionId subscribe(EventHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

    const std::string& overlay() const { return overlay_; }
    bool overlayVisible() const { return overlay_visible_; }
    const std::string& source() const { return source_; }
    const std::shared_ptr<peer::MediaStream>& stream() const { return stream_; }
    uint64_t bytesWritten() const { return bytes_written_; }
    size_t subscriberCount() const { return handlers_.size(); }

private:
    void emit(SurfaceEvent event, const std::string& detail = {});
    core::Result<void> openOutput();

    std::optional<std::filesystem::path> output_path_;
    std::ofstream output_;
    bool output_started_ = false;

    std::string overlay_;
    bool overlay_visible_ = false;
    std::string source_;
    std::shared_ptr<peer::MediaStream> stream_;
    bool playing_ = false;
    uint64_t bytes_written_ = 0;

    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, EventHandler> handlers_;
};

} // namespace streamview::player
