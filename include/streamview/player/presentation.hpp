#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <streamview/peer/peer_connection.hpp>

namespace streamview::player {

enum class SurfaceEvent {
    LoadStart,
    DataLoaded,
    Error,
    Waiting,
    Playing
};

const char* toString(SurfaceEvent event);

using SubscriptionId = uint64_t;

// Where media ends up. The viewer only assigns sources, toggles the overlay
// and observes playback events; it never decodes anything itself.
class PresentationSurface {
public:
    using EventHandler = std::function<void(SurfaceEvent event, const std::string& detail)>;

    virtual ~PresentationSurface() = default;

    virtual void showOverlay(const std::string& message) = 0;
    virtual void hideOverlay() = 0;

    // Peer-to-peer media
    virtual void attachStream(std::shared_ptr<peer::MediaStream> stream) = 0;

    // Segmented media: either a URL the surface plays on its own, or
    // data fed by a segment engine
    virtual void setSource(const std::string& url) = 0;
    virtual bool canPlayNatively(const std::string& mime_type) const = 0;
    virtual void appendMediaData(const std::vector<uint8_t>& data) = 0;

    // Drops any stream, source and buffered media
    virtual void clearMedia() = 0;

    virtual SubscriptionId subscribe(EventHandler handler) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

} // namespace streamview::player
