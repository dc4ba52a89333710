#pragma once

#include <functional>
#include <memory>
#include <string>

#include <streamview/player/presentation.hpp>

namespace streamview::transport {

struct SegmentError {
    std::string type;    // "networkError", "mediaError", ...
    std::string details; // "manifestLoadError", "fragLoadError", ...
    std::string message;
    bool fatal = false;
};

// Client-side segmented playback: fetches the manifest and its segments and
// feeds them to a surface. Handlers run on the scheduler thread.
class SegmentEngine {
public:
    struct Handlers {
        std::function<void(size_t segment_count)> on_manifest_parsed;
        std::function<void(const SegmentError&)> on_error;
    };

    virtual ~SegmentEngine() = default;

    virtual void setHandlers(Handlers handlers) = 0;
    virtual void load(const std::string& manifest_url, player::PresentationSurface& surface) = 0;

    // Stops fetching and detaches from the surface
    virtual void destroy() = 0;
};

// Returns nullptr when no engine is available
using SegmentEngineFactory = std::function<std::shared_ptr<SegmentEngine>()>;

} // namespace streamview::transport
