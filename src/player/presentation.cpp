#include <streamview/player/presentation.hpp>

namespace streamview::player {

const char* toString(SurfaceEvent event) {
    switch (event) {
        case SurfaceEvent::LoadStart: return "loadstart";
        case SurfaceEvent::DataLoaded: return "loadeddata";
        case SurfaceEvent::Error: return "error";
        case SurfaceEvent::Waiting: return "waiting";
        case SurfaceEvent::Playing: return "playing";
        default: return "unknown";
    }
}

} // namespace streamview::player
