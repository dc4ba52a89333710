#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <streamview/core/error.hpp>

namespace streamview::transport {

struct HlsSegment {
    std::string uri;      // absolute
    double duration = 0.0;
    uint64_t sequence = 0;
};

struct HlsVariant {
    std::string uri;      // absolute
    uint64_t bandwidth = 0;
};

// M3U8 playlist, media or master
struct HlsPlaylist {
    int version = 1;
    double target_duration = 0.0;
    uint64_t media_sequence = 0;
    bool end_list = false;
    std::vector<HlsSegment> segments;
    std::vector<HlsVariant> variants;

    bool isMaster() const { return !variants.empty(); }

    // URIs are resolved against base_url. Fails with InvalidData when the
    // text is not an M3U8 playlist.
    static core::Result<HlsPlaylist> parse(const std::string& text, const std::string& base_url);
};

} // namespace streamview::transport
