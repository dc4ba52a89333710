#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <streamview/core/error.hpp>

namespace streamview::net {

// Absolute URL of the form scheme://host[:port][/path][?query]
struct Url {
    std::string scheme;
    std::string host;
    uint16_t port = 0;       // 0 when not given explicitly
    std::string target = "/"; // path plus query, always starts with '/'

    static core::Result<Url> parse(std::string_view text);

    // Explicit port, or the default for http/ws (80) and https/wss (443)
    uint16_t effectivePort() const;

    // Value for the HTTP Host header
    std::string authority() const;

    bool isSecure() const { return scheme == "https" || scheme == "wss"; }

    std::string toString() const;
};

// Resolves reference against base the way a playlist URI is resolved against
// the playlist location. Dot segments are kept as-is.
std::string resolveUrl(const std::string& base, const std::string& reference);

} // namespace streamview::net
