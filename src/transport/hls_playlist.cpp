#include <streamview/transport/hls_playlist.hpp>
#include <streamview/net/url.hpp>

#include <sstream>

namespace streamview::transport {

namespace {
    std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    bool startsWith(const std::string& text, const char* prefix) {
        return text.rfind(prefix, 0) == 0;
    }

    // Value of NAME=value inside an attribute list
    std::string attribute(const std::string& list, const std::string& name) {
        size_t pos = 0;
        while ((pos = list.find(name + "=", pos)) != std::string::npos) {
            if (pos == 0 || list[pos - 1] == ',') {
                size_t start = pos + name.size() + 1;
                if (start < list.size() && list[start] == '"') {
                    size_t end = list.find('"', start + 1);
                    return list.substr(start + 1, end == std::string::npos ? std::string::npos : end - start - 1);
                }
                size_t end = list.find(',', start);
                return list.substr(start, end == std::string::npos ? std::string::npos : end - start);
            }
            pos += name.size();
        }
        return "";
    }
}

core::Result<HlsPlaylist> HlsPlaylist::parse(const std::string& text, const std::string& base_url) {
    std::istringstream lines(text);
    std::string line;

    if (!std::getline(lines, line) || trim(line) != "#EXTM3U") {
        return {core::ErrorCode::InvalidData, "Playlist does not start with #EXTM3U"};
    }

    HlsPlaylist playlist;
    double pending_duration = -1.0;
    bool pending_variant = false;
    uint64_t pending_bandwidth = 0;
    uint64_t sequence = 0;
    bool sequence_set = false;

    try {
        while (std::getline(lines, line)) {
            line = trim(line);
            if (line.empty()) {
                continue;
            }

            if (line[0] != '#') {
                std::string uri = net::resolveUrl(base_url, line);
                if (pending_variant) {
                    playlist.variants.push_back({uri, pending_bandwidth});
                    pending_variant = false;
                    pending_bandwidth = 0;
                } else if (pending_duration >= 0.0) {
                    if (!sequence_set) {
                        sequence = playlist.media_sequence;
                        sequence_set = true;
                    }
                    playlist.segments.push_back({uri, pending_duration, sequence++});
                    pending_duration = -1.0;
                }
                continue;
            }

            if (startsWith(line, "#EXTINF:")) {
                std::string value = line.substr(8);
                pending_duration = std::stod(value.substr(0, value.find(',')));
            } else if (startsWith(line, "#EXT-X-TARGETDURATION:")) {
                playlist.target_duration = std::stod(line.substr(22));
            } else if (startsWith(line, "#EXT-X-MEDIA-SEQUENCE:")) {
                playlist.media_sequence = std::stoull(line.substr(22));
            } else if (startsWith(line, "#EXT-X-VERSION:")) {
                playlist.version = std::stoi(line.substr(15));
            } else if (startsWith(line, "#EXT-X-ENDLIST")) {
                playlist.end_list = true;
            } else if (startsWith(line, "#EXT-X-STREAM-INF:")) {
                pending_variant = true;
                std::string bandwidth = attribute(line.substr(18), "BANDWIDTH");
                pending_bandwidth = bandwidth.empty() ? 0 : std::stoull(bandwidth);
            }
        }
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::InvalidData, "Malformed playlist line '" + line + "': " + e.what()};
    }

    if (!playlist.isMaster() && playlist.target_duration <= 0.0 && !playlist.segments.empty()) {
        return {core::ErrorCode::InvalidData, "Media playlist without #EXT-X-TARGETDURATION"};
    }

    return playlist;
}

} // namespace streamview::transport
