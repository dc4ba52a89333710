#include <streamview/net/url.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace streamview::net {

core::Result<Url> Url::parse(std::string_view text) {
    static const std::regex url_regex(
        R"(^([A-Za-z][A-Za-z0-9+.\-]*)://(\[[^\]]+\]|[^:/?#]+)(?::(\d+))?([/?][^#]*)?(?:#.*)?$)",
        std::regex::ECMAScript
    );

    std::string input(text);
    std::smatch match;
    if (!std::regex_match(input, match, url_regex)) {
        return {core::ErrorCode::InvalidAddress, "Invalid URL: " + input};
    }

    Url url;
    url.scheme = match[1].str();
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    url.host = match[2].str();
    if (url.host.size() > 2 && url.host.front() == '[') {
        url.host = url.host.substr(1, url.host.size() - 2);
    }

    if (match[3].matched) {
        int port = 0;
        try {
            port = std::stoi(match[3].str());
        } catch (const std::exception&) {
            port = -1;
        }
        if (port <= 0 || port > 65535) {
            return {core::ErrorCode::InvalidAddress, "Invalid port in URL: " + input};
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (match[4].matched) {
        url.target = match[4].str();
        if (url.target.front() == '?') {
            url.target = "/" + url.target;
        }
    }

    return url;
}

uint16_t Url::effectivePort() const {
    if (port != 0) return port;
    return isSecure() ? 443 : 80;
}

std::string Url::authority() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == 0) return host_part;
    return host_part + ":" + std::to_string(port);
}

std::string Url::toString() const {
    std::ostringstream oss;
    oss << scheme << "://" << authority() << target;
    return oss.str();
}

std::string resolveUrl(const std::string& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }

    auto parsed = Url::parse(base);
    if (!parsed) {
        return reference;
    }
    const Url& url = parsed.value();

    if (reference.rfind("//", 0) == 0) {
        return url.scheme + ":" + reference;
    }

    std::string origin = url.scheme + "://" + url.authority();
    if (!reference.empty() && reference.front() == '/') {
        return origin + reference;
    }

    std::string path = url.target.substr(0, url.target.find('?'));
    return origin + path.substr(0, path.rfind('/') + 1) + reference;
}

} // namespace streamview::net
