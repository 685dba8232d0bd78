#include <watchman/core/probe/endpoint.hpp>

#include <algorithm>
#include <cctype>

namespace Watchman {

std::optional<HttpEndpoint> parseEndpoint(const std::string& url) {
    static const std::string kScheme = "http://";

    if (url.size() <= kScheme.size()) return std::nullopt;

    std::string scheme = url.substr(0, kScheme.size());
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != kScheme) return std::nullopt;

    std::string rest = url.substr(kScheme.size());
    std::string authority;
    std::string path;

    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        authority = rest;
    } else {
        authority = rest.substr(0, slash);
        path = rest.substr(slash);
    }

    // Query strings and fragments have no meaning for a base endpoint
    if (rest.find_first_of("?#") != std::string::npos) return std::nullopt;
    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    HttpEndpoint ep;
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        ep.host = authority;
    } else {
        ep.host = authority.substr(0, colon);
        std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) return std::nullopt;
        ep.port = static_cast<uint16_t>(value);
    }
    if (ep.host.empty()) return std::nullopt;

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    ep.base_path = path;
    return ep;
}

} // namespace Watchman
