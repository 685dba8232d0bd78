#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Watchman {

/**
 * @struct HttpEndpoint
 * @brief Parsed form of a target endpoint URL.
 */
struct HttpEndpoint {
    std::string host;
    uint16_t port = 80;
    std::string base_path;   // no trailing slash, "" for root

    // base_path + suffix, suffix is expected to start with '/'
    std::string path(const std::string& suffix) const {
        return base_path + suffix;
    }

    // Value for the Host header
    std::string hostHeader() const {
        return port == 80 ? host : host + ":" + std::to_string(port);
    }
};

/**
 * Parse "http://host[:port][/path]". Only plain http is supported.
 * @return std::nullopt if the URL is malformed or uses another scheme
 */
std::optional<HttpEndpoint> parseEndpoint(const std::string& url);

} // namespace Watchman
