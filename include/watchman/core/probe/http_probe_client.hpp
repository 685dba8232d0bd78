/**
 * @file http_probe_client.hpp
 * @brief HTTP health probe against a model server instance
 *
 * One probe is two requests sharing a single deadline:
 *   GET {endpoint}{healthcheck_path}  - is anything serving, does it report itself healthy
 *   GET {endpoint}{metadata_path}     - which model is it serving
 */

#pragma once

#include <watchman/core/probe/probe_client.hpp>

#include <optional>
#include <string>

namespace Watchman {

struct HttpProbeSettings {
    std::string healthcheck_path = "/healthcheck";
    std::string metadata_path = "/metadata";
    std::string user_agent = "watchman";
};

class HttpProbeClient : public ProbeClient {
public:
    explicit HttpProbeClient(HttpProbeSettings settings = {});
    ~HttpProbeClient() override = default;

    ProbeResult probe(const DeploymentTarget& target,
                      std::chrono::milliseconds timeout) override;

    const HttpProbeSettings& settings() const { return settings_; }

    /**
     * @brief Extract reported model identity from a /metadata response body
     *
     * The parsed body is kept whole in ModelMetadata::document.
     * @return std::nullopt if the body is not a JSON object
     */
    static std::optional<ModelMetadata> parseMetadata(const std::string& body);

    /**
     * @brief Inspect a 2xx /healthcheck body for a self-reported degraded state
     * @return reason if the instance reports itself unhealthy
     */
    static std::optional<std::string> degradedReason(const std::string& body);

private:
    HttpProbeSettings settings_;
};

} // namespace Watchman
