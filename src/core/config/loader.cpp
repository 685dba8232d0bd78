#include <watchman/core/config/loader.hpp>
#include <watchman/core/errors.hpp>
#include <watchman/core/registry/deployment_target.hpp>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace AppConfig;

namespace {

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, T fallback) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for '" + path + "': " + e.what());
    }
}

template <typename T>
T readRequired(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required field '" + path + "'");
    }
    return readOptional<T>(parent, key, path, T{});
}

YAML::Node section(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw std::runtime_error(std::string("Section '") + key + "' must be a mapping");
    }
    return node;
}

std::map<std::string, std::string> readLabels(const YAML::Node& parent, const std::string& path) {
    std::map<std::string, std::string> labels;
    const YAML::Node node = parent["labels"];
    if (!node || node.IsNull()) return labels;
    if (!node.IsMap()) {
        throw std::runtime_error("Invalid type for '" + path + ".labels': expected a mapping");
    }
    for (const auto& kv : node) {
        try {
            labels[kv.first.as<std::string>()] = kv.second.as<std::string>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid type for '" + path + ".labels': " + e.what());
        }
    }
    return labels;
}

std::string deriveEndpoint(const ProjectConfig& project, const std::string& target) {
    std::string base = project.target_base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/gordo/v0/" + project.name + "/" + target;
}

AppConfiguration fromYaml(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    AppConfiguration config;
    config.app_name = readRequired<std::string>(root, "app_name", "app_name");
    config.version = readOptional<std::string>(root, "version", "version", "0.0.0");

    if (auto logging = section(root, "logging")) {
        config.logging.level = readOptional<std::string>(logging, "level", "logging.level", config.logging.level);
    }

    const YAML::Node project = section(root, "project");
    if (!project) {
        throw std::runtime_error("Missing required field 'project.name'");
    }
    config.project.name = readRequired<std::string>(project, "name", "project.name");
    config.project.version = readOptional<std::string>(project, "version", "project.version", "");
    config.project.target_base_url =
        readOptional<std::string>(project, "target_base_url", "project.target_base_url", "");

    if (auto probe = section(root, "probe")) {
        auto& p = config.probe;
        p.poll_interval_ms = readOptional<uint32_t>(probe, "poll_interval_ms", "probe.poll_interval_ms", p.poll_interval_ms);
        p.probe_timeout_ms = readOptional<uint32_t>(probe, "probe_timeout_ms", "probe.probe_timeout_ms", p.probe_timeout_ms);
        p.round_deadline_ms = readOptional<uint32_t>(probe, "round_deadline_ms", "probe.round_deadline_ms", p.round_deadline_ms);
        p.round_deadline_configured = p.round_deadline_ms != 0;
        p.max_in_flight = readOptional<uint32_t>(probe, "max_in_flight", "probe.max_in_flight", p.max_in_flight);
        p.healthcheck_path = readOptional<std::string>(probe, "healthcheck_path", "probe.healthcheck_path", p.healthcheck_path);
        p.metadata_path = readOptional<std::string>(probe, "metadata_path", "probe.metadata_path", p.metadata_path);
    }

    if (auto reconcile = section(root, "reconcile")) {
        config.reconcile.failure_threshold = readOptional<uint32_t>(
            reconcile, "failure_threshold", "reconcile.failure_threshold", config.reconcile.failure_threshold);
    }

    if (auto api = section(root, "api")) {
        config.api.host = readOptional<std::string>(api, "host", "api.host", config.api.host);
        config.api.port = readOptional<uint16_t>(api, "port", "api.port", config.api.port);
        config.api.threads = readOptional<uint32_t>(api, "threads", "api.threads", config.api.threads);
    }

    const YAML::Node targets = root["targets"];
    if (targets && !targets.IsNull()) {
        if (!targets.IsSequence()) {
            throw std::runtime_error("Invalid type for 'targets': expected a list");
        }
        for (std::size_t i = 0; i < targets.size(); ++i) {
            const std::string path = "targets[" + std::to_string(i) + "]";
            const YAML::Node node = targets[i];
            if (!node.IsMap()) {
                throw std::runtime_error("Invalid type for '" + path + "': expected a mapping");
            }

            TargetConfig target;
            target.name = readRequired<std::string>(node, "name", path + ".name");
            target.endpoint = readOptional<std::string>(node, "endpoint", path + ".endpoint", "");

            const YAML::Node metadata = node["metadata"];
            if (metadata && !metadata.IsNull()) {
                if (!metadata.IsMap()) {
                    throw std::runtime_error("Invalid type for '" + path + ".metadata': expected a mapping");
                }
                target.metadata.project = readOptional<std::string>(metadata, "project", path + ".metadata.project", "");
                target.metadata.model_version =
                    readOptional<std::string>(metadata, "model-version", path + ".metadata.model-version", "");
                target.metadata.labels = readLabels(metadata, path + ".metadata");
            }
            config.targets.push_back(std::move(target));
        }
    }
    return config;
}

uint32_t envNumber(const char* name, uint32_t fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    try {
        std::size_t used = 0;
        unsigned long value = std::stoul(raw, &used);
        if (used != std::string(raw).size() || value > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range(name);
        }
        spdlog::info("[Config] {} overrides configured value ({} -> {})", name, fallback, value);
        return static_cast<uint32_t>(value);
    } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("Invalid value for ") + name + ": '" + raw + "'");
    }
}

} // namespace

AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Configuration file not found: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str());
}

AppConfiguration ConfigLoader::parseConfig(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed YAML: ") + e.what());
    }

    AppConfiguration config = fromYaml(root);
    validate(config);
    return config;
}

void ConfigLoader::applyEnvironment(AppConfiguration& config) {
    config.probe.poll_interval_ms = envNumber("WATCHMAN_POLL_INTERVAL_MS", config.probe.poll_interval_ms);
    config.probe.probe_timeout_ms = envNumber("WATCHMAN_PROBE_TIMEOUT_MS", config.probe.probe_timeout_ms);
    config.probe.max_in_flight = envNumber("WATCHMAN_MAX_IN_FLIGHT", config.probe.max_in_flight);
    config.reconcile.failure_threshold = envNumber("WATCHMAN_FAILURE_THRESHOLD", config.reconcile.failure_threshold);

    uint32_t port = envNumber("WATCHMAN_API_PORT", config.api.port);
    if (port > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("Invalid value for WATCHMAN_API_PORT: " + std::to_string(port));
    }
    config.api.port = static_cast<uint16_t>(port);

    if (const char* level = std::getenv("WATCHMAN_LOG_LEVEL"); level != nullptr && *level != '\0') {
        config.logging.level = level;
    }

    // An explicit deadline is clamped to a shorter overridden poll interval;
    // an implicit one is re-derived by validate()
    if (config.probe.round_deadline_configured &&
        std::getenv("WATCHMAN_POLL_INTERVAL_MS") != nullptr &&
        config.probe.round_deadline_ms > config.probe.poll_interval_ms) {
        config.probe.round_deadline_ms = config.probe.poll_interval_ms;
    }

    validate(config);
}

void ConfigLoader::validate(AppConfiguration& config) {
    static const std::set<std::string> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"
    };

    if (config.app_name.empty()) {
        throw std::runtime_error("Invalid value for 'app_name': must not be empty");
    }
    if (config.project.name.empty()) {
        throw std::runtime_error("Invalid value for 'project.name': must not be empty");
    }
    if (kLevels.count(config.logging.level) == 0) {
        throw std::runtime_error("Invalid value for 'logging.level': " + config.logging.level);
    }

    auto& p = config.probe;
    if (p.poll_interval_ms == 0) {
        throw std::runtime_error("Invalid value for 'probe.poll_interval_ms': must be > 0");
    }
    if (p.probe_timeout_ms == 0 || p.probe_timeout_ms >= p.poll_interval_ms) {
        throw std::runtime_error("Invalid value for 'probe.probe_timeout_ms': must be > 0 and < poll_interval_ms");
    }
    if (!p.round_deadline_configured) {
        p.round_deadline_ms = p.poll_interval_ms;
    }
    if (p.round_deadline_ms <= p.probe_timeout_ms || p.round_deadline_ms > p.poll_interval_ms) {
        throw std::runtime_error(
            "Invalid value for 'probe.round_deadline_ms': must be > probe_timeout_ms and <= poll_interval_ms");
    }
    if (p.max_in_flight == 0) {
        throw std::runtime_error("Invalid value for 'probe.max_in_flight': must be >= 1");
    }
    if (p.healthcheck_path.empty() || p.healthcheck_path.front() != '/' ||
        p.metadata_path.empty() || p.metadata_path.front() != '/') {
        throw std::runtime_error("Invalid value for 'probe.*_path': paths must start with '/'");
    }

    if (config.reconcile.failure_threshold == 0) {
        throw std::runtime_error("Invalid value for 'reconcile.failure_threshold': must be >= 1");
    }
    if (config.api.port == 0) {
        throw std::runtime_error("Invalid value for 'api.port': must be 1-65535");
    }
    if (config.api.threads == 0) {
        throw std::runtime_error("Invalid value for 'api.threads': must be >= 1");
    }

    std::set<std::string> seen;
    for (std::size_t i = 0; i < config.targets.size(); ++i) {
        auto& target = config.targets[i];
        const std::string path = "targets[" + std::to_string(i) + "]";

        if (!seen.insert(target.name).second) {
            throw std::runtime_error("Invalid value for '" + path + ".name': duplicate target '" + target.name + "'");
        }
        if (target.endpoint.empty()) {
            if (config.project.target_base_url.empty()) {
                throw std::runtime_error("Missing required field '" + path +
                                         ".endpoint' (no project.target_base_url to derive it from)");
            }
            target.endpoint = deriveEndpoint(config.project, target.name);
        }

        try {
            Watchman::validateTarget(ConfigLoader::toTarget(target));
        } catch (const Watchman::InvalidTargetError& e) {
            throw std::runtime_error("Invalid value for '" + path + "': " + e.what());
        }
    }
}

Watchman::DeploymentTarget ConfigLoader::toTarget(const TargetConfig& config) {
    Watchman::DeploymentTarget target;
    target.name = config.name;
    target.endpoint = config.endpoint;
    target.expected.project = config.metadata.project;
    target.expected.model_version = config.metadata.model_version;
    target.expected.labels = config.metadata.labels;
    return target;
}
