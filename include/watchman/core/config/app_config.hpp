#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct ProjectConfig {
    std::string name;
    std::string version;
    // Used to derive endpoints for configured targets that omit one
    std::string target_base_url;
};

struct ProbeConfig {
    uint32_t poll_interval_ms = 5000;
    uint32_t probe_timeout_ms = 2000;
    uint32_t round_deadline_ms = 0;   // 0 = same as poll_interval_ms
    bool round_deadline_configured = false;
    uint32_t max_in_flight = 16;
    std::string healthcheck_path = "/healthcheck";
    std::string metadata_path = "/metadata";
};

struct ReconcileConfig {
    uint32_t failure_threshold = 3;
};

struct ApiConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5555;
    uint32_t threads = 2;
};

struct TargetMetadataConfig {
    std::string project;
    std::string model_version;
    std::map<std::string, std::string> labels;
};

struct TargetConfig {
    std::string name;
    std::string endpoint;
    TargetMetadataConfig metadata;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    ProjectConfig project;
    ProbeConfig probe;
    ReconcileConfig reconcile;
    ApiConfig api;
    std::vector<TargetConfig> targets;
};

} // namespace AppConfig
