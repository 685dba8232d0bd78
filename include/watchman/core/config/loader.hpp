#pragma once
#include <watchman/core/config/app_config.hpp>
#include <watchman/core/registry/deployment_target.hpp>
#include <string>

class ConfigLoader {
public:
    // Parse + validate a YAML file; throws std::runtime_error naming the bad key
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    // Same as loadConfig, from an in-memory YAML document
    static AppConfig::AppConfiguration parseConfig(const std::string& yaml);

    // WATCHMAN_* environment overrides, re-validated afterwards
    static void applyEnvironment(AppConfig::AppConfiguration& config);

    // Fills derived defaults (round deadline, target endpoints) and checks ranges
    static void validate(AppConfig::AppConfiguration& config);

    static Watchman::DeploymentTarget toTarget(const AppConfig::TargetConfig& config);
};
