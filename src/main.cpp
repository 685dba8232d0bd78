#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include <watchman/core/config/loader.hpp>
#include <watchman/core/registry/target_registry.hpp>
#include <watchman/core/status/status_store.hpp>
#include <watchman/core/probe/http_probe_client.hpp>
#include <watchman/core/poller/probe_poller.hpp>
#include <watchman/core/reconciler/state_reconciler.hpp>
#include <watchman/core/watch/watch_loop.hpp>
#include <watchman/api/status_api.hpp>
#include <watchman/api/http_router.hpp>
#include <watchman/microservice/api_gateway.hpp>
#include <watchman/microservice/health_service.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Watchman v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/watchman.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    ConfigLoader::applyEnvironment(config);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Shared state (outlives everything that reads it)
    std::unique_ptr<Watchman::TargetRegistry> registry;
    std::unique_ptr<Watchman::StatusStore> store;
    std::unique_ptr<watchman::microservice::HealthService> health;

    // Probe path
    std::unique_ptr<Watchman::HttpProbeClient> probeClient;
    std::unique_ptr<Watchman::ProbePoller> poller;
    std::unique_ptr<Watchman::StateReconciler> reconciler;
    std::unique_ptr<Watchman::WatchLoop> watchLoop;

    // Serving
    std::unique_ptr<watchman::api::StatusApi> api;
    std::unique_ptr<watchman::microservice::ApiGateway> gateway;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;
    const auto interval = std::chrono::milliseconds(config.probe.poll_interval_ms);

    c.registry = std::make_unique<Watchman::TargetRegistry>();
    std::vector<Watchman::DeploymentTarget> initial;
    initial.reserve(config.targets.size());
    for (const auto& target : config.targets) {
        initial.push_back(ConfigLoader::toTarget(target));
    }
    c.registry->registerAll(std::move(initial));
    spdlog::info("Seeded {} targets from configuration", c.registry->size());

    c.store = std::make_unique<Watchman::StatusStore>();

    // Three missed intervals and Watchman reports itself degraded
    c.health = std::make_unique<watchman::microservice::HealthService>(
        3ULL * config.probe.poll_interval_ms);

    Watchman::HttpProbeSettings probeSettings;
    probeSettings.healthcheck_path = config.probe.healthcheck_path;
    probeSettings.metadata_path = config.probe.metadata_path;
    c.probeClient = std::make_unique<Watchman::HttpProbeClient>(probeSettings);

    Watchman::PollerSettings pollerSettings;
    pollerSettings.probe_timeout = std::chrono::milliseconds(config.probe.probe_timeout_ms);
    pollerSettings.round_deadline = std::chrono::milliseconds(config.probe.round_deadline_ms);
    pollerSettings.max_in_flight = config.probe.max_in_flight;
    c.poller = std::make_unique<Watchman::ProbePoller>(*c.registry, *c.probeClient, pollerSettings);

    Watchman::ReconcilePolicy policy;
    policy.failure_threshold = config.reconcile.failure_threshold;
    c.reconciler = std::make_unique<Watchman::StateReconciler>(*c.registry, *c.store, policy);

    c.watchLoop = std::make_unique<Watchman::WatchLoop>(
        *c.poller, *c.reconciler, interval, c.health.get());

    c.api = std::make_unique<watchman::api::StatusApi>(
        *c.registry, *c.store,
        watchman::api::ProjectInfo{config.project.name, config.project.version});

    watchman::microservice::GatewayConfig gatewayConfig;
    gatewayConfig.host = config.api.host;
    gatewayConfig.port = config.api.port;
    gatewayConfig.thread_pool_size = config.api.threads;
    c.gateway = std::make_unique<watchman::microservice::ApiGateway>(
        gatewayConfig,
        std::make_shared<const watchman::api::HttpRouter>(*c.api, c.health.get()));

    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");

    if (!c.gateway->start()) {
        throw std::runtime_error("HTTP gateway failed to start on " + c.gateway->get_address());
    }

    c.watchLoop->start();

    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.watchLoop) c.watchLoop->stop();
    if (c.gateway) c.gateway->stop();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        spdlog::info("Configuration loaded successfully ({} / {})",
                     config.app_name, config.project.name);

        // Initialize all components
        auto components = initializeComponents(config);

        // Start all components
        startComponents(components);

        spdlog::info("Watchman running on {}. Press Ctrl+C to shutdown.",
                     components.gateway->get_address());

        // Main loop
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        spdlog::info("Shutdown signal received");

        // Graceful shutdown
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Watchman terminated gracefully");
    return EXIT_SUCCESS;
}
