/**
 * @file api_gateway.hpp
 * @brief HTTP gateway for Watchman
 *
 * Serves the status/registration API and Watchman's own healthcheck
 * over HTTP/1.1 on a small pool of io threads.
 */

#pragma once

#include <watchman/api/http_router.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace watchman::microservice {

/**
 * @brief HTTP Gateway configuration
 */
struct GatewayConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5555;           // 0 picks an ephemeral port
    size_t thread_pool_size = 2;
};

class ApiGateway {
public:
    ApiGateway(const GatewayConfig& config, std::shared_ptr<const api::HttpRouter> router);
    ~ApiGateway();

    // Non-copyable
    ApiGateway(const ApiGateway&) = delete;
    ApiGateway& operator=(const ApiGateway&) = delete;

    /**
     * @brief Bind the listener and start the io threads
     * @return false if the address could not be bound
     */
    bool start();

    /**
     * @brief Stop accepting, drop open connections and join the io threads
     */
    void stop();

    bool is_running() const;

    /**
     * @brief host:port actually bound (resolved port when configured as 0)
     */
    std::string get_address() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace watchman::microservice
