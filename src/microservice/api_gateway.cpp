#include <watchman/microservice/api_gateway.hpp>
#include <watchman/api/http_server.hpp>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace watchman::microservice {

namespace net = boost::asio;

struct ApiGateway::Impl {
    GatewayConfig config;
    std::shared_ptr<const api::HttpRouter> router;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::shared_ptr<api::HttpServer> server;
    std::vector<std::thread> threads;
    std::atomic<bool> running{false};
    uint16_t bound_port = 0;
};

ApiGateway::ApiGateway(const GatewayConfig& config, std::shared_ptr<const api::HttpRouter> router)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->router = std::move(router);
}

ApiGateway::~ApiGateway() {
    stop();
}

bool ApiGateway::start() {
    if (impl_->running.load()) {
        return true;
    }

    try {
        const auto address = net::ip::make_address(impl_->config.host);
        impl_->server = std::make_shared<api::HttpServer>(
            impl_->ioc, api::tcp::endpoint{address, impl_->config.port}, impl_->router);
    } catch (const std::exception& e) {
        spdlog::error("[ApiGateway] Failed to bind {}:{}: {}",
                      impl_->config.host, impl_->config.port, e.what());
        impl_->server.reset();
        return false;
    }

    impl_->bound_port = impl_->server->local_port();
    impl_->ioc.restart();
    impl_->work.emplace(net::make_work_guard(impl_->ioc));
    impl_->server->run();

    const size_t threads = impl_->config.thread_pool_size > 0 ? impl_->config.thread_pool_size : 1;
    for (size_t i = 0; i < threads; ++i) {
        impl_->threads.emplace_back([this] {
            try {
                impl_->ioc.run();
            } catch (const std::exception& e) {
                spdlog::error("[ApiGateway] io thread terminated: {}", e.what());
            }
        });
    }

    impl_->running.store(true);
    spdlog::info("[ApiGateway] Serving HTTP on {} with {} io threads", get_address(), threads);
    return true;
}

void ApiGateway::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    spdlog::info("[ApiGateway] Stopping HTTP gateway");
    impl_->server->stop();
    impl_->work.reset();
    impl_->ioc.stop();

    for (auto& t : impl_->threads) {
        if (t.joinable()) t.join();
    }
    impl_->threads.clear();
    impl_->server.reset();
}

bool ApiGateway::is_running() const {
    return impl_->running.load();
}

std::string ApiGateway::get_address() const {
    const uint16_t port = impl_->bound_port != 0 ? impl_->bound_port : impl_->config.port;
    return impl_->config.host + ":" + std::to_string(port);
}

} // namespace watchman::microservice
