#include <watchman/api/http_server.hpp>
#include <watchman/api/http_session.hpp>

#include <spdlog/spdlog.h>

namespace watchman::api {

HttpServer::HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint,
                       std::shared_ptr<const HttpRouter> router)
    : acceptor_(net::make_strand(ioc)), router_(std::move(router)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void HttpServer::run() {
    const auto local = acceptor_.local_endpoint();
    spdlog::info("[HttpServer] Listening on {}:{}", local.address().to_string(), local.port());
    do_accept();
}

void HttpServer::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

uint16_t HttpServer::local_port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(acceptor_.get_executor()),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted || !self->acceptor_.is_open()) {
                return;
            }
            if (ec) {
                spdlog::warn("[HttpServer] Accept error: {}", ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->run();
            }
            self->do_accept();
        });
}

} // namespace watchman::api
