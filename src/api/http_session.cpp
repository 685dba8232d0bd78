#include <watchman/api/http_session.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

namespace watchman::api {

namespace {
constexpr auto kIdleTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxBodyBytes = 64 * 1024;
}

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<const HttpRouter> router)
    : stream_(std::move(socket)), router_(std::move(router)) {
}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(kMaxBodyBytes);
    stream_.expires_after(kIdleTimeout);

    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
        return do_close();
    }

    if (ec) {
        spdlog::debug("[HttpSession] Read error: {}", ec.message());
        return do_close();
    }

    req_ = parser_->release();
    spdlog::debug("[HttpSession] {} {} ({} bytes)",
                  std::string(req_.method_string()), std::string(req_.target()), bytes);

    auto self = shared_from_this();
    std::shared_ptr<Response> res;
    bool close = false;

    try {
        res = std::make_shared<Response>(router_->route(req_));
        close = res->need_eof();
    } catch (const std::exception& e) {
        spdlog::error("[HttpSession] Exception during request handling: {}", e.what());

        res = std::make_shared<Response>(http::status::internal_server_error, req_.version());
        res->set(http::field::content_type, "application/json");
        res->keep_alive(false);
        res->body() = R"({"error":"Internal server error"})";
        res->prepare_payload();
        close = true;
    }

    http::async_write(stream_, *res,
                      [self, res, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t bytes) {
    (void)bytes;

    if (ec) {
        spdlog::debug("[HttpSession] Write error: {}", ec.message());
        return do_close();
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

} // namespace watchman::api
