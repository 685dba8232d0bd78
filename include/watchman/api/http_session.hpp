#pragma once

#include <watchman/api/http_router.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <optional>

namespace watchman::api {

using tcp = boost::asio::ip::tcp;

/**
 * @brief One client connection: read a request, route it, write the reply,
 * repeat while the client keeps the connection alive.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<const HttpRouter> router);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    Request req_;
    std::shared_ptr<const HttpRouter> router_;
};

} // namespace watchman::api
