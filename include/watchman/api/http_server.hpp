#pragma once

#include <watchman/api/http_router.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <cstdint>
#include <memory>

namespace watchman::api {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Accepts connections on one endpoint and hands each to an HttpSession.
 *
 * The constructor binds and listens, throwing beast::system_error on failure.
 * Port 0 binds an ephemeral port, see local_port().
 */
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const HttpRouter> router);

    void run();
    void stop();

    uint16_t local_port() const;

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::shared_ptr<const HttpRouter> router_;
};

} // namespace watchman::api
