#pragma once

#include <watchman/api/status_api.hpp>
#include <watchman/microservice/health_service.hpp>

#include <boost/beast/http.hpp>

#include <string>
#include <vector>

namespace watchman::api {

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

/**
 * Maps HTTP requests onto StatusApi:
 *
 *   GET    /                 project index (project name/version + endpoints)
 *   GET    /healthcheck      Watchman's own health (readiness, 503 until the first round)
 *   GET    /healthcheck/live liveness
 *   GET    /status           all status entries
 *   GET    /status/{name}    one status entry, 404 if not registered
 *   GET    /targets          registered targets
 *   POST   /targets          register or replace a target
 *   DELETE /targets/{name}   deregister a target (idempotent)
 */
class HttpRouter {
public:
    HttpRouter(StatusApi& api, const microservice::HealthService* health = nullptr);

    Response route(const Request& req) const;

private:
    Response handleIndex(const Request& req) const;
    Response handleHealthcheck(const Request& req) const;
    Response handleLiveness(const Request& req) const;
    Response handleStatusList(const Request& req) const;
    Response handleStatusGet(const Request& req, const std::string& name) const;
    Response handleTargetList(const Request& req) const;
    Response handleTargetPost(const Request& req) const;
    Response handleTargetDelete(const Request& req, const std::string& name) const;

    StatusApi& api_;
    const microservice::HealthService* health_;
};

// Path without query string, percent-decoded, split on '/'
std::vector<std::string> splitPath(const std::string& target);

std::string urlDecode(const std::string& value);

} // namespace watchman::api
