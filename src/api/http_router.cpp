#include <watchman/api/http_router.hpp>
#include <watchman/api/json_codec.hpp>
#include <watchman/core/errors.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace watchman::api {

using nlohmann::json;

namespace {

Response jsonResponse(const Request& req, http::status status, const json& body) {
    Response res{status, req.version()};
    res.set(http::field::server, "watchman");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

Response errorResponse(const Request& req, http::status status, const std::string& message) {
    return jsonResponse(req, status, json{{"error", message}});
}

Response methodNotAllowed(const Request& req, const char* allow) {
    Response res = errorResponse(req, http::status::method_not_allowed,
                                 "Method not allowed, use " + std::string(allow));
    res.set(http::field::allow, allow);
    return res;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::vector<std::string> splitPath(const std::string& target) {
    std::string path = target.substr(0, target.find_first_of("?#"));

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) {
            segments.push_back(urlDecode(path.substr(start, end - start)));
        }
        start = end + 1;
    }
    return segments;
}

HttpRouter::HttpRouter(StatusApi& api, const microservice::HealthService* health)
    : api_(api), health_(health) {
}

Response HttpRouter::route(const Request& req) const {
    const std::string target(req.target().data(), req.target().size());
    const auto segments = splitPath(target);
    const auto method = req.method();

    if (segments.empty()) {
        if (method != http::verb::get) return methodNotAllowed(req, "GET");
        return handleIndex(req);
    }

    const std::string& head = segments[0];

    if (head == "healthcheck" && segments.size() == 1) {
        if (method != http::verb::get) return methodNotAllowed(req, "GET");
        return handleHealthcheck(req);
    }
    if (head == "healthcheck" && segments.size() == 2 && segments[1] == "live") {
        if (method != http::verb::get) return methodNotAllowed(req, "GET");
        return handleLiveness(req);
    }

    if (head == "status") {
        if (segments.size() == 1) {
            if (method != http::verb::get) return methodNotAllowed(req, "GET");
            return handleStatusList(req);
        }
        if (segments.size() == 2) {
            if (method != http::verb::get) return methodNotAllowed(req, "GET");
            return handleStatusGet(req, segments[1]);
        }
    }

    if (head == "targets") {
        if (segments.size() == 1) {
            if (method == http::verb::get) return handleTargetList(req);
            if (method == http::verb::post) return handleTargetPost(req);
            return methodNotAllowed(req, "GET, POST");
        }
        if (segments.size() == 2) {
            if (method != http::verb::delete_) return methodNotAllowed(req, "DELETE");
            return handleTargetDelete(req, segments[1]);
        }
    }

    return errorResponse(req, http::status::not_found, "No route for " + target);
}

Response HttpRouter::handleIndex(const Request& req) const {
    const ProjectIndex index = api_.projectIndex();

    json endpoints = json::array();
    for (const auto& ep : index.endpoints) {
        // The instance's own /metadata document when there is one
        json metadata = nullptr;
        if (ep.metadata) {
            metadata = ep.metadata->document.is_null() ? json(*ep.metadata) : ep.metadata->document;
        }
        endpoints.push_back(json{
            {"target", ep.target},
            {"endpoint", ep.endpoint},
            {"url", ep.url},
            {"healthy", ep.health == Watchman::HealthState::HEALTHY},
            {"health", Watchman::toString(ep.health)},
            {"metadata", std::move(metadata)}
        });
    }

    return jsonResponse(req, http::status::ok, json{
        {"project-name", index.project.name},
        {"project-version", index.project.version},
        {"round", index.round},
        {"endpoints", std::move(endpoints)}
    });
}

Response HttpRouter::handleHealthcheck(const Request& req) const {
    if (health_ == nullptr) {
        return jsonResponse(req, http::status::ok, json{{"status", "healthy"}, {"message", "OK"}});
    }

    const auto health = health_->get_health();
    const auto status = health.status == microservice::HealthStatus::UNHEALTHY
        ? http::status::service_unavailable
        : http::status::ok;
    return jsonResponse(req, status, json(health));
}

Response HttpRouter::handleLiveness(const Request& req) const {
    const bool alive = health_ == nullptr || health_->is_alive();
    return jsonResponse(req, alive ? http::status::ok : http::status::service_unavailable,
                        json{{"alive", alive}});
}

Response HttpRouter::handleStatusList(const Request& req) const {
    return jsonResponse(req, http::status::ok, json(api_.listStatus()));
}

Response HttpRouter::handleStatusGet(const Request& req, const std::string& name) const {
    try {
        return jsonResponse(req, http::status::ok, json(api_.getStatus(name)));
    } catch (const Watchman::TargetNotFoundError& e) {
        return errorResponse(req, http::status::not_found, e.what());
    }
}

Response HttpRouter::handleTargetList(const Request& req) const {
    return jsonResponse(req, http::status::ok, json(api_.listTargets()));
}

Response HttpRouter::handleTargetPost(const Request& req) const {
    Watchman::DeploymentTarget target;
    try {
        target = json::parse(req.body()).get<Watchman::DeploymentTarget>();
    } catch (const json::exception& e) {
        spdlog::debug("[HttpRouter] Rejected target body: {}", e.what());
        return errorResponse(req, http::status::bad_request,
                             std::string("Invalid target body: ") + e.what());
    }

    try {
        auto accepted = api_.registerTarget(std::move(target));
        return jsonResponse(req, http::status::ok, json(accepted));
    } catch (const Watchman::InvalidTargetError& e) {
        return errorResponse(req, http::status::bad_request, e.what());
    }
}

Response HttpRouter::handleTargetDelete(const Request& req, const std::string& name) const {
    const bool removed = api_.deregisterTarget(name);
    return jsonResponse(req, http::status::ok, json{{"name", name}, {"removed", removed}});
}

} // namespace watchman::api
