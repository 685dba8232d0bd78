/**
 * @file http_probe_client.cpp
 * @brief Boost.Beast implementation of the model server probe
 *
 * Each probe runs its own io_context on the calling worker thread. All
 * asynchronous steps (resolve, connect, write, read) share one deadline; the
 * io_context is run for at most the probe timeout, so a probe can never hold
 * its worker longer than that regardless of how the remote end behaves.
 */

#include <watchman/core/probe/http_probe_client.hpp>
#include <watchman/core/probe/endpoint.hpp>
#include <watchman/core/utils/clock.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <functional>
#include <memory>

namespace Watchman {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace {

using Deadline = std::chrono::steady_clock::time_point;

struct HttpReply {
    unsigned status = 0;
    std::string body;
};

using ReplyHandler = std::function<void(beast::error_code, HttpReply)>;

/**
 * One GET over a fresh connection ("Connection: close").
 * Keeps itself alive through the handlers it hands to Beast.
 */
class HttpFetch : public std::enable_shared_from_this<HttpFetch> {
public:
    HttpFetch(asio::io_context& ioc, Deadline deadline)
        : stream_(ioc), deadline_(deadline) {}

    void get(const tcp::resolver::results_type& addresses,
             const HttpEndpoint& endpoint,
             const std::string& path,
             const std::string& userAgent,
             ReplyHandler done) {
        done_ = std::move(done);

        req_.version(11);
        req_.method(http::verb::get);
        req_.target(endpoint.path(path));
        req_.set(http::field::host, endpoint.hostHeader());
        req_.set(http::field::user_agent, userAgent);
        req_.set(http::field::accept, "application/json");
        req_.keep_alive(false);

        stream_.expires_at(deadline_);
        stream_.async_connect(addresses,
            [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                self->onConnect(ec);
            });
    }

private:
    void onConnect(beast::error_code ec) {
        if (ec) return done_(ec, {});

        stream_.expires_at(deadline_);
        http::async_write(stream_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        if (ec) return done_(ec, {});

        stream_.expires_at(deadline_);
        http::async_read(stream_, buffer_, res_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);  // peer may already be gone

        if (ec) return done_(ec, {});

        HttpReply reply;
        reply.status = res_.result_int();
        reply.body = std::move(res_.body());
        done_({}, std::move(reply));
    }

    beast::tcp_stream stream_;
    Deadline deadline_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    http::response<http::string_body> res_;
    ReplyHandler done_;
};

bool isHttpProtocolError(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_version).category();
}

ProbeResult transportFailure(const DeploymentTarget& target, const beast::error_code& ec,
                             const std::string& step) {
    if (ec == beast::error::timeout) {
        return ProbeResult::timeout(target, step + " timed out");
    }
    if (ec == http::error::end_of_stream || ec == http::error::partial_message) {
        return ProbeResult::unreachable(target, step + ": connection closed before a response");
    }
    if (isHttpProtocolError(ec)) {
        return ProbeResult::unhealthy(target, step + ": malformed HTTP response (" + ec.message() + ")");
    }
    return ProbeResult::unreachable(target, step + ": " + ec.message());
}

bool isSuccessStatus(unsigned status) {
    return status >= 200 && status < 300;
}

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

void collectLabels(const json& obj, std::map<std::string, std::string>& labels) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it->is_structured()) continue;
        labels[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
    }
}

} // namespace

HttpProbeClient::HttpProbeClient(HttpProbeSettings settings)
    : settings_(std::move(settings)) {
}

std::optional<ModelMetadata> HttpProbeClient::parseMetadata(const std::string& body) {
    json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    ModelMetadata md;
    md.project = stringField(doc, "project-name");
    md.model_version = stringField(doc, "model-version");

    auto inner = doc.find("metadata");
    if (inner != doc.end() && inner->is_object()) {
        if (md.project.empty()) md.project = stringField(*inner, "project-name");
        if (md.model_version.empty()) md.model_version = stringField(*inner, "model-version");

        auto userDefined = inner->find("user-defined");
        if (userDefined != inner->end() && userDefined->is_object()) {
            collectLabels(*userDefined, md.labels);
        }
    }

    auto labels = doc.find("labels");
    if (labels != doc.end() && labels->is_object()) {
        collectLabels(*labels, md.labels);
    }
    md.document = std::move(doc);
    return md;
}

std::optional<std::string> HttpProbeClient::degradedReason(const std::string& body) {
    json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;   // plain-text "ok" bodies are fine
    }

    std::string status = stringField(doc, "status");
    std::string message = stringField(doc, "message");

    auto healthy = doc.find("healthy");
    bool reportsUnhealthy = healthy != doc.end() && healthy->is_boolean() && !healthy->get<bool>();
    if (!reportsUnhealthy && (status == "unhealthy" || status == "degraded")) {
        reportsUnhealthy = true;
    }
    if (!reportsUnhealthy) {
        return std::nullopt;
    }

    if (!message.empty()) return "instance reports unhealthy: " + message;
    if (!status.empty()) return "instance reports status '" + status + "'";
    return std::string("instance reports unhealthy");
}

ProbeResult HttpProbeClient::probe(const DeploymentTarget& target,
                                   std::chrono::milliseconds timeout) {
    const uint64_t started = Clock::now_ms();
    auto stamp = [started](ProbeResult r) {
        r.latency_ms = Clock::now_ms() - started;
        return r;
    };

    try {
        const auto endpoint = parseEndpoint(target.endpoint);
        if (!endpoint) {
            return stamp(ProbeResult::unreachable(target, "invalid endpoint: " + target.endpoint));
        }

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        const Deadline deadline = std::chrono::steady_clock::now() + timeout;
        const bool metadataRequired = !target.expected.empty();

        std::optional<ProbeResult> result;
        // Set once the healthcheck passed and metadata is only best-effort
        std::optional<ProbeResult> healthyFallback;
        tcp::resolver::results_type addresses;

        ReplyHandler onMetadata = [&](beast::error_code ec, HttpReply reply) {
            if (ec) {
                result = metadataRequired ? transportFailure(target, ec, "metadata")
                                          : ProbeResult::healthy(target);
                return;
            }
            if (!isSuccessStatus(reply.status)) {
                result = metadataRequired
                    ? ProbeResult::unhealthy(target, "metadata returned HTTP " + std::to_string(reply.status))
                    : ProbeResult::healthy(target);
                return;
            }

            auto reported = parseMetadata(reply.body);
            if (!reported) {
                result = metadataRequired
                    ? ProbeResult::unhealthy(target, "malformed metadata response")
                    : ProbeResult::healthy(target);
                return;
            }
            if (metadataRequired) {
                if (auto mismatch = describeMismatch(target.expected, *reported)) {
                    result = ProbeResult::unhealthy(target, *mismatch, reported);
                    return;
                }
            }
            result = ProbeResult::healthy(target, reported);
        };

        ReplyHandler onHealthcheck = [&](beast::error_code ec, HttpReply reply) {
            if (ec) {
                result = transportFailure(target, ec, "healthcheck");
                return;
            }
            if (reply.status == 404) {
                result = ProbeResult::unreachable(target, "no model served at endpoint (HTTP 404)");
                return;
            }
            if (!isSuccessStatus(reply.status)) {
                result = ProbeResult::unhealthy(target, "healthcheck returned HTTP " + std::to_string(reply.status));
                return;
            }
            if (auto degraded = degradedReason(reply.body)) {
                result = ProbeResult::unhealthy(target, *degraded);
                return;
            }
            if (!metadataRequired) {
                healthyFallback = ProbeResult::healthy(target);
            }
            std::make_shared<HttpFetch>(ioc, deadline)
                ->get(addresses, *endpoint, settings_.metadata_path, settings_.user_agent, onMetadata);
        };

        resolver.async_resolve(endpoint->host, std::to_string(endpoint->port),
            [&](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    result = ProbeResult::unreachable(target, "cannot resolve '" + endpoint->host + "': " + ec.message());
                    return;
                }
                addresses = std::move(results);
                std::make_shared<HttpFetch>(ioc, deadline)
                    ->get(addresses, *endpoint, settings_.healthcheck_path, settings_.user_agent, onHealthcheck);
            });

        ioc.run_for(timeout);

        if (!result) {
            resolver.cancel();
            ioc.stop();
            if (healthyFallback) {
                spdlog::debug("[HttpProbeClient] Metadata of '{}' not fetched within {}ms, healthcheck passed",
                              target.name, timeout.count());
                return stamp(std::move(*healthyFallback));
            }
            return stamp(ProbeResult::timeout(target, "no answer within " + std::to_string(timeout.count()) + "ms"));
        }
        return stamp(std::move(*result));
    } catch (const std::exception& e) {
        spdlog::debug("[HttpProbeClient] Probe of '{}' raised: {}", target.name, e.what());
        return stamp(ProbeResult::unreachable(target, std::string("probe error: ") + e.what()));
    }
}

} // namespace Watchman
