// ============================================================================
// HTTP ROUTER UNIT TESTS
// ============================================================================
// Route table, status codes and JSON bodies, without a socket
// ============================================================================

#include <gtest/gtest.h>
#include <watchman/api/http_router.hpp>
#include <watchman/core/reconciler/state_reconciler.hpp>
#include <watchman/core/utils/clock.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

using namespace Watchman;
using namespace watchman::api;
using nlohmann::json;
using watchman::microservice::HealthService;

namespace {

Request makeRequest(http::verb method, const std::string& target, const std::string& body = "") {
    Request req{method, target, 11};
    req.set(http::field::host, "watchman");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

class HttpRouterTest : public ::testing::Test {
protected:
    HttpRouterTest()
        : reconciler_(registry_, store_, ReconcilePolicy{3}),
          api_(registry_, store_, ProjectInfo{"proj", "7"}),
          router_(api_, &health_) {}

    Response call(http::verb method, const std::string& target, const std::string& body = "") {
        return router_.route(makeRequest(method, target, body));
    }

    void registerTarget(const std::string& name) {
        DeploymentTarget t;
        t.name = name;
        t.endpoint = "http://models:5555/gordo/v0/proj/" + name;
        registry_.registerTarget(t);
    }

    void healthyRound(uint64_t id) {
        Round round;
        round.id = id;
        for (const auto& [name, target] : *registry_.snapshot()) {
            ModelMetadata md;
            md.project = "proj";
            md.model_version = "7";
            ProbeResult r = ProbeResult::healthy(target, md);
            r.round = id;
            round.results.push_back(r);
        }
        round.closed_at_ms = Clock::wall_ms();
        reconciler_.apply(round);
    }

    TargetRegistry registry_;
    StatusStore store_;
    StateReconciler reconciler_;
    StatusApi api_;
    HealthService health_;
    HttpRouter router_;
};

} // namespace

// ============================================================================
// PATH HELPERS
// ============================================================================

TEST(HttpRouterPaths, SplitPathDropsQueryAndEmptySegments) {
    EXPECT_TRUE(splitPath("/").empty());
    EXPECT_EQ(splitPath("/status/"), std::vector<std::string>({"status"}));
    EXPECT_EQ(splitPath("/status/machine-a?pretty=1"), std::vector<std::string>({"status", "machine-a"}));
    EXPECT_EQ(splitPath("//targets//x"), std::vector<std::string>({"targets", "x"}));
}

TEST(HttpRouterPaths, UrlDecode) {
    EXPECT_EQ(urlDecode("machine%2Da"), "machine-a");
    EXPECT_EQ(urlDecode("a%20b"), "a b");
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
}

// ============================================================================
// STATUS
// ============================================================================

TEST_F(HttpRouterTest, ListStatusReturnsArray) {
    registerTarget("a");
    registerTarget("b");
    healthyRound(1);

    auto res = call(http::verb::get, "/status");

    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto body = json::parse(res.body());
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[0]["name"], "a");
    EXPECT_EQ(body[0]["health"], "HEALTHY");
    EXPECT_EQ(body[0]["healthy"], true);
    EXPECT_EQ(body[0]["consecutive-failures"], 0);
    EXPECT_TRUE(body[0]["last-success"].is_string());
    EXPECT_EQ(body[0]["round"], 1);
    EXPECT_EQ(body[0]["reported-metadata"]["model-version"], "7");
}

TEST_F(HttpRouterTest, GetStatusOfUnprobedTargetHasNullTimestamps) {
    registerTarget("fresh");

    auto res = call(http::verb::get, "/status/fresh");

    ASSERT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["health"], "UNKNOWN");
    EXPECT_TRUE(body["last-success"].is_null());
    EXPECT_TRUE(body["last-probe"].is_null());
    EXPECT_TRUE(body["last-outcome"].is_null());
}

TEST_F(HttpRouterTest, GetStatusOfUnknownTargetIs404) {
    auto res = call(http::verb::get, "/status/ghost");

    EXPECT_EQ(res.result(), http::status::not_found);
    auto body = json::parse(res.body());
    EXPECT_NE(body["error"].get<std::string>().find("ghost"), std::string::npos);
}

// ============================================================================
// TARGETS
// ============================================================================

TEST_F(HttpRouterTest, PostTargetRegisters) {
    auto res = call(http::verb::post, "/targets",
                    R"({"name": "m1", "endpoint": "http://host:5555/m1",
                        "metadata": {"project": "proj", "model-version": "2", "labels": {"k": "v"}}})");

    ASSERT_EQ(res.result(), http::status::ok) << res.body();
    auto body = json::parse(res.body());
    EXPECT_EQ(body["name"], "m1");
    EXPECT_EQ(body["metadata"]["model-version"], "2");

    ASSERT_TRUE(registry_.contains("m1"));
    EXPECT_EQ(registry_.snapshot()->at("m1").expected.labels.at("k"), "v");

    // Visible as UNKNOWN before any round
    auto status = call(http::verb::get, "/status/m1");
    EXPECT_EQ(status.result(), http::status::ok);
}

TEST_F(HttpRouterTest, PostTargetRejectsBadBodies) {
    EXPECT_EQ(call(http::verb::post, "/targets", "{not json").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/targets", R"({"name": "x"})").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/targets", R"({"name": 5, "endpoint": "http://h/x"})").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/targets", R"({"name": "x", "endpoint": "nope"})").result(),
              http::status::bad_request);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(HttpRouterTest, DeleteTargetIsIdempotent) {
    registerTarget("a");

    auto first = call(http::verb::delete_, "/targets/a");
    ASSERT_EQ(first.result(), http::status::ok);
    EXPECT_EQ(json::parse(first.body())["removed"], true);

    auto second = call(http::verb::delete_, "/targets/a");
    ASSERT_EQ(second.result(), http::status::ok);
    EXPECT_EQ(json::parse(second.body())["removed"], false);
    EXPECT_EQ(json::parse(second.body())["name"], "a");

    EXPECT_EQ(call(http::verb::get, "/status/a").result(), http::status::not_found);
}

TEST_F(HttpRouterTest, ListTargets) {
    registerTarget("a");

    auto res = call(http::verb::get, "/targets");

    ASSERT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["endpoint"], "http://models:5555/gordo/v0/proj/a");
}

// ============================================================================
// INDEX & HEALTHCHECK
// ============================================================================

TEST_F(HttpRouterTest, IndexListsProjectEndpoints) {
    registerTarget("a");
    healthyRound(1);
    registerTarget("b");

    auto res = call(http::verb::get, "/");

    ASSERT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body());
    EXPECT_EQ(body["project-name"], "proj");
    EXPECT_EQ(body["project-version"], "7");
    ASSERT_EQ(body["endpoints"].size(), 2u);
    EXPECT_EQ(body["endpoints"][0]["target"], "a");
    EXPECT_EQ(body["endpoints"][0]["healthy"], true);
    EXPECT_EQ(body["endpoints"][0]["metadata"]["project"], "proj");
    EXPECT_EQ(body["endpoints"][1]["healthy"], false);
    EXPECT_TRUE(body["endpoints"][1]["metadata"].is_null());
}

TEST_F(HttpRouterTest, IndexCarriesReportedMetadataDocument) {
    registerTarget("machine-a");

    ModelMetadata md;
    md.project = "proj";
    md.document = json::parse(R"({
        "project-name": "proj",
        "model-version": "7",
        "metadata": {
            "user-defined": {"machine-name": "machine-a"},
            "dataset": {"tag_list": ["TAG 1", "TAG 2"], "resolution": "10T"}
        }
    })");
    Round round;
    round.id = 1;
    ProbeResult r = ProbeResult::healthy(registry_.snapshot()->at("machine-a"), md);
    r.round = 1;
    round.results.push_back(r);
    round.closed_at_ms = Clock::wall_ms();
    reconciler_.apply(round);

    auto body = json::parse(call(http::verb::get, "/").body());
    ASSERT_EQ(body["endpoints"].size(), 1u);
    const json& data = body["endpoints"][0];

    // Looked up the way a Gordo client reads the index
    EXPECT_EQ(data["metadata"]["metadata"]["user-defined"]["machine-name"], "machine-a");
    EXPECT_EQ(data["metadata"]["metadata"]["dataset"]["tag_list"].size(), 2u);
    EXPECT_EQ(data["metadata"]["metadata"]["dataset"]["resolution"], "10T");
    EXPECT_EQ(data["healthy"], true);
    EXPECT_EQ(data["endpoint"], "/gordo/v0/proj/machine-a/");
    EXPECT_EQ(data["url"], "http://models:5555/gordo/v0/proj/machine-a");
}

TEST_F(HttpRouterTest, HealthcheckReflectsReadiness) {
    auto before = call(http::verb::get, "/healthcheck");
    EXPECT_EQ(before.result(), http::status::service_unavailable);
    EXPECT_EQ(json::parse(before.body())["status"], "unhealthy");

    health_.record_round(1, Clock::wall_ms(), 2, 1);

    auto after = call(http::verb::get, "/healthcheck");
    ASSERT_EQ(after.result(), http::status::ok);
    auto body = json::parse(after.body());
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["last-round"], 1);
    EXPECT_EQ(body["unhealthy-targets"], 1);
}

TEST_F(HttpRouterTest, StaleRoundsReportDegradedButServe) {
    HealthService health(50);
    HttpRouter router(api_, &health);
    health.record_round(1, Clock::wall_ms(), 1, 0);

    EXPECT_EQ(health.get_health().status, watchman::microservice::HealthStatus::HEALTHY);
    std::this_thread::sleep_for(std::chrono::milliseconds(120));

    EXPECT_EQ(health.get_health().status, watchman::microservice::HealthStatus::DEGRADED);
    auto res = router.route(makeRequest(http::verb::get, "/healthcheck"));
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["status"], "degraded");
}

TEST_F(HttpRouterTest, LivenessAnswersBeforeFirstRound) {
    EXPECT_TRUE(health_.is_alive());
    EXPECT_EQ(call(http::verb::get, "/healthcheck").result(), http::status::service_unavailable);

    auto res = call(http::verb::get, "/healthcheck/live");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["alive"], true);

    EXPECT_EQ(call(http::verb::post, "/healthcheck/live").result(), http::status::method_not_allowed);
    EXPECT_EQ(call(http::verb::get, "/healthcheck/other").result(), http::status::not_found);
}

// ============================================================================
// ROUTING ERRORS
// ============================================================================

TEST_F(HttpRouterTest, UnknownPathIs404) {
    EXPECT_EQ(call(http::verb::get, "/nope").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::get, "/status/a/b").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::get, "/targets/a/b").result(), http::status::not_found);
}

TEST_F(HttpRouterTest, WrongMethodIs405) {
    auto res = call(http::verb::put, "/targets");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, POST");

    EXPECT_EQ(call(http::verb::post, "/status").result(), http::status::method_not_allowed);
    EXPECT_EQ(call(http::verb::get, "/targets/a").result(), http::status::method_not_allowed);
    EXPECT_EQ(call(http::verb::delete_, "/healthcheck").result(), http::status::method_not_allowed);
}

TEST_F(HttpRouterTest, KeepAliveFollowsRequest) {
    Request req = makeRequest(http::verb::get, "/status");
    req.keep_alive(false);
    EXPECT_FALSE(router_.route(req).keep_alive());

    req.keep_alive(true);
    EXPECT_TRUE(router_.route(req).keep_alive());
}
