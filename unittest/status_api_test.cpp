// ============================================================================
// STATUS API UNIT TESTS
// ============================================================================
// Registry-filtered reads, registration commands and the project index
// ============================================================================

#include <gtest/gtest.h>
#include <watchman/api/status_api.hpp>
#include <watchman/core/errors.hpp>
#include <watchman/core/reconciler/state_reconciler.hpp>

using namespace Watchman;
using watchman::api::StatusApi;
using watchman::api::ProjectInfo;

namespace {

DeploymentTarget makeTarget(const std::string& name) {
    DeploymentTarget t;
    t.name = name;
    t.endpoint = "http://models:5555/gordo/v0/proj/" + name;
    t.expected.project = "proj";
    return t;
}

class StatusApiTest : public ::testing::Test {
protected:
    StatusApiTest()
        : reconciler_(registry_, store_, ReconcilePolicy{1}),
          api_(registry_, store_, ProjectInfo{"proj", "7"}) {}

    // Reconcile one round in which every registered target answered `outcome`
    void reconcile(ProbeOutcome outcome) {
        Round round;
        round.id = ++round_;
        for (const auto& [name, target] : *registry_.snapshot()) {
            ProbeResult r = outcome == ProbeOutcome::HEALTHY
                ? ProbeResult::healthy(target)
                : ProbeResult::unreachable(target, "down");
            r.round = round.id;
            round.results.push_back(r);
        }
        round.closed_at_ms = 1;
        ASSERT_TRUE(reconciler_.apply(round).applied);
    }

    TargetRegistry registry_;
    StatusStore store_;
    StateReconciler reconciler_;
    StatusApi api_;
    uint64_t round_ = 0;
};

} // namespace

// ============================================================================
// READS
// ============================================================================

TEST_F(StatusApiTest, GetStatusOfUnknownNameThrowsNotFound) {
    try {
        api_.getStatus("ghost");
        FAIL() << "expected TargetNotFoundError";
    } catch (const TargetNotFoundError& e) {
        EXPECT_EQ(e.name(), "ghost");
    }
}

TEST_F(StatusApiTest, RegisteredButUnprobedTargetReadsUnknown) {
    api_.registerTarget(makeTarget("fresh"));

    StatusEntry entry = api_.getStatus("fresh");
    EXPECT_EQ(entry.health, HealthState::UNKNOWN);
    EXPECT_EQ(entry.consecutive_failures, 0u);
    EXPECT_EQ(entry.last_success_ms, 0u);
    EXPECT_EQ(entry.endpoint, "http://models:5555/gordo/v0/proj/fresh");

    auto all = api_.listStatus();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "fresh");
}

TEST_F(StatusApiTest, ReadsReflectReconciledState) {
    api_.registerTarget(makeTarget("a"));
    api_.registerTarget(makeTarget("b"));
    reconcile(ProbeOutcome::HEALTHY);

    EXPECT_TRUE(api_.getStatus("a").isHealthy());

    reconcile(ProbeOutcome::UNREACHABLE);
    StatusEntry a = api_.getStatus("a");
    EXPECT_EQ(a.health, HealthState::UNHEALTHY);
    EXPECT_EQ(a.consecutive_failures, 1u);
    EXPECT_EQ(a.last_reason, "down");
    EXPECT_EQ(api_.listStatus().size(), 2u);
}

TEST_F(StatusApiTest, DeregisteredTargetIsNotFoundImmediately) {
    api_.registerTarget(makeTarget("a"));
    api_.registerTarget(makeTarget("b"));
    reconcile(ProbeOutcome::HEALTHY);

    EXPECT_TRUE(api_.deregisterTarget("a"));

    // No round has run since; the store still holds "a"
    EXPECT_TRUE(store_.get("a").has_value());
    EXPECT_THROW(api_.getStatus("a"), TargetNotFoundError);
    auto all = api_.listStatus();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].name, "b");
}

TEST_F(StatusApiTest, ReadsReportTheRegisteredEndpoint) {
    api_.registerTarget(makeTarget("a"));
    reconcile(ProbeOutcome::HEALTHY);

    DeploymentTarget moved = makeTarget("a");
    moved.endpoint = "http://other:5555/gordo/v0/proj/a";
    api_.registerTarget(moved);

    // No round has covered the new endpoint yet
    ASSERT_EQ(store_.get("a")->endpoint, "http://models:5555/gordo/v0/proj/a");
    StatusEntry entry = api_.getStatus("a");
    EXPECT_EQ(entry.endpoint, moved.endpoint);
    EXPECT_EQ(entry.health, HealthState::HEALTHY);
    EXPECT_EQ(api_.listStatus()[0].endpoint, moved.endpoint);
}

// ============================================================================
// COMMANDS
// ============================================================================

TEST_F(StatusApiTest, RegisterReturnsAcceptedTarget) {
    auto accepted = api_.registerTarget(makeTarget("a"));
    EXPECT_EQ(accepted.name, "a");
    EXPECT_EQ(accepted.expected.project, "proj");

    auto targets = api_.listTargets();
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0], accepted);
}

TEST_F(StatusApiTest, RegisterRejectsInvalidTarget) {
    DeploymentTarget bad = makeTarget("a");
    bad.endpoint = "not a url";

    EXPECT_THROW(api_.registerTarget(bad), InvalidTargetError);
    EXPECT_TRUE(api_.listTargets().empty());
}

TEST_F(StatusApiTest, DeregisterIsIdempotent) {
    api_.registerTarget(makeTarget("a"));

    EXPECT_TRUE(api_.deregisterTarget("a"));
    EXPECT_FALSE(api_.deregisterTarget("a"));
    EXPECT_FALSE(api_.deregisterTarget("never"));
}

// ============================================================================
// PROJECT INDEX
// ============================================================================

TEST_F(StatusApiTest, ProjectIndexListsEveryTarget) {
    api_.registerTarget(makeTarget("a"));
    api_.registerTarget(makeTarget("b"));
    reconcile(ProbeOutcome::HEALTHY);
    api_.registerTarget(makeTarget("c"));

    auto index = api_.projectIndex();

    EXPECT_EQ(index.project.name, "proj");
    EXPECT_EQ(index.project.version, "7");
    EXPECT_EQ(index.round, 1u);
    ASSERT_EQ(index.endpoints.size(), 3u);
    EXPECT_EQ(index.endpoints[0].target, "a");
    EXPECT_EQ(index.endpoints[0].health, HealthState::HEALTHY);
    EXPECT_EQ(index.endpoints[0].endpoint, "/gordo/v0/proj/a/");
    EXPECT_EQ(index.endpoints[0].url, "http://models:5555/gordo/v0/proj/a");
    EXPECT_EQ(index.endpoints[2].target, "c");
    EXPECT_EQ(index.endpoints[2].health, HealthState::UNKNOWN);
    EXPECT_FALSE(index.endpoints[2].metadata.has_value());
}
