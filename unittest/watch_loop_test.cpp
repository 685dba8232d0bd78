// ============================================================================
// WATCH LOOP UNIT TESTS
// ============================================================================
// Tick ownership, periodic rounds, prompt shutdown and readiness reporting
// ============================================================================

#include <gtest/gtest.h>
#include <watchman/core/watch/watch_loop.hpp>
#include "fake_probe_client.hpp"

#include <chrono>
#include <thread>

using namespace Watchman;
using namespace std::chrono_literals;
using watchman::microservice::HealthService;

namespace {

class WatchLoopTest : public ::testing::Test {
protected:
    WatchLoopTest()
        : poller_(registry_, client_, settings()),
          reconciler_(registry_, store_, ReconcilePolicy{2}) {
        for (const char* name : {"a", "b"}) {
            DeploymentTarget t;
            t.name = name;
            t.endpoint = std::string("http://models:5555/gordo/v0/proj/") + name;
            registry_.registerTarget(t);
        }
    }

    static PollerSettings settings() {
        PollerSettings s;
        s.probe_timeout = 20ms;
        s.round_deadline = 40ms;
        s.max_in_flight = 2;
        return s;
    }

    TargetRegistry registry_;
    StatusStore store_;
    FakeProbeClient client_;
    ProbePoller poller_;
    StateReconciler reconciler_;
    HealthService health_;
};

} // namespace

TEST_F(WatchLoopTest, RunOnceAppliesRoundAndMarksReady) {
    WatchLoop loop(poller_, reconciler_, 50ms, &health_);
    EXPECT_FALSE(health_.is_ready());

    ApplyReport report = loop.runOnce();

    EXPECT_TRUE(report.applied);
    EXPECT_EQ(report.round, 1u);
    EXPECT_EQ(report.healthy, 2u);
    EXPECT_EQ(loop.roundsApplied(), 1u);
    EXPECT_EQ(store_.round(), 1u);

    EXPECT_TRUE(health_.is_ready());
    auto health = health_.get_health();
    EXPECT_EQ(health.last_round, 1u);
    EXPECT_EQ(health.targets, 2u);
    EXPECT_EQ(health.unhealthy_targets, 0u);
}

TEST_F(WatchLoopTest, DebounceAcrossTicks) {
    client_.script("b", {ProbeOutcome::UNREACHABLE, 0ms, false});
    WatchLoop loop(poller_, reconciler_, 50ms);

    loop.runOnce();
    EXPECT_EQ(store_.get("b")->health, HealthState::UNKNOWN);

    ApplyReport report = loop.runOnce();
    EXPECT_EQ(store_.get("b")->health, HealthState::UNHEALTHY);
    EXPECT_EQ(report.unhealthy, 1u);
    EXPECT_EQ(report.healthy, 1u);
}

TEST_F(WatchLoopTest, StartRunsRoundsPeriodically) {
    WatchLoop loop(poller_, reconciler_, 30ms, &health_);

    loop.start();
    EXPECT_TRUE(loop.isRunning());
    std::this_thread::sleep_for(250ms);
    loop.stop();

    EXPECT_FALSE(loop.isRunning());
    EXPECT_FALSE(health_.is_ready());   // stopped loop no longer serves fresh state
    EXPECT_GE(loop.roundsApplied(), 3u);
    EXPECT_EQ(store_.round(), loop.roundsApplied());
    EXPECT_EQ(client_.calls("a"), static_cast<int>(loop.roundsApplied()));
}

TEST_F(WatchLoopTest, StopInterruptsLongSleep) {
    WatchLoop loop(poller_, reconciler_, std::chrono::milliseconds(60000));

    loop.start();
    std::this_thread::sleep_for(100ms);   // first round runs immediately

    const auto start = std::chrono::steady_clock::now();
    loop.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_EQ(loop.roundsApplied(), 1u);
}

TEST_F(WatchLoopTest, StartAndStopAreIdempotent) {
    WatchLoop loop(poller_, reconciler_, 30ms);

    loop.start();
    loop.start();
    loop.stop();
    loop.stop();

    EXPECT_FALSE(loop.isRunning());
}
