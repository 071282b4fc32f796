#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/util/Clock.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace proxyrot::health {
namespace {

using namespace std::chrono_literals;

class CircuitBreakerTrackerTest : public ::testing::Test {
protected:
    util::ManualClock clock;
    CircuitBreakerTracker tracker{CircuitBreakerConfig{}, clock};

    void fail(const std::string& id, int times) {
        for (int i = 0; i < times; ++i) {
            tracker.reportOutcome(id, false);
        }
    }
};

TEST_F(CircuitBreakerTrackerTest, UnknownProxyIsClosed) {
    EXPECT_FALSE(tracker.isOpen("p1"));
    auto state = tracker.getState("p1");
    EXPECT_EQ(state.state, BreakerState::closed);
    EXPECT_EQ(state.failureCount, 0u);
}

TEST_F(CircuitBreakerTrackerTest, OpensAtThreshold) {
    fail("p1", 4);
    EXPECT_FALSE(tracker.isOpen("p1"));
    EXPECT_EQ(tracker.getState("p1").failureCount, 4u);

    fail("p1", 1);
    EXPECT_TRUE(tracker.isOpen("p1"));
    auto state = tracker.getState("p1");
    EXPECT_EQ(state.state, BreakerState::open);
    EXPECT_TRUE(state.openedAt.has_value());
}

TEST_F(CircuitBreakerTrackerTest, SuccessesDoNotResetFailuresInsideWindow) {
    fail("p1", 3);
    tracker.reportOutcome("p1", true);
    fail("p1", 2);
    EXPECT_TRUE(tracker.isOpen("p1"));
}

TEST_F(CircuitBreakerTrackerTest, FailuresOlderThanWindowAreForgotten) {
    fail("p1", 4);
    clock.advance(61s);
    fail("p1", 1);
    EXPECT_FALSE(tracker.isOpen("p1"));
    EXPECT_EQ(tracker.getState("p1").failureCount, 1u);
}

TEST_F(CircuitBreakerTrackerTest, WindowSlidesWithEachFailure) {
    // Failures at 0s, 50s, 70s, 80s, 90s and 100s: the last five share one 60s window.
    fail("p1", 1);
    clock.advance(50s);
    fail("p1", 1);
    clock.advance(20s);
    fail("p1", 1);
    EXPECT_EQ(tracker.getState("p1").failureCount, 2u);
    clock.advance(10s);
    fail("p1", 1);
    clock.advance(10s);
    fail("p1", 1);
    EXPECT_FALSE(tracker.isOpen("p1"));
    clock.advance(10s);
    fail("p1", 1);
    auto state = tracker.getState("p1");
    EXPECT_EQ(state.state, BreakerState::open);
    EXPECT_EQ(state.failureCount, 5u);
}

TEST_F(CircuitBreakerTrackerTest, CooldownMovesToHalfOpenThenSuccessCloses) {
    fail("p1", 5);
    clock.advance(29s);
    EXPECT_TRUE(tracker.isOpen("p1"));

    clock.advance(1s);
    EXPECT_FALSE(tracker.isOpen("p1"));
    EXPECT_EQ(tracker.getState("p1").state, BreakerState::halfOpen);

    tracker.reportOutcome("p1", true);
    auto state = tracker.getState("p1");
    EXPECT_EQ(state.state, BreakerState::closed);
    EXPECT_EQ(state.failureCount, 0u);
    EXPECT_FALSE(state.openedAt.has_value());
}

TEST_F(CircuitBreakerTrackerTest, HalfOpenFailureReopens) {
    fail("p1", 5);
    clock.advance(30s);
    ASSERT_EQ(tracker.getState("p1").state, BreakerState::halfOpen);

    tracker.reportOutcome("p1", false);
    auto state = tracker.getState("p1");
    EXPECT_EQ(state.state, BreakerState::open);
    EXPECT_EQ(*state.openedAt, clock.now());
}

TEST_F(CircuitBreakerTrackerTest, ReportsWhileOpenAreDropped) {
    fail("p1", 5);
    tracker.reportOutcome("p1", true);
    EXPECT_TRUE(tracker.isOpen("p1"));
}

TEST(CircuitBreakerConfigTest, SeveralSuccessesNeededToClose) {
    util::ManualClock clock;
    CircuitBreakerConfig config;
    config.failureThreshold = 2;
    config.successesToClose = 3;
    CircuitBreakerTracker tracker(config, clock);

    tracker.reportOutcome("p1", false);
    tracker.reportOutcome("p1", false);
    clock.advance(config.cooldown);
    tracker.reportOutcome("p1", true);
    tracker.reportOutcome("p1", true);
    EXPECT_EQ(tracker.getState("p1").state, BreakerState::halfOpen);
    EXPECT_EQ(tracker.getState("p1").halfOpenSuccesses, 2u);
    tracker.reportOutcome("p1", true);
    EXPECT_EQ(tracker.getState("p1").state, BreakerState::closed);
}

TEST_F(CircuitBreakerTrackerTest, EmptyProxyIdIsIgnored) {
    tracker.reportOutcome("", false);
    EXPECT_TRUE(tracker.snapshot().empty());
}

TEST_F(CircuitBreakerTrackerTest, SnapshotIsSortedAndResetForgets) {
    fail("b", 5);
    tracker.reportOutcome("a", false);
    auto all = tracker.snapshot();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].proxyId, "a");
    EXPECT_EQ(all[1].proxyId, "b");
    EXPECT_EQ(all[1].state, BreakerState::open);

    tracker.reset("b");
    EXPECT_FALSE(tracker.isOpen("b"));
    tracker.clear();
    EXPECT_TRUE(tracker.snapshot().empty());
}

TEST_F(CircuitBreakerTrackerTest, ConcurrentReportsOnDistinctProxies) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t]() {
            const auto id = "p" + std::to_string(t);
            for (int i = 0; i < 5; ++i) {
                tracker.reportOutcome(id, false);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& breaker : tracker.snapshot()) {
        EXPECT_EQ(breaker.state, BreakerState::open) << breaker.proxyId;
    }
    EXPECT_EQ(tracker.snapshot().size(), 8u);
}

} // namespace
} // namespace proxyrot::health
