#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "../core/test_base.hpp"
#include "optwatch/scheduling/sliced_sleep.hpp"
#include "optwatch/scheduling/turn_coordinator.hpp"

using namespace optwatch;
using namespace optwatch::testing;
using namespace std::chrono_literals;

class TurnCoordinatorTest : public TestBase {
protected:
    static TurnTimings fast_timings() {
        TurnTimings timings;
        timings.min_api_interval = 50ms;
        timings.poll_interval = 5ms;
        timings.max_wait_cycles = 4;
        return timings;
    }
};

TEST_F(TurnCoordinatorTest, FirstRegistrantOwnsTheTurn) {
    TurnCoordinator coordinator(fast_timings());
    EXPECT_EQ(coordinator.register_market(Market::HK), 1u);
    EXPECT_EQ(coordinator.register_market(Market::US), 2u);
    EXPECT_EQ(coordinator.register_market(Market::HK), 1u);

    EXPECT_EQ(coordinator.active_count(), 2u);
    ASSERT_TRUE(coordinator.current_turn().has_value());
    EXPECT_EQ(*coordinator.current_turn(), Market::HK);
    EXPECT_EQ(coordinator.active_markets(), (std::vector<Market>{Market::HK, Market::US}));
}

TEST_F(TurnCoordinatorTest, RegistrationPositionFollowsArrivalNotCallerOrder) {
    TurnCoordinator coordinator(fast_timings());
    {
        MarketRegistration us(coordinator, Market::US);
        MarketRegistration hk(coordinator, Market::HK);
        EXPECT_EQ(us.position(), 1u);
        EXPECT_EQ(hk.position(), 2u);
        EXPECT_EQ(*coordinator.current_turn(), Market::US);
    }
    EXPECT_EQ(coordinator.active_count(), 0u);

    MarketRegistration hk(coordinator, Market::HK);
    EXPECT_EQ(hk.position(), 1u);
    EXPECT_EQ(*coordinator.current_turn(), Market::HK);
}

TEST_F(TurnCoordinatorTest, ReleaseRotatesTurn) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    coordinator.register_market(Market::US);

    ASSERT_EQ(coordinator.acquire_turn(Market::HK), TurnOutcome::ACQUIRED);
    EXPECT_EQ(*coordinator.token_holder(), Market::HK);
    EXPECT_TRUE(coordinator.release(Market::HK));
    EXPECT_FALSE(coordinator.token_holder().has_value());
    EXPECT_EQ(*coordinator.current_turn(), Market::US);

    ASSERT_EQ(coordinator.acquire_turn(Market::US), TurnOutcome::ACQUIRED);
    EXPECT_TRUE(coordinator.release(Market::US));
    EXPECT_EQ(*coordinator.current_turn(), Market::HK);
}

TEST_F(TurnCoordinatorTest, WaitingOutOfTurnTimesOut) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    coordinator.register_market(Market::US);

    EXPECT_EQ(coordinator.acquire_turn(Market::US), TurnOutcome::TIMED_OUT);
    EXPECT_FALSE(coordinator.token_holder().has_value());
}

TEST_F(TurnCoordinatorTest, WaiterWakesWhenTurnPasses) {
    TurnTimings timings = fast_timings();
    timings.max_wait_cycles = 400;
    TurnCoordinator coordinator(timings);
    coordinator.register_market(Market::HK);
    coordinator.register_market(Market::US);
    ASSERT_EQ(coordinator.acquire_turn(Market::HK), TurnOutcome::ACQUIRED);

    std::atomic<int> outcome{-1};
    std::thread waiter([&] { outcome = static_cast<int>(coordinator.acquire_turn(Market::US)); });
    std::this_thread::sleep_for(20ms);
    coordinator.release(Market::HK);
    waiter.join();

    EXPECT_EQ(outcome.load(), static_cast<int>(TurnOutcome::ACQUIRED));
    EXPECT_EQ(*coordinator.token_holder(), Market::US);
}

TEST_F(TurnCoordinatorTest, SingleMarketNeverWaitsForTurn) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::US);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(coordinator.acquire_turn(Market::US), TurnOutcome::ACQUIRED);
        EXPECT_TRUE(coordinator.release(Market::US));
    }
    EXPECT_EQ(*coordinator.current_turn(), Market::US);
}

TEST_F(TurnCoordinatorTest, UnregisteringTurnOwnerPassesTurnAndToken) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    coordinator.register_market(Market::US);
    ASSERT_EQ(coordinator.acquire_turn(Market::HK), TurnOutcome::ACQUIRED);

    coordinator.unregister_market(Market::HK);

    EXPECT_FALSE(coordinator.is_registered(Market::HK));
    EXPECT_FALSE(coordinator.token_holder().has_value());
    EXPECT_EQ(*coordinator.current_turn(), Market::US);
    EXPECT_EQ(coordinator.acquire_turn(Market::US), TurnOutcome::ACQUIRED);
}

TEST_F(TurnCoordinatorTest, UnregisteredMarketCannotAcquire) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    EXPECT_EQ(coordinator.acquire_turn(Market::US), TurnOutcome::TIMED_OUT);
}

TEST_F(TurnCoordinatorTest, ReleaseWithoutTokenIsRejected) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    EXPECT_FALSE(coordinator.release(Market::HK));
}

TEST_F(TurnCoordinatorTest, YieldPassesUnusedTurn) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    EXPECT_FALSE(coordinator.yield_turn(Market::HK));

    coordinator.register_market(Market::US);
    EXPECT_FALSE(coordinator.yield_turn(Market::US));
    EXPECT_TRUE(coordinator.yield_turn(Market::HK));
    EXPECT_EQ(*coordinator.current_turn(), Market::US);
}

TEST_F(TurnCoordinatorTest, StoppedFlagEndsWait) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    coordinator.register_market(Market::US);

    std::atomic<bool> running{false};
    EXPECT_EQ(coordinator.acquire_turn(Market::US, &running), TurnOutcome::STOPPED);
}

TEST_F(TurnCoordinatorTest, CooldownFollowsRelease) {
    TurnCoordinator coordinator(fast_timings());
    coordinator.register_market(Market::HK);
    EXPECT_EQ(coordinator.cooldown_remaining(Market::HK), 0ms);

    ASSERT_EQ(coordinator.acquire_turn(Market::HK), TurnOutcome::ACQUIRED);
    coordinator.release(Market::HK);
    auto remaining = coordinator.cooldown_remaining(Market::HK);
    EXPECT_GT(remaining, 0ms);
    EXPECT_LE(remaining, 50ms);

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(coordinator.cooldown_remaining(Market::HK), 0ms);
}

TEST_F(TurnCoordinatorTest, LeaseReleasesOnScopeExit) {
    TurnCoordinator coordinator(fast_timings());
    {
        MarketRegistration hk(coordinator, Market::HK);
        MarketRegistration us(coordinator, Market::US);
        ASSERT_EQ(coordinator.acquire_turn(Market::HK), TurnOutcome::ACQUIRED);
        {
            TurnLease lease(coordinator, Market::HK);
        }
        EXPECT_FALSE(coordinator.token_holder().has_value());
        EXPECT_EQ(*coordinator.current_turn(), Market::US);
    }
    EXPECT_EQ(coordinator.active_count(), 0u);
    EXPECT_FALSE(coordinator.current_turn().has_value());
}

TEST_F(TurnCoordinatorTest, SlicedSleepStopsEarly) {
    std::atomic<bool> running{true};
    EXPECT_TRUE(sleep_while_running(10ms, &running, 2ms));

    running = false;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(sleep_while_running(5s, &running));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
