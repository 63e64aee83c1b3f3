#include <gtest/gtest.h>
#include "optwatch/classify/strike_window.hpp"

using namespace optwatch;

namespace {
std::vector<ChainEntry> ladder(std::initializer_list<double> strikes) {
    std::vector<ChainEntry> chain;
    for (double strike : strikes) {
        chain.push_back(ChainEntry{"HK.TCH250919C" + std::to_string(static_cast<int>(strike)),
                                   strike});
    }
    return chain;
}
}  // namespace

TEST(StrikeWindowTest, KeepsStrikesWithinFraction) {
    auto chain = ladder({200, 300, 380, 400, 420, 500, 550, 600});
    StrikeSelection selection = StrikeWindow::select(chain, 400.0, 0.4);

    EXPECT_FALSE(selection.widened);
    EXPECT_DOUBLE_EQ(selection.lower, 240.0);
    EXPECT_DOUBLE_EQ(selection.upper, 560.0);
    ASSERT_EQ(selection.entries.size(), 6u);
    EXPECT_DOUBLE_EQ(selection.entries.front().strike_price, 300.0);
    EXPECT_DOUBLE_EQ(selection.entries.back().strike_price, 550.0);
}

TEST(StrikeWindowTest, SingleStrikeInsideFortyPercent) {
    auto chain = ladder({50, 90, 150});
    StrikeSelection selection = StrikeWindow::select(chain, 100.0, 0.4);
    ASSERT_EQ(selection.entries.size(), 1u);
    EXPECT_DOUBLE_EQ(selection.entries[0].strike_price, 90.0);
    EXPECT_FALSE(selection.widened);
}

TEST(StrikeWindowTest, BoundsAreInclusive) {
    auto chain = ladder({49, 50, 150, 151});
    StrikeSelection selection = StrikeWindow::select(chain, 100.0, 0.5);
    ASSERT_EQ(selection.entries.size(), 2u);
    EXPECT_DOUBLE_EQ(selection.entries[0].strike_price, 50.0);
    EXPECT_DOUBLE_EQ(selection.entries[1].strike_price, 150.0);
}

TEST(StrikeWindowTest, WidensAndKeepsClosestFive) {
    // Nothing within +-10% of 100, eight strikes within +-15%
    auto chain = ladder({86, 87, 88, 89, 111, 112, 113, 114, 200});
    StrikeSelection selection = StrikeWindow::select(chain, 100.0, 0.1);

    EXPECT_TRUE(selection.widened);
    EXPECT_NEAR(selection.lower, 85.0, 1e-9);
    EXPECT_NEAR(selection.upper, 115.0, 1e-9);
    ASSERT_EQ(selection.entries.size(), StrikeWindow::kFallbackCount);
    EXPECT_DOUBLE_EQ(selection.entries[0].strike_price, 89.0);
    EXPECT_DOUBLE_EQ(selection.entries[1].strike_price, 111.0);
    EXPECT_DOUBLE_EQ(selection.entries[2].strike_price, 88.0);
    EXPECT_DOUBLE_EQ(selection.entries[3].strike_price, 112.0);
    EXPECT_DOUBLE_EQ(selection.entries[4].strike_price, 87.0);
}

TEST(StrikeWindowTest, EmptyWhenNothingNearby) {
    auto chain = ladder({10, 1000});
    StrikeSelection selection = StrikeWindow::select(chain, 100.0, 0.1);
    EXPECT_TRUE(selection.widened);
    EXPECT_TRUE(selection.entries.empty());
}

TEST(StrikeWindowTest, NoPriceSelectsNothing) {
    auto chain = ladder({100});
    EXPECT_TRUE(StrikeWindow::select(chain, 0.0, 0.4).entries.empty());
    EXPECT_TRUE(StrikeWindow::select({}, 100.0, 0.4).entries.empty());
}
