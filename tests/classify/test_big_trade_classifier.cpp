#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "optwatch/classify/big_trade_classifier.hpp"

using namespace optwatch;
using namespace optwatch::testing;

namespace {

TradeEvent make_event(const std::string& code, const std::string& underlying, Market market,
                      Count volume, double turnover, Count volume_delta) {
    TradeEvent event;
    event.market = market;
    event.snapshot.option_code = code;
    event.snapshot.underlying_code = underlying;
    event.snapshot.volume = volume;
    event.snapshot.turnover = turnover;
    event.volume_delta = volume_delta;
    return event;
}

}  // namespace

class BigTradeClassifierTest : public TestBase {
protected:
    Timestamp t0 = std::chrono::system_clock::now();
};

TEST_F(BigTradeClassifierTest, AllThreeThresholdsMustPass) {
    BigTradeClassifier classifier{ThresholdTable{}};

    // HK default: volume >= 10, turnover >= 50000, delta >= 10
    EXPECT_TRUE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 10, 50000.0, 10)));
    EXPECT_FALSE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 9, 90000.0, 10)));
    EXPECT_FALSE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 100, 49999.0, 10)));
    EXPECT_FALSE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 100, 90000.0, 9)));
}

TEST_F(BigTradeClassifierTest, ZeroDeltaFailsEvenWithLargeTotals) {
    ThresholdTable table;
    table.set_rule(RuleKey::HK_DEFAULT, ThresholdRule{500, 10000.0, 1, 0.4});
    BigTradeClassifier classifier{table};

    EXPECT_FALSE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 1000, 50000.0, 0)));
    EXPECT_TRUE(classifier.classify(
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 1000, 50000.0, 1)));
}

TEST_F(BigTradeClassifierTest, IndexUnderlyingsUseTheirOwnRule) {
    BigTradeClassifier classifier{ThresholdTable{}};
    TradeEvent hsi = make_event("HK.HSI250929C24000000", "HK.800000", Market::HK, 200, 400000.0, 60);
    EXPECT_FALSE(classifier.classify(hsi));
    hsi.snapshot.turnover = 500000.0;
    EXPECT_TRUE(classifier.classify(hsi));
}

TEST_F(BigTradeClassifierTest, SelectSortsByTurnoverAndFlags) {
    BigTradeClassifier classifier{ThresholdTable{}};
    std::vector<TradeEvent> events = {
        make_event("US.AAPL250117C150000", "US.AAPL", Market::US, 100, 60000.0, 30),
        make_event("US.AAPL250117P140000", "US.AAPL", Market::US, 5, 900000.0, 5),
        make_event("US.AAPL250117C160000", "US.AAPL", Market::US, 300, 250000.0, 100)};

    std::vector<TradeEvent> big = classifier.select_big_trades(events);

    ASSERT_EQ(big.size(), 2u);
    EXPECT_EQ(big[0].snapshot.option_code, "US.AAPL250117C160000");
    EXPECT_EQ(big[1].snapshot.option_code, "US.AAPL250117C150000");
    EXPECT_TRUE(events[0].is_big_trade);
    EXPECT_FALSE(events[1].is_big_trade);
    EXPECT_TRUE(events[2].is_big_trade);
}

TEST_F(BigTradeClassifierTest, RepeatAnnouncedOnlyAfterVolumeGrows) {
    BigTradeClassifier classifier{ThresholdTable{}};
    TradeEvent event = make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 100, 90000.0, 50);

    EXPECT_TRUE(classifier.should_notify(event, t0));
    EXPECT_FALSE(classifier.should_notify(event, t0 + std::chrono::minutes(2)));

    event.snapshot.volume = 180;
    EXPECT_TRUE(classifier.should_notify(event, t0 + std::chrono::minutes(4)));
    EXPECT_EQ(classifier.notified_instruments(), 1u);
}

TEST_F(BigTradeClassifierTest, CooldownDelaysRepeat) {
    BigTradeClassifier classifier{ThresholdTable{}, std::chrono::seconds(300)};
    TradeEvent event = make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 100, 90000.0, 50);

    ASSERT_TRUE(classifier.should_notify(event, t0));
    event.snapshot.volume = 200;
    EXPECT_FALSE(classifier.should_notify(event, t0 + std::chrono::seconds(120)));
    EXPECT_TRUE(classifier.should_notify(event, t0 + std::chrono::seconds(300)));
}

TEST_F(BigTradeClassifierTest, SelectNotificationsFiltersDuplicates) {
    BigTradeClassifier classifier{ThresholdTable{}};
    std::vector<TradeEvent> big = {
        make_event("HK.TCH250919C650000", "HK.00700", Market::HK, 100, 90000.0, 50),
        make_event("HK.TCH250919P600000", "HK.00700", Market::HK, 80, 150000.0, 40)};

    auto first = classifier.select_notifications(big, t0);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].snapshot.option_code, "HK.TCH250919P600000");

    big[0].snapshot.volume = 130;
    auto second = classifier.select_notifications(big, t0 + std::chrono::minutes(2));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].snapshot.option_code, "HK.TCH250919C650000");
}
