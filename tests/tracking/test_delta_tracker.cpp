#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../mocks/test_doubles.hpp"
#include "optwatch/tracking/delta_tracker.hpp"

using namespace optwatch;
using namespace optwatch::testing;

namespace {

OptionSnapshot snapshot(const std::string& code, Count volume, Count open_interest = 0,
                        Count net_open_interest = 0) {
    OptionSnapshot row;
    row.option_code = code;
    row.volume = volume;
    row.open_interest = open_interest;
    row.net_open_interest = net_open_interest;
    return row;
}

}  // namespace

class DeltaTrackerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<InMemoryTradeStore>();
        day = "2025-09-01";
    }

    DeltaTracker make_tracker() {
        return DeltaTracker(store, [this] { return day; });
    }

    std::shared_ptr<InMemoryTradeStore> store;
    std::string day;
};

TEST_F(DeltaTrackerTest, FirstObservationDeltaIsFullVolume) {
    DeltaTracker tracker = make_tracker();
    DeltaSet deltas = tracker.compute(snapshot("HK.TCH250919C650000", 120, 400, 30));

    EXPECT_EQ(deltas.previous_volume, 0);
    EXPECT_EQ(deltas.volume_delta, 120);
    EXPECT_EQ(deltas.open_interest_delta, 400);
    EXPECT_EQ(deltas.net_open_interest_delta, 30);
}

TEST_F(DeltaTrackerTest, DeltaAgainstRecordedObservation) {
    DeltaTracker tracker = make_tracker();
    tracker.compute(snapshot("HK.TCH250919C650000", 120, 400, 30));
    tracker.record_current("HK.TCH250919C650000", 120, 400, 30);

    DeltaSet deltas = tracker.compute(snapshot("HK.TCH250919C650000", 200, 380, 45));
    EXPECT_EQ(deltas.previous_volume, 120);
    EXPECT_EQ(deltas.volume_delta, 80);
    EXPECT_EQ(deltas.open_interest_delta, -20);
    EXPECT_EQ(deltas.net_open_interest_delta, 15);
}

TEST_F(DeltaTrackerTest, HydratesFromStoreOnce) {
    store->volumes[day]["HK.TCH250919C650000"] = 90;
    store->open_interest[day]["HK.TCH250919C650000"] = OpenInterestPair{300, 10};
    DeltaTracker tracker = make_tracker();

    DeltaSet deltas = tracker.compute(snapshot("HK.TCH250919C650000", 150, 320, 12));
    EXPECT_EQ(deltas.volume_delta, 60);
    EXPECT_EQ(deltas.open_interest_delta, 20);
    EXPECT_EQ(deltas.net_open_interest_delta, 2);

    tracker.compute(snapshot("HK.TCH250919C650000", 150));
    EXPECT_EQ(store->volume_reads, 1u);
    EXPECT_EQ(store->open_interest_reads, 1u);
}

TEST_F(DeltaTrackerTest, RecordedVolumeNeverDecreases) {
    DeltaTracker tracker = make_tracker();
    tracker.record_current("US.AAPL250117C150000", 500, 0, 0);
    tracker.record_current("US.AAPL250117C150000", 300, 0, 0);

    EXPECT_EQ(tracker.get_previous_volume("US.AAPL250117C150000", 300), 500);
    DeltaSet deltas = tracker.compute(snapshot("US.AAPL250117C150000", 300));
    EXPECT_EQ(deltas.volume_delta, -200);
}

TEST_F(DeltaTrackerTest, StoreFailureFallsBackToZero) {
    store->fail_reads = true;
    DeltaTracker tracker = make_tracker();

    DeltaSet deltas = tracker.compute(snapshot("HK.TCH250919C650000", 70, 10, 1));
    EXPECT_EQ(deltas.previous_volume, 0);
    EXPECT_EQ(deltas.volume_delta, 70);
    EXPECT_EQ(deltas.open_interest_delta, 10);
}

TEST_F(DeltaTrackerTest, WorksWithoutStore) {
    DeltaTracker tracker(nullptr, [] { return std::string("2025-09-01"); });
    EXPECT_EQ(tracker.compute(snapshot("HK.X", 5)).volume_delta, 5);
    EXPECT_EQ(tracker.warm_up(), 0u);
}

TEST_F(DeltaTrackerTest, NewTradingDayClearsCache) {
    DeltaTracker tracker = make_tracker();
    tracker.record_current("HK.TCH250919C650000", 400, 0, 0);
    EXPECT_EQ(tracker.cached_instruments(), 1u);

    day = "2025-09-02";
    EXPECT_EQ(tracker.trading_day(), "2025-09-02");
    EXPECT_EQ(tracker.cached_instruments(), 0u);
    EXPECT_EQ(tracker.compute(snapshot("HK.TCH250919C650000", 20)).volume_delta, 20);
}

TEST_F(DeltaTrackerTest, WarmUpLoadsTodaysVolumesOncePerDay) {
    store->volumes[day]["HK.A"] = 10;
    store->volumes[day]["HK.B"] = 20;
    store->volumes["2025-08-29"]["HK.C"] = 30;
    DeltaTracker tracker = make_tracker();

    EXPECT_EQ(tracker.warm_up(), 2u);
    EXPECT_EQ(tracker.warm_up(), 0u);
    EXPECT_EQ(tracker.get_previous_volume("HK.B", 25), 20);
    EXPECT_EQ(store->volume_reads, 0u);
}

TEST_F(DeltaTrackerTest, RequiresDaySupplier) {
    EXPECT_THROW(DeltaTracker(store, DeltaTracker::DayKeySupplier()), std::invalid_argument);
}
