#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "optwatch/storage/postgres_trade_store.hpp"

using namespace optwatch;

class PostgresTradeStoreTest : public optwatch::testing::TestBase {};

TEST_F(PostgresTradeStoreTest, CallsBeforeConnectFail) {
    PostgresTradeStore store("postgresql://monitor@127.0.0.1:1/hk_options", Market::HK);
    EXPECT_FALSE(store.is_connected());

    TradeEvent event;
    event.snapshot.option_code = "HK.TCH250929C650000";
    auto saved = store.save_trade(event, "2025-09-01");
    ASSERT_TRUE(saved.is_error());
    EXPECT_EQ(saved.error()->code(), ErrorCode::CONNECTION_ERROR);

    EXPECT_TRUE(store.get_previous_volume("HK.TCH250929C650000", "2025-09-01").is_error());
    EXPECT_TRUE(store.get_previous_open_interest("HK.TCH250929C650000", "2025-09-01").is_error());
    EXPECT_TRUE(store.get_today_volumes("2025-09-01").is_error());
    EXPECT_TRUE(store.ensure_schema().is_error());
}

TEST_F(PostgresTradeStoreTest, UnreachableServerIsConnectionError) {
    PostgresTradeStore store("postgresql://monitor@127.0.0.1:1/hk_options?connect_timeout=1",
                             Market::HK);
    auto connected = store.connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_FALSE(store.is_connected());
    EXPECT_TRUE(StateManager::instance().get_state("STORE_HK").is_error());
}
