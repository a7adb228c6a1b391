#include <gtest/gtest.h>

#include <stdexcept>

#include "arbscan/types.hpp"

using namespace arbscan;

TEST(TypesTest, FormatsIso8601InUtc) {
    EXPECT_EQ(to_iso8601(from_epoch_ms(0)), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(to_iso8601(from_epoch_ms(1714566600125)), "2024-05-01T12:30:00.125Z");
    EXPECT_EQ(to_iso8601(from_epoch_ms(-1000)), "1969-12-31T23:59:59.000Z");
}

TEST(TypesTest, DateKeyIsUtcDay) {
    EXPECT_EQ(date_key(from_epoch_ms(1714566600125)), "2024-05-01");
    // One millisecond before midnight stays on the same day
    EXPECT_EQ(date_key(from_epoch_ms(1714608000000 - 1)), "2024-05-01");
    EXPECT_EQ(date_key(from_epoch_ms(1714608000000)), "2024-05-02");
}

TEST(TypesTest, UtcHourOfDay) {
    EXPECT_EQ(utc_hour(from_epoch_ms(0)), 0);
    EXPECT_EQ(utc_hour(from_epoch_ms(1714566600125)), 12);
    EXPECT_EQ(utc_hour(from_epoch_ms(1714608000000 - 1)), 23);
    EXPECT_EQ(utc_hour(from_epoch_ms(-1)), 23);
}

TEST(TypesTest, ValidatesDateKeys) {
    EXPECT_TRUE(is_valid_date_key("2024-05-01"));
    EXPECT_TRUE(is_valid_date_key("2024-02-29"));
    EXPECT_FALSE(is_valid_date_key("2023-02-29"));
    EXPECT_FALSE(is_valid_date_key("2024-13-01"));
    EXPECT_FALSE(is_valid_date_key("2024-00-10"));
    EXPECT_FALSE(is_valid_date_key("2024-04-31"));
    EXPECT_FALSE(is_valid_date_key("2024-5-01"));
    EXPECT_FALSE(is_valid_date_key("20240501"));
    EXPECT_FALSE(is_valid_date_key("2024/05/01"));
    EXPECT_FALSE(is_valid_date_key(""));
}

TEST(TypesTest, EnumNamesRoundTrip) {
    EXPECT_EQ(parse_direction(to_string(Direction::BuyASellB)), Direction::BuyASellB);
    EXPECT_EQ(parse_direction(to_string(Direction::BuyBSellA)), Direction::BuyBSellA);
    EXPECT_EQ(parse_transport(to_string(Transport::Rest)), Transport::Rest);
    EXPECT_EQ(parse_transport(to_string(Transport::Stream)), Transport::Stream);
    EXPECT_EQ(parse_exchange("Binance"), ExchangeId::Binance);

    EXPECT_STREQ(to_string(Direction::BuyBSellA), "BUY_B_SELL_A");
    EXPECT_THROW(parse_direction("BUY_HL_SELL_BN"), std::invalid_argument);
    EXPECT_THROW(parse_transport("WEBSOCKET"), std::invalid_argument);
}
