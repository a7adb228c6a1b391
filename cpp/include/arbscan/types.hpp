#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace arbscan {

// Millisecond wall-clock time, the resolution records are persisted with
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
using Duration = std::chrono::milliseconds;

// Exchange A is Hyperliquid, exchange B is Binance
enum class ExchangeId {
    Hyperliquid,
    Binance
};

enum class Transport {
    Rest,
    Stream
};

enum class Direction {
    BuyASellB,
    BuyBSellA
};

const char* to_string(ExchangeId exchange);
const char* to_string(Transport transport);
const char* to_string(Direction direction);

// Throw std::invalid_argument on unknown names
ExchangeId parse_exchange(const std::string& name);
Transport parse_transport(const std::string& name);
Direction parse_direction(const std::string& name);

inline std::int64_t to_epoch_ms(TimePoint tp) {
    return tp.time_since_epoch().count();
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(Duration(ms));
}

// 2024-05-01T12:30:00.125Z
std::string to_iso8601(TimePoint tp);

// YYYY-MM-DD (UTC) of the given instant
std::string date_key(TimePoint tp);

// Hour of day 0-23 (UTC)
int utc_hour(TimePoint tp);

// True for a well-formed YYYY-MM-DD with a real month/day
bool is_valid_date_key(const std::string& key);

} // namespace arbscan
