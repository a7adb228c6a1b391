#include "arbscan/types.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace arbscan {

namespace {
    // Howard Hinnant's civil_from_days
    void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const std::int64_t yy = static_cast<std::int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int>(yy + (m <= 2 ? 1 : 0));
    }

    std::int64_t floor_div(std::int64_t a, std::int64_t b) {
        std::int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }

    bool is_leap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }
}

const char* to_string(ExchangeId exchange) {
    switch (exchange) {
        case ExchangeId::Hyperliquid: return "Hyperliquid";
        case ExchangeId::Binance:     return "Binance";
    }
    return "Unknown";
}

const char* to_string(Transport transport) {
    switch (transport) {
        case Transport::Rest:   return "REST";
        case Transport::Stream: return "STREAM";
    }
    return "Unknown";
}

const char* to_string(Direction direction) {
    switch (direction) {
        case Direction::BuyASellB: return "BUY_A_SELL_B";
        case Direction::BuyBSellA: return "BUY_B_SELL_A";
    }
    return "Unknown";
}

ExchangeId parse_exchange(const std::string& name) {
    if (name == "Hyperliquid") return ExchangeId::Hyperliquid;
    if (name == "Binance") return ExchangeId::Binance;
    throw std::invalid_argument("unknown exchange: " + name);
}

Transport parse_transport(const std::string& name) {
    if (name == "REST") return Transport::Rest;
    if (name == "STREAM") return Transport::Stream;
    throw std::invalid_argument("unknown transport: " + name);
}

Direction parse_direction(const std::string& name) {
    if (name == "BUY_A_SELL_B") return Direction::BuyASellB;
    if (name == "BUY_B_SELL_A") return Direction::BuyBSellA;
    throw std::invalid_argument("unknown direction: " + name);
}

std::string to_iso8601(TimePoint tp) {
    const std::int64_t ms = to_epoch_ms(tp);
    const std::int64_t days = floor_div(ms, 86400000);
    const std::int64_t ms_of_day = ms - days * 86400000;

    int y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    const int hh = static_cast<int>(ms_of_day / 3600000);
    const int mm = static_cast<int>((ms_of_day / 60000) % 60);
    const int ss = static_cast<int>((ms_of_day / 1000) % 60);
    const int mss = static_cast<int>(ms_of_day % 1000);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  y, m, d, hh, mm, ss, mss);
    return buf;
}

std::string date_key(TimePoint tp) {
    return to_iso8601(tp).substr(0, 10);
}

int utc_hour(TimePoint tp) {
    const std::int64_t hours = floor_div(to_epoch_ms(tp), 3600000);
    return static_cast<int>(hours - floor_div(hours, 24) * 24);
}

bool is_valid_date_key(const std::string& key) {
    if (key.size() != 10 || key[4] != '-' || key[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(key[i]))) {
            return false;
        }
    }

    const int y = std::stoi(key.substr(0, 4));
    const int m = std::stoi(key.substr(5, 2));
    const int d = std::stoi(key.substr(8, 2));
    if (m < 1 || m > 12 || d < 1) {
        return false;
    }

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days_in_month[m - 1];
    if (m == 2 && is_leap(y)) {
        max_day = 29;
    }
    return d <= max_day;
}

} // namespace arbscan
