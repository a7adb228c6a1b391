#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "arbscan/types.hpp"

namespace arbscan {

namespace json {
class FlatObject;
}

// A price gap between exchange A and exchange B that met the threshold
struct Opportunity {
    std::string symbol;
    double price_a = 0.0;
    double price_b = 0.0;
    double abs_diff = 0.0;
    double pct_diff = 0.0;
    Direction direction = Direction::BuyASellB;
    TimePoint detected_at;

    ExchangeId buy_side() const {
        return direction == Direction::BuyASellB ? ExchangeId::Hyperliquid : ExchangeId::Binance;
    }
};

bool operator==(const Opportunity& lhs, const Opportunity& rhs);
bool operator!=(const Opportunity& lhs, const Opportunity& rhs);

// Persisted, immutable once written
struct OpportunityRecord {
    std::string id;
    Opportunity opportunity;
    Transport transport = Transport::Rest;
    std::string detected_at_iso;

    const std::string& symbol() const { return opportunity.symbol; }
    double pct_diff() const { return opportunity.pct_diff; }
    TimePoint detected_at() const { return opportunity.detected_at; }

    // {id, symbol, priceA, priceB, absDiff, pctDiff, direction,
    //  detectedAt, detectedAtISO, transport}
    std::string to_json() const;

    // Writes the persisted fields without the surrounding braces
    void write_fields(std::string& out) const;

    // Throws json::ParseError on missing or malformed fields
    static OpportunityRecord from_fields(const json::FlatObject& obj);
};

bool operator==(const OpportunityRecord& lhs, const OpportunityRecord& rhs);
bool operator!=(const OpportunityRecord& lhs, const OpportunityRecord& rhs);

// Lifetime aggregates over every record written through insert
struct Stats {
    std::uint64_t total_count = 0;
    std::map<std::string, std::uint64_t> count_by_symbol;
    std::map<Direction, std::uint64_t> count_by_direction;
    double running_mean_pct = 0.0;
    std::optional<OpportunityRecord> best;
    TimePoint last_updated_at;

    // Running-mean update; best is replaced only on a strictly larger pctDiff
    void apply(const OpportunityRecord& record, TimePoint now);

    std::string to_json() const;
};

bool operator==(const Stats& lhs, const Stats& rhs);
bool operator!=(const Stats& lhs, const Stats& rhs);

} // namespace arbscan
