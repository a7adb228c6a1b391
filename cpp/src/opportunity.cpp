#include "arbscan/opportunity.hpp"
#include "arbscan/json_fields.hpp"

namespace arbscan {

bool operator==(const Opportunity& lhs, const Opportunity& rhs) {
    return lhs.symbol == rhs.symbol
        && lhs.price_a == rhs.price_a
        && lhs.price_b == rhs.price_b
        && lhs.abs_diff == rhs.abs_diff
        && lhs.pct_diff == rhs.pct_diff
        && lhs.direction == rhs.direction
        && lhs.detected_at == rhs.detected_at;
}

bool operator!=(const Opportunity& lhs, const Opportunity& rhs) {
    return !(lhs == rhs);
}

std::string OpportunityRecord::to_json() const {
    std::string out = "{";
    write_fields(out);
    out += "}";
    return out;
}

void OpportunityRecord::write_fields(std::string& out) const {
    out += "\"id\":" + json::quote(id);
    out += ",\"symbol\":" + json::quote(opportunity.symbol);
    out += ",\"priceA\":" + json::format_double(opportunity.price_a);
    out += ",\"priceB\":" + json::format_double(opportunity.price_b);
    out += ",\"absDiff\":" + json::format_double(opportunity.abs_diff);
    out += ",\"pctDiff\":" + json::format_double(opportunity.pct_diff);
    out += ",\"direction\":\"" + std::string(to_string(opportunity.direction)) + "\"";
    out += ",\"detectedAt\":" + std::to_string(to_epoch_ms(opportunity.detected_at));
    out += ",\"detectedAtISO\":" + json::quote(detected_at_iso);
    out += ",\"transport\":\"" + std::string(to_string(transport)) + "\"";
}

OpportunityRecord OpportunityRecord::from_fields(const json::FlatObject& obj) {
    OpportunityRecord rec;
    rec.id = obj.get_string("id");
    rec.opportunity.symbol = obj.get_string("symbol");
    rec.opportunity.price_a = obj.get_double("priceA");
    rec.opportunity.price_b = obj.get_double("priceB");
    rec.opportunity.abs_diff = obj.get_double("absDiff");
    rec.opportunity.pct_diff = obj.get_double("pctDiff");
    rec.opportunity.detected_at = from_epoch_ms(obj.get_int64("detectedAt"));
    rec.detected_at_iso = obj.get_string("detectedAtISO");

    try {
        rec.opportunity.direction = parse_direction(obj.get_string("direction"));
        rec.transport = parse_transport(obj.get_string("transport"));
    } catch (const std::invalid_argument& e) {
        throw json::ParseError(e.what());
    }
    return rec;
}

bool operator==(const OpportunityRecord& lhs, const OpportunityRecord& rhs) {
    return lhs.id == rhs.id
        && lhs.opportunity == rhs.opportunity
        && lhs.transport == rhs.transport
        && lhs.detected_at_iso == rhs.detected_at_iso;
}

bool operator!=(const OpportunityRecord& lhs, const OpportunityRecord& rhs) {
    return !(lhs == rhs);
}

void Stats::apply(const OpportunityRecord& record, TimePoint now) {
    const double old_mean = running_mean_pct;
    const std::uint64_t old_count = total_count;

    ++total_count;
    ++count_by_symbol[record.symbol()];
    ++count_by_direction[record.opportunity.direction];

    running_mean_pct = (old_mean * static_cast<double>(old_count) + record.pct_diff())
                     / static_cast<double>(total_count);

    if (!best || record.pct_diff() > best->pct_diff()) {
        best = record;
    }

    last_updated_at = now;
}

std::string Stats::to_json() const {
    std::string out = "{\"totalCount\":" + std::to_string(total_count);

    out += ",\"countBySymbol\":{";
    bool first = true;
    for (const auto& [symbol, count] : count_by_symbol) {
        if (!first) out += ",";
        out += json::quote(symbol) + ":" + std::to_string(count);
        first = false;
    }
    out += "}";

    out += ",\"countByDirection\":{";
    first = true;
    for (const auto& [direction, count] : count_by_direction) {
        if (!first) out += ",";
        out += "\"" + std::string(to_string(direction)) + "\":" + std::to_string(count);
        first = false;
    }
    out += "}";

    out += ",\"runningMeanPct\":" + json::format_double(running_mean_pct);
    out += ",\"best\":" + (best ? best->to_json() : std::string("null"));
    out += ",\"lastUpdatedAt\":" + std::to_string(to_epoch_ms(last_updated_at));
    out += "}";
    return out;
}

bool operator==(const Stats& lhs, const Stats& rhs) {
    return lhs.total_count == rhs.total_count
        && lhs.count_by_symbol == rhs.count_by_symbol
        && lhs.count_by_direction == rhs.count_by_direction
        && lhs.running_mean_pct == rhs.running_mean_pct
        && lhs.best == rhs.best
        && lhs.last_updated_at == rhs.last_updated_at;
}

bool operator!=(const Stats& lhs, const Stats& rhs) {
    return !(lhs == rhs);
}

} // namespace arbscan
