#include "arbscan/opportunity_queries.hpp"
#include "arbscan/errors.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace arbscan {

std::vector<OpportunityRecord> OpportunityQueries::recent(std::size_t limit, const std::optional<std::string>& symbol) const {
    if (symbol) {
        return store_.query_by_symbol(*symbol, limit);
    }
    return store_.query_recent(limit);
}

std::vector<OpportunityRecord> OpportunityQueries::by_symbol(const std::string& symbol, std::size_t limit) const {
    return store_.query_by_symbol(symbol, limit);
}

std::vector<OpportunityRecord> OpportunityQueries::by_date(const std::string& date) const {
    return store_.query_by_date(date);
}

std::optional<Stats> OpportunityQueries::stats() const {
    return store_.get_stats();
}

std::uint64_t OpportunityQueries::count_since(Duration window) const {
    return store_.count_since(window);
}

std::vector<OpportunityRecord> OpportunityQueries::export_records(const std::optional<std::string>& symbol, std::size_t limit) const {
    return recent(limit, symbol);
}

std::uint64_t OpportunityQueries::delete_older_than(Duration age) {
    return store_.delete_older_than(age);
}

std::uint64_t OpportunityQueries::cleanup(Duration age, bool compact) {
    const std::uint64_t deleted = store_.delete_older_than(age);
    if (compact) {
        store_.compact();
    }
    return deleted;
}

std::vector<std::pair<std::string, std::uint64_t>> OpportunityQueries::top_symbols(std::size_t n) const {
    std::vector<std::pair<std::string, std::uint64_t>> out;
    const auto stats = store_.get_stats();
    if (!stats) {
        return out;
    }

    out.assign(stats->count_by_symbol.begin(), stats->count_by_symbol.end());
    std::stable_sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second > rhs.second;
    });
    if (out.size() > n) {
        out.resize(n);
    }
    return out;
}

Duration OpportunityQueries::hours_window(std::int64_t hours) {
    if (hours <= 0 || hours > MAX_WINDOW_HOURS) {
        throw QueryError("window must be between 1 and " + std::to_string(MAX_WINDOW_HOURS)
                         + " hours, got " + std::to_string(hours));
    }
    return std::chrono::hours(hours);
}

Duration OpportunityQueries::days_window(std::int64_t days) {
    if (days <= 0 || days > MAX_WINDOW_HOURS / 24) {
        throw QueryError("window must be between 1 and " + std::to_string(MAX_WINDOW_HOURS / 24)
                         + " days, got " + std::to_string(days));
    }
    return std::chrono::hours(24 * days);
}

std::array<std::uint64_t, 24> OpportunityQueries::hourly_counts(const std::optional<std::string>& symbol) const {
    std::array<std::uint64_t, 24> counts{};
    for (const auto& rec : recent(ANALYSIS_LIMIT, symbol)) {
        ++counts[static_cast<std::size_t>(utc_hour(rec.detected_at()))];
    }
    return counts;
}

std::vector<HourActivity> OpportunityQueries::best_hours() const {
    std::array<HourActivity, 24> hours;
    std::array<double, 24> totals{};
    for (int h = 0; h < 24; ++h) {
        hours[static_cast<std::size_t>(h)].hour = h;
    }

    for (const auto& rec : store_.query_recent(ANALYSIS_LIMIT)) {
        const auto h = static_cast<std::size_t>(utc_hour(rec.detected_at()));
        ++hours[h].count;
        totals[h] += rec.pct_diff();
    }

    std::vector<HourActivity> out;
    for (std::size_t h = 0; h < hours.size(); ++h) {
        if (hours[h].count == 0) {
            continue;
        }
        hours[h].avg_pct = totals[h] / static_cast<double>(hours[h].count);
        out.push_back(hours[h]);
    }
    std::stable_sort(out.begin(), out.end(), [](const HourActivity& lhs, const HourActivity& rhs) {
        return lhs.avg_pct > rhs.avg_pct;
    });
    return out;
}

std::vector<SymbolPerformance> OpportunityQueries::symbol_performance() const {
    std::vector<SymbolPerformance> out;
    std::vector<double> totals;
    std::map<std::string, std::size_t> slot;

    // Slots in first-seen order, newest record first
    for (const auto& rec : store_.query_recent(ANALYSIS_LIMIT)) {
        auto it = slot.find(rec.symbol());
        if (it == slot.end()) {
            it = slot.emplace(rec.symbol(), out.size()).first;
            SymbolPerformance perf;
            perf.symbol = rec.symbol();
            perf.last_seen = rec.detected_at();
            out.push_back(perf);
            totals.push_back(0.0);
        }

        SymbolPerformance& perf = out[it->second];
        ++perf.count;
        totals[it->second] += rec.pct_diff();
        perf.max_pct = std::max(perf.max_pct, rec.pct_diff());
        perf.last_seen = std::max(perf.last_seen, rec.detected_at());
    }

    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i].avg_pct = totals[i] / static_cast<double>(out[i].count);
    }
    std::stable_sort(out.begin(), out.end(), [](const SymbolPerformance& lhs, const SymbolPerformance& rhs) {
        return lhs.count > rhs.count;
    });
    return out;
}

ExportSummary OpportunityQueries::summarize(const std::vector<OpportunityRecord>& records) {
    ExportSummary summary;
    if (records.empty()) {
        return summary;
    }

    summary.count = records.size();
    summary.min_pct = std::numeric_limits<double>::max();
    summary.max_pct = std::numeric_limits<double>::lowest();

    double sum = 0.0;
    std::set<std::string> symbols;
    for (const auto& rec : records) {
        summary.min_pct = std::min(summary.min_pct, rec.pct_diff());
        summary.max_pct = std::max(summary.max_pct, rec.pct_diff());
        sum += rec.pct_diff();
        symbols.insert(rec.symbol());

        if (!summary.oldest || rec.detected_at() < *summary.oldest) {
            summary.oldest = rec.detected_at();
        }
        if (!summary.newest || rec.detected_at() > *summary.newest) {
            summary.newest = rec.detected_at();
        }
    }
    summary.avg_pct = sum / static_cast<double>(records.size());
    summary.symbols.assign(symbols.begin(), symbols.end());
    return summary;
}

std::string OpportunityQueries::to_json_array(const std::vector<OpportunityRecord>& records) {
    if (records.empty()) {
        return "[]";
    }

    std::string out = "[\n";
    for (std::size_t i = 0; i < records.size(); ++i) {
        out += "  " + records[i].to_json();
        out += (i + 1 < records.size()) ? ",\n" : "\n";
    }
    out += "]";
    return out;
}

} // namespace arbscan
