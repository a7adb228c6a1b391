#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arbscan/opportunity_store.hpp"

namespace arbscan {

struct ExportSummary {
    std::size_t count = 0;
    double min_pct = 0.0;
    double max_pct = 0.0;
    double avg_pct = 0.0;
    std::optional<TimePoint> oldest;
    std::optional<TimePoint> newest;
    std::vector<std::string> symbols;
};

struct HourActivity {
    int hour = 0;
    std::uint64_t count = 0;
    double avg_pct = 0.0;
};

struct SymbolPerformance {
    std::string symbol;
    std::uint64_t count = 0;
    double avg_pct = 0.0;
    double max_pct = 0.0;
    TimePoint last_seen;
};

// Read and retention paths for reporting tools. Holds no state of its own;
// everything is answered by the store's public operations.
class OpportunityQueries {
public:
    static constexpr std::size_t DEFAULT_EXPORT_LIMIT = 1000;
    static constexpr std::size_t ANALYSIS_LIMIT = 1000;

    // 100 years; anything longer is rejected before it reaches the store
    static constexpr std::int64_t MAX_WINDOW_HOURS = 24 * 36525;

    // Positive, bounded windows for CLI arguments; QueryError otherwise
    static Duration hours_window(std::int64_t hours);
    static Duration days_window(std::int64_t days);

    explicit OpportunityQueries(OpportunityStore& store)
        : store_(store)
    {
    }

    std::vector<OpportunityRecord> recent(std::size_t limit, const std::optional<std::string>& symbol = std::nullopt) const;
    std::vector<OpportunityRecord> by_symbol(const std::string& symbol, std::size_t limit) const;
    std::vector<OpportunityRecord> by_date(const std::string& date) const;
    std::optional<Stats> stats() const;
    std::uint64_t count_since(Duration window) const;

    // Newest first, optionally restricted to one symbol
    std::vector<OpportunityRecord> export_records(
        const std::optional<std::string>& symbol = std::nullopt,
        std::size_t limit = DEFAULT_EXPORT_LIMIT
    ) const;

    std::uint64_t delete_older_than(Duration age);

    // delete_older_than, then optionally compact the journal
    std::uint64_t cleanup(Duration age, bool compact);

    // Symbols by lifetime opportunity count, highest first
    std::vector<std::pair<std::string, std::uint64_t>> top_symbols(std::size_t n) const;

    // Opportunities per UTC hour over the newest ANALYSIS_LIMIT records,
    // optionally for one symbol
    std::array<std::uint64_t, 24> hourly_counts(const std::optional<std::string>& symbol = std::nullopt) const;

    // Hours with at least one record, highest average pctDiff first
    std::vector<HourActivity> best_hours() const;

    // Per-symbol count, average, maximum and last sighting over the newest
    // ANALYSIS_LIMIT records, most frequent first
    std::vector<SymbolPerformance> symbol_performance() const;

    static ExportSummary summarize(const std::vector<OpportunityRecord>& records);

    // Pretty-printed JSON array of persisted-shape records
    static std::string to_json_array(const std::vector<OpportunityRecord>& records);

private:
    OpportunityStore& store_;
};

} // namespace arbscan
