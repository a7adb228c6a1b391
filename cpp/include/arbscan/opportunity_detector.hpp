#pragma once

#include <atomic>
#include <optional>

#include "arbscan/opportunity.hpp"
#include "arbscan/price_quote.hpp"

namespace arbscan {

// Compares the exchange-A quote against the exchange-B quote for one symbol.
// Emits an Opportunity iff pctDiff >= threshold_pct (inclusive). The caller
// supplies detected_at so identical inputs give identical output.
// Throws std::invalid_argument if the quotes name different symbols or
// either price is not positive.
std::optional<Opportunity> detect_opportunity(
    const PriceQuote& quote_a,
    const PriceQuote& quote_b,
    double threshold_pct,
    TimePoint detected_at
);

class OpportunityDetector {
public:
    // Throws ConfigError for a non-positive or non-finite threshold
    explicit OpportunityDetector(double threshold_pct);

    std::optional<Opportunity> detect(
        const PriceQuote& quote_a,
        const PriceQuote& quote_b,
        TimePoint detected_at
    ) const;

    void set_threshold(double threshold_pct);
    double threshold() const { return threshold_pct_.load(std::memory_order_relaxed); }

private:
    static void validate_threshold(double threshold_pct);

    std::atomic<double> threshold_pct_;
};

} // namespace arbscan
