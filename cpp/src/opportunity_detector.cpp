#include "arbscan/opportunity_detector.hpp"
#include "arbscan/errors.hpp"

#include <cmath>
#include <stdexcept>

namespace arbscan {

std::optional<Opportunity> detect_opportunity(
    const PriceQuote& quote_a,
    const PriceQuote& quote_b,
    double threshold_pct,
    TimePoint detected_at
) {
    if (quote_a.symbol != quote_b.symbol) {
        throw std::invalid_argument("cannot compare " + quote_a.symbol + " with " + quote_b.symbol);
    }
    if (!quote_a.is_valid() || !quote_b.is_valid()) {
        throw std::invalid_argument("invalid quote for " + quote_a.symbol);
    }

    const double abs_diff = std::fabs(quote_a.price - quote_b.price);
    const double avg = (quote_a.price + quote_b.price) / 2.0;
    const double pct_diff = abs_diff / avg * 100.0;

    if (pct_diff < threshold_pct) {
        return std::nullopt;
    }

    Opportunity opp;
    opp.symbol = quote_a.symbol;
    opp.price_a = quote_a.price;
    opp.price_b = quote_b.price;
    opp.abs_diff = abs_diff;
    opp.pct_diff = pct_diff;
    // Buy on the cheaper side
    opp.direction = quote_a.price < quote_b.price ? Direction::BuyASellB : Direction::BuyBSellA;
    opp.detected_at = detected_at;
    return opp;
}

OpportunityDetector::OpportunityDetector(double threshold_pct)
    : threshold_pct_(threshold_pct)
{
    validate_threshold(threshold_pct);
}

std::optional<Opportunity> OpportunityDetector::detect(
    const PriceQuote& quote_a,
    const PriceQuote& quote_b,
    TimePoint detected_at
) const {
    return detect_opportunity(quote_a, quote_b, threshold(), detected_at);
}

void OpportunityDetector::set_threshold(double threshold_pct) {
    validate_threshold(threshold_pct);
    threshold_pct_.store(threshold_pct, std::memory_order_relaxed);
}

void OpportunityDetector::validate_threshold(double threshold_pct) {
    if (!std::isfinite(threshold_pct) || threshold_pct <= 0.0) {
        throw ConfigError("threshold must be a positive percentage, got " + std::to_string(threshold_pct));
    }
}

} // namespace arbscan
