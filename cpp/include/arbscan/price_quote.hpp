#pragma once

#include <functional>
#include <string>

#include "arbscan/types.hpp"

namespace arbscan {

struct PriceQuote {
    std::string symbol;
    ExchangeId exchange = ExchangeId::Hyperliquid;
    double price = 0.0;
    TimePoint observed_at;
    Transport transport = Transport::Rest;

    // Positive, finite price and a non-empty symbol
    bool is_valid() const;

    // Serialize to JSON string for logs and debugging
    std::string to_json() const;
};

using QuoteCallback = std::function<void(const PriceQuote&)>;

} // namespace arbscan
