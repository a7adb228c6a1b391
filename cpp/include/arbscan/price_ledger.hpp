#pragma once

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "arbscan/price_quote.hpp"

namespace arbscan {

// Freshest quote per (exchange, symbol). Last write observed by this process
// wins regardless of transport; a late REST response can overwrite a newer
// stream quote.
class PriceLedger {
public:
    using UpdateCallback = std::function<void(const PriceQuote&)>;

    struct QuotePair {
        std::optional<PriceQuote> a;
        std::optional<PriceQuote> b;

        bool complete() const { return a.has_value() && b.has_value(); }
    };

    // Invoked after every successful update, outside the ledger lock
    void set_callback(UpdateCallback callback) { callback_ = std::move(callback); }

    // Throws std::invalid_argument for an invalid quote; the stored value is kept
    void update(const PriceQuote& quote);

    std::optional<PriceQuote> get(ExchangeId exchange, const std::string& symbol) const;

    // Both sides read under one lock
    QuotePair pair(const std::string& symbol) const;

    std::map<std::string, PriceQuote> snapshot(ExchangeId exchange) const;
    std::size_t size(ExchangeId exchange) const;

private:
    using Key = std::pair<ExchangeId, std::string>;

    mutable std::shared_mutex mutex_;
    std::map<Key, PriceQuote> quotes_;
    UpdateCallback callback_;
};

} // namespace arbscan
