#include "arbscan/price_ledger.hpp"

#include <mutex>
#include <stdexcept>

namespace arbscan {

void PriceLedger::update(const PriceQuote& quote) {
    if (!quote.is_valid()) {
        throw std::invalid_argument("rejected quote " + quote.to_json());
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        quotes_[Key(quote.exchange, quote.symbol)] = quote;
    }

    if (callback_) {
        callback_(quote);
    }
}

std::optional<PriceQuote> PriceLedger::get(ExchangeId exchange, const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = quotes_.find(Key(exchange, symbol));
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PriceLedger::QuotePair PriceLedger::pair(const std::string& symbol) const {
    QuotePair result;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto a = quotes_.find(Key(ExchangeId::Hyperliquid, symbol));
    if (a != quotes_.end()) {
        result.a = a->second;
    }
    auto b = quotes_.find(Key(ExchangeId::Binance, symbol));
    if (b != quotes_.end()) {
        result.b = b->second;
    }
    return result;
}

std::map<std::string, PriceQuote> PriceLedger::snapshot(ExchangeId exchange) const {
    std::map<std::string, PriceQuote> out;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [key, quote] : quotes_) {
        if (key.first == exchange) {
            out.emplace(key.second, quote);
        }
    }
    return out;
}

std::size_t PriceLedger::size(ExchangeId exchange) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& entry : quotes_) {
        if (entry.first.first == exchange) {
            ++n;
        }
    }
    return n;
}

} // namespace arbscan
