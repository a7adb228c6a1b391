#include "arbscan/arbitrage_scanner.hpp"
#include "arbscan/errors.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace arbscan {

ArbitrageScanner::ArbitrageScanner(
    const std::vector<std::string>& symbols,
    double threshold_pct,
    OpportunityStore& store,
    Clock& clock
)
    : symbols_(symbols)
    , universe_(symbols.begin(), symbols.end())
    , store_(store)
    , clock_(clock)
    , detector_(threshold_pct)
    , running_(true)
    , quotes_accepted_(0)
    , quotes_rejected_(0)
    , opportunities_recorded_(0)
    , storage_failures_(0)
{
    if (universe_.empty()) {
        throw ConfigError("symbol universe must not be empty");
    }
    if (universe_.count("") != 0) {
        throw ConfigError("symbol universe contains an empty symbol");
    }

    ledger_.set_callback([this](const PriceQuote& quote) {
        check_symbol(quote);
    });
}

void ArbitrageScanner::on_quote(
    ExchangeId exchange,
    const std::string& symbol,
    double price,
    TimePoint observed_at,
    Transport transport
) {
    PriceQuote quote;
    quote.exchange = exchange;
    quote.symbol = symbol;
    quote.price = price;
    quote.observed_at = observed_at;
    quote.transport = transport;
    on_quote(quote);
}

void ArbitrageScanner::on_quote(const PriceQuote& quote) {
    std::shared_lock<std::shared_mutex> inflight(inflight_mutex_);
    if (!running_.load()) {
        return;
    }

    if (!tracks(quote.symbol)) {
        ++quotes_rejected_;
        throw std::invalid_argument("symbol " + quote.symbol + " is not tracked");
    }
    if (!quote.is_valid()) {
        ++quotes_rejected_;
        throw std::invalid_argument("malformed quote " + quote.to_json());
    }

    ++quotes_accepted_;
    ledger_.update(quote);
}

void ArbitrageScanner::check_symbol(const PriceQuote& trigger) {
    const auto quotes = ledger_.pair(trigger.symbol);
    if (!quotes.complete()) {
        return;
    }

    const auto opportunity = detector_.detect(*quotes.a, *quotes.b, clock_.now());
    if (!opportunity) {
        return;
    }

    std::string id;
    try {
        id = store_.insert(*opportunity, trigger.transport);
    } catch (const StorageError& e) {
        ++storage_failures_;
        std::cerr << "[Scanner] Failed to store opportunity for " << trigger.symbol
                  << ": " << e.what() << std::endl;
        throw;
    }
    ++opportunities_recorded_;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "[Scanner] " << opportunity->symbol << " "
        << std::setprecision(3) << opportunity->pct_diff << "% "
        << to_string(opportunity->direction)
        << std::setprecision(6)
        << " HL=" << opportunity->price_a
        << " BN=" << opportunity->price_b
        << " (" << to_string(trigger.transport) << ") id=" << id;
    std::cout << oss.str() << std::endl;
}

ArbitrageScanner::Status ArbitrageScanner::status() const {
    Status s;
    s.quotes_accepted = quotes_accepted_.load();
    s.quotes_rejected = quotes_rejected_.load();
    s.opportunities_recorded = opportunities_recorded_.load();
    s.storage_failures = storage_failures_.load();
    s.prices_a = ledger_.size(ExchangeId::Hyperliquid);
    s.prices_b = ledger_.size(ExchangeId::Binance);
    return s;
}

void ArbitrageScanner::stop() {
    running_.store(false);
    // Wait for quotes already past the running check
    std::unique_lock<std::shared_mutex> drain(inflight_mutex_);
    std::cout << "[Scanner] Stopped" << std::endl;
}

} // namespace arbscan
