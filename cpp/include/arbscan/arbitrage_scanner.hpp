#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "arbscan/clock.hpp"
#include "arbscan/opportunity_detector.hpp"
#include "arbscan/opportunity_store.hpp"
#include "arbscan/price_ledger.hpp"

namespace arbscan {

// Quote ingestion -> ledger -> detector -> store.
//
// Detection runs on the thread that delivered the quote, once per ledger
// update. When both sides of a symbol move inside the same window each update
// may record its own opportunity: emission is at-least-once, not debounced.
class ArbitrageScanner {
public:
    struct Status {
        std::uint64_t quotes_accepted = 0;
        std::uint64_t quotes_rejected = 0;
        std::uint64_t opportunities_recorded = 0;
        std::uint64_t storage_failures = 0;
        std::size_t prices_a = 0;
        std::size_t prices_b = 0;
    };

    // Throws ConfigError for an empty symbol universe or a bad threshold
    ArbitrageScanner(
        const std::vector<std::string>& symbols,
        double threshold_pct,
        OpportunityStore& store,
        Clock& clock
    );

    ArbitrageScanner(const ArbitrageScanner&) = delete;
    ArbitrageScanner& operator=(const ArbitrageScanner&) = delete;

    // Throws std::invalid_argument for a malformed quote or a symbol outside
    // the universe (the ledger keeps its previous value), and StorageError
    // when a detected opportunity cannot be recorded. Ignored after stop().
    void on_quote(
        ExchangeId exchange,
        const std::string& symbol,
        double price,
        TimePoint observed_at,
        Transport transport
    );

    void on_quote(const PriceQuote& quote);

    void set_threshold(double threshold_pct) { detector_.set_threshold(threshold_pct); }
    double threshold() const { return detector_.threshold(); }

    const std::vector<std::string>& symbols() const { return symbols_; }
    bool tracks(const std::string& symbol) const { return universe_.count(symbol) != 0; }

    std::map<std::string, PriceQuote> current_prices(ExchangeId exchange) const {
        return ledger_.snapshot(exchange);
    }

    Status status() const;

    // Stops accepting quotes and waits for in-flight ones to finish
    void stop();
    bool running() const { return running_.load(); }

private:
    void check_symbol(const PriceQuote& trigger);

    std::vector<std::string> symbols_;
    std::set<std::string> universe_;
    OpportunityStore& store_;
    Clock& clock_;
    PriceLedger ledger_;
    OpportunityDetector detector_;

    std::atomic<bool> running_;
    std::shared_mutex inflight_mutex_;

    std::atomic<std::uint64_t> quotes_accepted_;
    std::atomic<std::uint64_t> quotes_rejected_;
    std::atomic<std::uint64_t> opportunities_recorded_;
    std::atomic<std::uint64_t> storage_failures_;
};

} // namespace arbscan
