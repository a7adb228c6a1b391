#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace arbscan {

struct ScannerConfig {
    std::vector<std::string> symbols{"BTC", "ETH", "SOL", "XRP", "DOGE", "AVAX", "LINK", "ARB"};
    double threshold_pct = 0.3;
    std::string journal_path = "arbitrage.journal";
    std::chrono::seconds poll_interval{30};
    std::chrono::seconds status_interval{30};
    bool enable_rest = true;
    bool enable_stream = true;
    bool show_help = false;

    // Throws ConfigError describing the first invalid setting
    void validate() const;
};

// Throws ConfigError on unknown flags or malformed values; the result is validated
ScannerConfig parse_scanner_args(int argc, const char* const argv[]);

void print_scanner_usage(const char* prog_name);

// Upper-cases, trims and de-duplicates a comma separated list, keeping order
std::vector<std::string> parse_symbol_list(const std::string& csv);

} // namespace arbscan
