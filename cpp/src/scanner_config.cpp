#include "arbscan/scanner_config.hpp"
#include "arbscan/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <set>

namespace arbscan {

namespace {
    double parse_number(const std::string& flag, const std::string& value) {
        try {
            std::size_t used = 0;
            const double v = std::stod(value, &used);
            if (used != value.size()) {
                throw ConfigError(flag + " expects a number, got '" + value + "'");
            }
            return v;
        } catch (const std::logic_error&) {
            throw ConfigError(flag + " expects a number, got '" + value + "'");
        }
    }

    std::chrono::seconds parse_seconds(const std::string& flag, const std::string& value) {
        const double v = parse_number(flag, value);
        if (v < 0 || v != std::floor(v)) {
            throw ConfigError(flag + " expects whole seconds, got '" + value + "'");
        }
        return std::chrono::seconds(static_cast<long long>(v));
    }
}

void ScannerConfig::validate() const {
    if (symbols.empty()) {
        throw ConfigError("symbol universe must not be empty");
    }
    if (!std::isfinite(threshold_pct) || threshold_pct <= 0.0) {
        throw ConfigError("threshold must be a positive percentage, got " + std::to_string(threshold_pct));
    }
    if (journal_path.empty()) {
        throw ConfigError("journal path must not be empty");
    }
    if (poll_interval.count() <= 0) {
        throw ConfigError("poll interval must be positive");
    }
    if (status_interval.count() <= 0) {
        throw ConfigError("status interval must be positive");
    }
    if (!enable_rest && !enable_stream) {
        throw ConfigError("at least one of REST polling and streaming must be enabled");
    }
}

std::vector<std::string> parse_symbol_list(const std::string& csv) {
    std::vector<std::string> out;
    std::set<std::string> seen;

    std::size_t start = 0;
    while (start <= csv.size()) {
        auto end = csv.find(',', start);
        if (end == std::string::npos) {
            end = csv.size();
        }

        std::string token = csv.substr(start, end - start);
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](unsigned char c) { return std::isspace(c); }),
                    token.end());
        std::transform(token.begin(), token.end(), token.begin(), ::toupper);

        if (!token.empty() && seen.insert(token).second) {
            out.push_back(token);
        }
        start = end + 1;
    }
    return out;
}

ScannerConfig parse_scanner_args(int argc, const char* const argv[]) {
    ScannerConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            return cfg;
        } else if (arg == "--threshold" && has_value) {
            cfg.threshold_pct = parse_number(arg, argv[++i]);
        } else if (arg == "--journal" && has_value) {
            cfg.journal_path = argv[++i];
        } else if (arg == "--symbols" && has_value) {
            cfg.symbols = parse_symbol_list(argv[++i]);
        } else if (arg == "--poll-interval" && has_value) {
            cfg.poll_interval = parse_seconds(arg, argv[++i]);
        } else if (arg == "--status-interval" && has_value) {
            cfg.status_interval = parse_seconds(arg, argv[++i]);
        } else if (arg == "--no-rest") {
            cfg.enable_rest = false;
        } else if (arg == "--no-stream") {
            cfg.enable_stream = false;
        } else {
            throw ConfigError("unknown or incomplete argument '" + arg + "'");
        }
    }

    cfg.validate();
    return cfg;
}

void print_scanner_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "  --threshold PCT        minimum price gap in percent (default 0.3)\n"
              << "  --symbols A,B,C        base assets to watch (default BTC,ETH,SOL,XRP,DOGE,AVAX,LINK,ARB)\n"
              << "  --journal PATH         opportunity journal (default arbitrage.journal)\n"
              << "  --poll-interval S      REST poll interval in seconds (default 30)\n"
              << "  --status-interval S    status line interval in seconds (default 30)\n"
              << "  --no-rest              disable REST polling\n"
              << "  --no-stream            disable WebSocket streams\n";
}

} // namespace arbscan
