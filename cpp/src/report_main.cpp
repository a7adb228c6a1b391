// Reporting and retention over the opportunity journal: stats, recent,
// by-date, count, analysis, export and cleanup.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "arbscan/clock.hpp"
#include "arbscan/errors.hpp"
#include "arbscan/opportunity_queries.hpp"
#include "arbscan/opportunity_store.hpp"

namespace {

struct ReportArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string journal_path = "arbitrage.journal";
    std::optional<std::string> out_path;
    bool force = false;
    bool compact = false;
};

constexpr int MIN_DAYS_WITHOUT_FORCE = 7;

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " <command> [args] [--journal PATH]\n"
              << "  stats                                  lifetime statistics\n"
              << "  recent [limit] [symbol]                newest opportunities (default 10)\n"
              << "  by-date YYYY-MM-DD                     opportunities detected on a UTC day\n"
              << "  count [hours]                          opportunities in the last N hours (default 24)\n"
              << "  analysis [symbol]                      hour-of-day and per-token breakdown of recent records\n"
              << "  export [symbol] [limit] [--out FILE]   JSON export (default 1000 records)\n"
              << "  cleanup [days] [--force] [--compact]   drop records older than N days (default 30)\n";
}

ReportArgs parse_args(int argc, char* argv[]) {
    ReportArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--journal" && i + 1 < argc) {
            args.journal_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            args.out_path = argv[++i];
        } else if (arg == "--force") {
            args.force = true;
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw arbscan::ConfigError("unknown or incomplete option '" + arg + "'");
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

long long parse_count(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        const long long v = std::stoll(text, &used);
        if (used == text.size() && v > 0) {
            return v;
        }
    } catch (const std::logic_error&) {
        // stoll rejects it; reported below
    }
    throw arbscan::QueryError(std::string(what) + " must be a positive integer, got '" + text + "'");
}

std::string upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

void print_records(const std::vector<arbscan::OpportunityRecord>& records) {
    std::ostringstream oss;
    oss << std::fixed;
    for (const auto& rec : records) {
        oss << rec.detected_at_iso << "  " << std::left << std::setw(6) << rec.symbol()
            << std::right << std::setprecision(3) << std::setw(8) << rec.pct_diff() << "%  "
            << std::setw(12) << arbscan::to_string(rec.opportunity.direction)
            << std::setprecision(6)
            << "  HL=" << rec.opportunity.price_a
            << "  BN=" << rec.opportunity.price_b
            << "  " << arbscan::to_string(rec.transport)
            << "  " << rec.id << "\n";
    }
    std::cout << oss.str();
}

int run_stats(const arbscan::OpportunityQueries& queries) {
    const auto stats = queries.stats();
    if (!stats || stats->total_count == 0) {
        std::cout << "No arbitrage opportunities recorded" << std::endl;
        return 0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Total opportunities recorded: " << stats->total_count << "\n"
        << "Average price difference:     " << stats->running_mean_pct << "%\n"
        << "Last updated:                 " << arbscan::to_iso8601(stats->last_updated_at) << "\n";

    if (stats->best) {
        const auto& best = *stats->best;
        oss << "\nBest opportunity:\n"
            << "  Token:      " << best.symbol() << "\n"
            << "  Difference: " << best.pct_diff() << "%\n"
            << "  Date:       " << best.detected_at_iso << "\n"
            << "  Strategy:   " << arbscan::to_string(best.opportunity.direction) << "\n"
            << "  Source:     " << arbscan::to_string(best.transport) << "\n";
    }

    oss << "\nTop tokens by opportunity count:\n";
    int rank = 1;
    for (const auto& [symbol, count] : queries.top_symbols(10)) {
        oss << "  " << rank++ << ". " << symbol << ": " << count;
        const auto records = queries.by_symbol(symbol, arbscan::OpportunityQueries::DEFAULT_EXPORT_LIMIT);
        if (!records.empty()) {
            const auto summary = arbscan::OpportunityQueries::summarize(records);
            oss << "  (retained min " << summary.min_pct << "% | max " << summary.max_pct
                << "% | avg " << summary.avg_pct << "%)";
        }
        oss << "\n";
    }

    oss << "\nDirection breakdown:\n";
    for (const auto& [direction, count] : stats->count_by_direction) {
        oss << "  " << arbscan::to_string(direction) << ": " << count << " ("
            << std::setprecision(1) << (100.0 * static_cast<double>(count) / static_cast<double>(stats->total_count))
            << "%)\n" << std::setprecision(2);
    }

    oss << "\nRecent activity:\n"
        << "  Last 24 hours: " << queries.count_since(std::chrono::hours(24)) << "\n"
        << "  Last 1 hour:   " << queries.count_since(std::chrono::hours(1)) << "\n";

    std::cout << oss.str();
    return 0;
}

int run_analysis(const arbscan::OpportunityQueries& queries, const ReportArgs& args) {
    std::optional<std::string> symbol;
    if (!args.positional.empty()) {
        symbol = upper(args.positional[0]);
    }

    const auto counts = queries.hourly_counts(symbol);
    std::uint64_t peak = 0;
    for (auto c : counts) {
        peak = std::max(peak, c);
    }
    if (peak == 0) {
        std::cout << "No arbitrage opportunities recorded" << std::endl;
        return 0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Opportunities by hour (UTC, newest " << arbscan::OpportunityQueries::ANALYSIS_LIMIT << " records"
        << (symbol ? ", " + *symbol : std::string()) << "):\n";
    for (std::size_t h = 0; h < counts.size(); ++h) {
        const auto bar = static_cast<std::size_t>(40 * counts[h] / peak);
        oss << "  " << std::setw(2) << std::setfill('0') << h << std::setfill(' ') << ":00 "
            << std::setw(5) << counts[h] << " " << std::string(bar, '#') << "\n";
    }

    const auto hours = queries.best_hours();
    oss << "\nBest trading hours (UTC):\n";
    for (std::size_t i = 0; i < hours.size() && i < 5; ++i) {
        oss << "  " << (i + 1) << ". " << std::setw(2) << std::setfill('0') << hours[i].hour << std::setfill(' ')
            << ":00 - " << hours[i].count << " opportunities, avg " << hours[i].avg_pct << "%\n";
    }

    const auto tokens = queries.symbol_performance();
    oss << "\nTop performing tokens:\n";
    for (std::size_t i = 0; i < tokens.size() && i < 10; ++i) {
        oss << "  " << (i + 1) << ". " << tokens[i].symbol << ": " << tokens[i].count
            << " opportunities, avg " << tokens[i].avg_pct << "%, max " << tokens[i].max_pct
            << "%, last seen " << arbscan::to_iso8601(tokens[i].last_seen) << "\n";
    }

    std::cout << oss.str();
    return 0;
}

int run_export(const arbscan::OpportunityQueries& queries, const ReportArgs& args) {
    std::optional<std::string> symbol;
    std::size_t limit = arbscan::OpportunityQueries::DEFAULT_EXPORT_LIMIT;
    if (!args.positional.empty()) {
        symbol = upper(args.positional[0]);
    }
    if (args.positional.size() > 1) {
        limit = static_cast<std::size_t>(parse_count(args.positional[1], "limit"));
    }

    const auto records = queries.export_records(symbol, limit);
    if (records.empty()) {
        std::cout << "No data found to export" << std::endl;
        return 0;
    }

    std::string path;
    if (args.out_path) {
        path = *args.out_path;
    } else {
        path = "arbitrage_export";
        if (symbol) {
            std::string lower = *symbol;
            for (auto& c : lower) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            path += "_" + lower;
        }
        path += "_" + arbscan::date_key(arbscan::SystemClock().now()) + ".json";
    }

    std::ofstream out(path);
    out << arbscan::OpportunityQueries::to_json_array(records) << "\n";
    out.flush();
    if (!out) {
        std::cerr << "Failed to write " << path << std::endl;
        return 1;
    }

    const auto summary = arbscan::OpportunityQueries::summarize(records);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Exported " << summary.count << " records to " << path << "\n"
        << "  Date range: " << arbscan::to_iso8601(*summary.oldest) << " to " << arbscan::to_iso8601(*summary.newest) << "\n"
        << "  Average difference: " << summary.avg_pct << "%\n"
        << "  Max difference: " << summary.max_pct << "%\n"
        << "  Min difference: " << summary.min_pct << "%\n"
        << "  Unique tokens: " << summary.symbols.size() << " (";
    for (std::size_t i = 0; i < summary.symbols.size(); ++i) {
        oss << (i ? ", " : "") << summary.symbols[i];
    }
    oss << ")\n";
    std::cout << oss.str();
    return 0;
}

int run_cleanup(arbscan::OpportunityQueries& queries, const ReportArgs& args) {
    const long long days = args.positional.empty() ? 30 : parse_count(args.positional[0], "days");
    const arbscan::Duration age = arbscan::OpportunityQueries::days_window(days);
    if (days < MIN_DAYS_WITHOUT_FORCE && !args.force) {
        std::cerr << "Refusing to delete records newer than " << MIN_DAYS_WITHOUT_FORCE
                  << " days without --force" << std::endl;
        return 1;
    }

    const auto deleted = queries.cleanup(age, args.compact);
    if (deleted == 0) {
        std::cout << "No records older than " << days << " days" << std::endl;
    } else {
        std::cout << "Deleted " << deleted << " records older than " << days << " days" << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ReportArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const arbscan::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (args.command.empty() || args.command == "help") {
        print_usage(argv[0]);
        return args.command.empty() ? 1 : 0;
    }

    try {
        arbscan::SystemClock clock;
        auto store = arbscan::OpportunityStore::open(args.journal_path, clock);
        arbscan::OpportunityQueries queries(*store);

        if (args.command == "stats") {
            return run_stats(queries);
        } else if (args.command == "recent") {
            const std::size_t limit = args.positional.empty()
                ? 10 : static_cast<std::size_t>(parse_count(args.positional[0], "limit"));
            std::optional<std::string> symbol;
            if (args.positional.size() > 1) {
                symbol = upper(args.positional[1]);
            }
            print_records(queries.recent(limit, symbol));
            return 0;
        } else if (args.command == "by-date") {
            if (args.positional.empty()) {
                throw arbscan::QueryError("by-date needs a YYYY-MM-DD argument");
            }
            print_records(queries.by_date(args.positional[0]));
            return 0;
        } else if (args.command == "count") {
            const long long hours = args.positional.empty() ? 24 : parse_count(args.positional[0], "hours");
            std::cout << queries.count_since(arbscan::OpportunityQueries::hours_window(hours)) << std::endl;
            return 0;
        } else if (args.command == "analysis") {
            return run_analysis(queries, args);
        } else if (args.command == "export") {
            return run_export(queries, args);
        } else if (args.command == "cleanup") {
            return run_cleanup(queries, args);
        }

        std::cerr << "Unknown command '" << args.command << "'" << std::endl;
        print_usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
