#include <gtest/gtest.h>

#include <vector>

#include "arbscan/errors.hpp"
#include "arbscan/scanner_config.hpp"

using namespace arbscan;

namespace {
    ScannerConfig parse(std::vector<const char*> args) {
        args.insert(args.begin(), "arbscan");
        return parse_scanner_args(static_cast<int>(args.size()), args.data());
    }
}

TEST(ScannerConfigTest, Defaults) {
    const auto cfg = parse({});
    EXPECT_DOUBLE_EQ(cfg.threshold_pct, 0.3);
    EXPECT_EQ(cfg.symbols.size(), 8u);
    EXPECT_EQ(cfg.symbols.front(), "BTC");
    EXPECT_EQ(cfg.symbols.back(), "ARB");
    EXPECT_EQ(cfg.journal_path, "arbitrage.journal");
    EXPECT_EQ(cfg.poll_interval, std::chrono::seconds(30));
    EXPECT_TRUE(cfg.enable_rest);
    EXPECT_TRUE(cfg.enable_stream);
    EXPECT_FALSE(cfg.show_help);
}

TEST(ScannerConfigTest, ParsesEveryFlag) {
    const auto cfg = parse({"--threshold", "0.75", "--journal", "/tmp/x.journal", "--symbols", "eth, sol",
                            "--poll-interval", "10", "--status-interval", "5", "--no-stream"});
    EXPECT_DOUBLE_EQ(cfg.threshold_pct, 0.75);
    EXPECT_EQ(cfg.journal_path, "/tmp/x.journal");
    EXPECT_EQ(cfg.symbols, (std::vector<std::string>{"ETH", "SOL"}));
    EXPECT_EQ(cfg.poll_interval, std::chrono::seconds(10));
    EXPECT_EQ(cfg.status_interval, std::chrono::seconds(5));
    EXPECT_TRUE(cfg.enable_rest);
    EXPECT_FALSE(cfg.enable_stream);
}

TEST(ScannerConfigTest, HelpShortCircuits) {
    EXPECT_TRUE(parse({"--help", "--bogus"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST(ScannerConfigTest, RejectsBadValues) {
    EXPECT_THROW(parse({"--threshold", "0"}), ConfigError);
    EXPECT_THROW(parse({"--threshold", "-0.5"}), ConfigError);
    EXPECT_THROW(parse({"--threshold", "abc"}), ConfigError);
    EXPECT_THROW(parse({"--threshold", "0.5x"}), ConfigError);
    EXPECT_THROW(parse({"--threshold", "nan"}), ConfigError);
    EXPECT_THROW(parse({"--poll-interval", "0"}), ConfigError);
    EXPECT_THROW(parse({"--poll-interval", "1.5"}), ConfigError);
    EXPECT_THROW(parse({"--symbols", " , ,"}), ConfigError);
    EXPECT_THROW(parse({"--journal", ""}), ConfigError);
    EXPECT_THROW(parse({"--no-rest", "--no-stream"}), ConfigError);
}

TEST(ScannerConfigTest, RejectsUnknownOrIncompleteFlags) {
    EXPECT_THROW(parse({"--verbose"}), ConfigError);
    EXPECT_THROW(parse({"--threshold"}), ConfigError);
}

TEST(ScannerConfigTest, SymbolListNormalization) {
    EXPECT_EQ(parse_symbol_list("btc,ETH, btc ,sol,"), (std::vector<std::string>{"BTC", "ETH", "SOL"}));
    EXPECT_TRUE(parse_symbol_list("").empty());
    EXPECT_EQ(parse_symbol_list("doge"), std::vector<std::string>{"DOGE"});
}
