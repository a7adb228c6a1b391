#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "arbscan/errors.hpp"
#include "arbscan/opportunity_detector.hpp"
#include "test_support.hpp"

using namespace arbscan;
using arbscan::testing::base_time;
using arbscan::testing::make_quote;

namespace {
    PriceQuote hl(double price, const std::string& symbol = "BTC") {
        return make_quote(ExchangeId::Hyperliquid, symbol, price);
    }

    PriceQuote bn(double price, const std::string& symbol = "BTC") {
        return make_quote(ExchangeId::Binance, symbol, price);
    }
}

// ============================================================================
// detect_opportunity
// ============================================================================

TEST(DetectOpportunityTest, SmallGapBelowThresholdIsIgnored) {
    // HL=100.30, BN=100.00 -> ~0.2996%
    EXPECT_FALSE(detect_opportunity(hl(100.30), bn(100.00), 0.3, base_time()).has_value());
}

TEST(DetectOpportunityTest, GapAboveThresholdBuysCheaperSide) {
    const auto opp = detect_opportunity(hl(101.00), bn(100.00), 0.5, base_time());

    ASSERT_TRUE(opp.has_value());
    EXPECT_EQ(opp->symbol, "BTC");
    EXPECT_DOUBLE_EQ(opp->price_a, 101.0);
    EXPECT_DOUBLE_EQ(opp->price_b, 100.0);
    EXPECT_DOUBLE_EQ(opp->abs_diff, 1.0);
    EXPECT_NEAR(opp->pct_diff, 1.0 / 100.5 * 100.0, 1e-12);
    EXPECT_NEAR(opp->pct_diff, 0.995, 1e-3);
    EXPECT_EQ(opp->direction, Direction::BuyBSellA);
    EXPECT_EQ(opp->buy_side(), ExchangeId::Binance);
    EXPECT_EQ(opp->detected_at, base_time());
}

TEST(DetectOpportunityTest, CheaperExchangeAIsBuySide) {
    const auto opp = detect_opportunity(hl(99.0), bn(100.0), 0.5, base_time());

    ASSERT_TRUE(opp.has_value());
    EXPECT_EQ(opp->direction, Direction::BuyASellB);
    EXPECT_EQ(opp->buy_side(), ExchangeId::Hyperliquid);
}

TEST(DetectOpportunityTest, ThresholdIsInclusive) {
    // |125-75| / 100 * 100 is exactly 50
    EXPECT_TRUE(detect_opportunity(hl(125.0), bn(75.0), 50.0, base_time()).has_value());
    EXPECT_FALSE(detect_opportunity(hl(125.0), bn(75.0), std::nextafter(50.0, 100.0), base_time()).has_value());
}

TEST(DetectOpportunityTest, EqualPricesNeverQualify) {
    EXPECT_FALSE(detect_opportunity(hl(100.0), bn(100.0), std::numeric_limits<double>::min(), base_time()).has_value());
}

TEST(DetectOpportunityTest, EmitsIffGapReachesThreshold) {
    const double prices[] = {0.0001, 0.5, 1.0, 99.7, 100.0, 100.3, 101.0, 250.0, 60000.0};
    const double thresholds[] = {0.01, 0.3, 0.5, 1.0, 5.0};

    for (double a : prices) {
        for (double b : prices) {
            for (double threshold : thresholds) {
                const double pct = std::fabs(a - b) / ((a + b) / 2.0) * 100.0;
                const auto opp = detect_opportunity(hl(a), bn(b), threshold, base_time());

                ASSERT_EQ(opp.has_value(), pct >= threshold) << "a=" << a << " b=" << b << " t=" << threshold;
                if (opp) {
                    EXPECT_EQ(opp->direction, a < b ? Direction::BuyASellB : Direction::BuyBSellA);
                    EXPECT_GE(opp->pct_diff, threshold);
                }
            }
        }
    }
}

TEST(DetectOpportunityTest, SameInputsGiveSameOutput) {
    const auto first = detect_opportunity(hl(101.0), bn(100.0), 0.5, base_time());
    const auto second = detect_opportunity(hl(101.0), bn(100.0), 0.5, base_time());

    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
}

TEST(DetectOpportunityTest, RejectsMismatchedOrInvalidQuotes) {
    EXPECT_THROW(detect_opportunity(hl(101.0, "BTC"), bn(100.0, "ETH"), 0.5, base_time()), std::invalid_argument);
    EXPECT_THROW(detect_opportunity(hl(0.0), bn(100.0), 0.5, base_time()), std::invalid_argument);
    EXPECT_THROW(detect_opportunity(hl(101.0), bn(-1.0), 0.5, base_time()), std::invalid_argument);
    EXPECT_THROW(detect_opportunity(hl(std::nan("")), bn(100.0), 0.5, base_time()), std::invalid_argument);
}

// ============================================================================
// OpportunityDetector
// ============================================================================

TEST(OpportunityDetectorTest, RejectsNonPositiveThresholds) {
    EXPECT_THROW(OpportunityDetector(0.0), ConfigError);
    EXPECT_THROW(OpportunityDetector(-0.5), ConfigError);
    EXPECT_THROW(OpportunityDetector(std::nan("")), ConfigError);
    EXPECT_THROW(OpportunityDetector(std::numeric_limits<double>::infinity()), ConfigError);
}

TEST(OpportunityDetectorTest, ThresholdIsMutableAtRuntime) {
    OpportunityDetector detector(0.5);
    EXPECT_TRUE(detector.detect(hl(101.0), bn(100.0), base_time()).has_value());

    detector.set_threshold(1.0);
    EXPECT_DOUBLE_EQ(detector.threshold(), 1.0);
    EXPECT_FALSE(detector.detect(hl(101.0), bn(100.0), base_time()).has_value());
}

TEST(OpportunityDetectorTest, InvalidUpdateKeepsPreviousThreshold) {
    OpportunityDetector detector(0.5);
    EXPECT_THROW(detector.set_threshold(0.0), ConfigError);
    EXPECT_DOUBLE_EQ(detector.threshold(), 0.5);
}
