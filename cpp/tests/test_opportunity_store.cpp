#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <regex>
#include <set>
#include <thread>
#include <vector>

#include "arbscan/clock.hpp"
#include "arbscan/errors.hpp"
#include "arbscan/opportunity_store.hpp"
#include "test_support.hpp"

using namespace arbscan;
using arbscan::testing::base_time;
using arbscan::testing::FailingJournal;
using arbscan::testing::make_opportunity;

namespace {
    constexpr Duration kDay = std::chrono::hours(24);
}

class OpportunityStoreTest : public ::testing::Test {
protected:
    OpportunityStoreTest()
        : clock_(base_time())
        , store_(clock_)
    {}

    ManualClock clock_;
    OpportunityStore store_;
};

TEST_F(OpportunityStoreTest, IdsHaveExpectedShapeAndAreUnique) {
    const std::regex pattern("arb_[0-9]+_[0-9a-z]{9}");
    std::set<std::string> seen;

    for (int i = 0; i < 200; ++i) {
        const std::string id = store_.insert(make_opportunity("BTC", 0.5), Transport::Rest);
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        EXPECT_TRUE(seen.insert(id).second) << "duplicate " << id;
    }
    EXPECT_EQ(store_.size(), 200u);

    const std::string prefix = "arb_" + std::to_string(to_epoch_ms(base_time())) + "_";
    EXPECT_EQ(seen.begin()->rfind(prefix, 0), 0u);
}

TEST_F(OpportunityStoreTest, RecentReturnsInsertedRecordsNewestFirst) {
    const auto first = store_.insert(make_opportunity("BTC", 0.4), Transport::Rest);
    const auto second = store_.insert(make_opportunity("ETH", 0.7, base_time(), Direction::BuyASellB), Transport::Stream);

    const auto recent = store_.query_recent(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].id, second);
    EXPECT_EQ(recent[1].id, first);

    const auto& eth = recent[0];
    EXPECT_EQ(eth.symbol(), "ETH");
    EXPECT_DOUBLE_EQ(eth.opportunity.price_a, 100.7);
    EXPECT_DOUBLE_EQ(eth.opportunity.price_b, 100.0);
    EXPECT_DOUBLE_EQ(eth.pct_diff(), 0.7);
    EXPECT_EQ(eth.opportunity.direction, Direction::BuyASellB);
    EXPECT_EQ(eth.transport, Transport::Stream);
    EXPECT_EQ(eth.detected_at_iso, "2024-03-10T12:00:00.000Z");

    EXPECT_EQ(store_.query_recent(1).size(), 1u);
    ASSERT_TRUE(store_.find(first).has_value());
    EXPECT_EQ(store_.find(first)->symbol(), "BTC");
    EXPECT_FALSE(store_.find("arb_0_000000000").has_value());
}

TEST_F(OpportunityStoreTest, StatsEmptyBeforeFirstInsert) {
    EXPECT_FALSE(store_.get_stats().has_value());
    EXPECT_EQ(store_.count_since(kDay), 0u);
    EXPECT_TRUE(store_.query_recent(5).empty());
}

TEST_F(OpportunityStoreTest, RunningMeanAndBest) {
    store_.insert(make_opportunity("BTC", 0.6), Transport::Rest);
    const auto best_id = store_.insert(make_opportunity("BTC", 1.2, base_time(), Direction::BuyASellB), Transport::Stream);
    store_.insert(make_opportunity("BTC", 0.9), Transport::Rest);

    const auto stats = store_.get_stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_count, 3u);
    EXPECT_NEAR(stats->running_mean_pct, 0.9, 1e-9);
    ASSERT_TRUE(stats->best.has_value());
    EXPECT_EQ(stats->best->id, best_id);
    EXPECT_DOUBLE_EQ(stats->best->pct_diff(), 1.2);
    EXPECT_EQ(stats->count_by_symbol.at("BTC"), 3u);
    EXPECT_EQ(stats->count_by_symbol.size(), 1u);
    EXPECT_EQ(stats->count_by_direction.at(Direction::BuyBSellA), 2u);
    EXPECT_EQ(stats->count_by_direction.at(Direction::BuyASellB), 1u);
}

TEST_F(OpportunityStoreTest, TieKeepsEarliestBest) {
    const auto first = store_.insert(make_opportunity("BTC", 0.8), Transport::Rest);
    store_.insert(make_opportunity("ETH", 0.8), Transport::Rest);
    store_.insert(make_opportunity("SOL", 0.3), Transport::Rest);

    const auto stats = store_.get_stats();
    ASSERT_TRUE(stats && stats->best);
    EXPECT_EQ(stats->best->id, first);
}

TEST_F(OpportunityStoreTest, StatsInvariantsHoldAcrossInserts) {
    const std::vector<std::string> symbols{"BTC", "ETH", "SOL"};
    double max_pct = 0.0;

    for (int i = 0; i < 60; ++i) {
        const double pct = 0.3 + (i * 37 % 17) * 0.05;
        const Direction dir = (i % 3 == 0) ? Direction::BuyASellB : Direction::BuyBSellA;
        max_pct = std::max(max_pct, pct);
        store_.insert(make_opportunity(symbols[i % symbols.size()], pct, base_time(), dir), Transport::Rest);

        const auto stats = store_.get_stats();
        ASSERT_TRUE(stats.has_value());

        std::uint64_t by_symbol = 0;
        for (const auto& entry : stats->count_by_symbol) {
            by_symbol += entry.second;
        }
        std::uint64_t by_direction = 0;
        for (const auto& entry : stats->count_by_direction) {
            by_direction += entry.second;
        }
        EXPECT_EQ(by_symbol, stats->total_count);
        EXPECT_EQ(by_direction, stats->total_count);
        ASSERT_TRUE(stats->best.has_value());
        EXPECT_DOUBLE_EQ(stats->best->pct_diff(), max_pct);
    }
}

TEST_F(OpportunityStoreTest, LastUpdatedTracksClockAndReadsAreStable) {
    store_.insert(make_opportunity("BTC", 0.5), Transport::Rest);
    clock_.advance(std::chrono::seconds(42));
    store_.insert(make_opportunity("BTC", 0.6), Transport::Rest);

    const auto stats = store_.get_stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->last_updated_at, base_time() + std::chrono::seconds(42));

    clock_.advance(std::chrono::hours(1));
    EXPECT_EQ(*store_.get_stats(), *stats);
    EXPECT_EQ(store_.get_stats()->to_json(), stats->to_json());
}

TEST_F(OpportunityStoreTest, QueryBySymbolNewestFirstWithLimit) {
    store_.insert(make_opportunity("BTC", 0.5, base_time() - std::chrono::minutes(10)), Transport::Rest);
    const auto newest = store_.insert(make_opportunity("BTC", 0.6, base_time()), Transport::Rest);
    store_.insert(make_opportunity("ETH", 0.9), Transport::Rest);
    // Arrives later but was detected earliest
    const auto oldest = store_.insert(make_opportunity("BTC", 0.7, base_time() - std::chrono::minutes(20)), Transport::Rest);

    const auto btc = store_.query_by_symbol("BTC", 10);
    ASSERT_EQ(btc.size(), 3u);
    EXPECT_EQ(btc.front().id, newest);
    EXPECT_EQ(btc.back().id, oldest);
    for (const auto& r : btc) {
        EXPECT_EQ(r.symbol(), "BTC");
    }

    const auto limited = store_.query_by_symbol("BTC", 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].id, newest);

    EXPECT_TRUE(store_.query_by_symbol("DOGE", 10).empty());
    EXPECT_THROW(store_.query_by_symbol("", 10), QueryError);
}

TEST_F(OpportunityStoreTest, QueryByDateUsesUtcDay) {
    // 2024-03-10T23:59:59.999Z and 2024-03-11T00:00:00.000Z
    const TimePoint before_midnight = from_epoch_ms(1710115199999);
    const TimePoint midnight = from_epoch_ms(1710115200000);

    const auto late = store_.insert(make_opportunity("BTC", 0.5, before_midnight), Transport::Rest);
    const auto next = store_.insert(make_opportunity("ETH", 0.5, midnight), Transport::Rest);
    const auto noon = store_.insert(make_opportunity("SOL", 0.5, base_time()), Transport::Rest);

    const auto day1 = store_.query_by_date("2024-03-10");
    ASSERT_EQ(day1.size(), 2u);
    EXPECT_EQ(day1[0].id, late);
    EXPECT_EQ(day1[1].id, noon);

    const auto day2 = store_.query_by_date("2024-03-11");
    ASSERT_EQ(day2.size(), 1u);
    EXPECT_EQ(day2[0].id, next);

    EXPECT_TRUE(store_.query_by_date("2024-03-12").empty());
}

TEST_F(OpportunityStoreTest, MalformedDateIsQueryError) {
    EXPECT_THROW(store_.query_by_date("2024/03/10"), QueryError);
    EXPECT_THROW(store_.query_by_date("2024-13-01"), QueryError);
    EXPECT_THROW(store_.query_by_date("2023-02-29"), QueryError);
    EXPECT_THROW(store_.query_by_date(""), QueryError);
    EXPECT_NO_THROW(store_.query_by_date("2024-02-29"));
}

TEST_F(OpportunityStoreTest, CountSinceUsesDetectedAt) {
    store_.insert(make_opportunity("BTC", 0.5, base_time() - std::chrono::hours(30)), Transport::Rest);
    store_.insert(make_opportunity("BTC", 0.5, base_time() - std::chrono::hours(2)), Transport::Rest);
    store_.insert(make_opportunity("ETH", 0.5, base_time() - kDay), Transport::Rest);
    store_.insert(make_opportunity("ETH", 0.5, base_time()), Transport::Rest);

    EXPECT_EQ(store_.count_since(kDay), 3u);  // boundary record included
    EXPECT_EQ(store_.count_since(std::chrono::hours(3)), 2u);
    EXPECT_EQ(store_.count_since(Duration(0)), 1u);
}

TEST_F(OpportunityStoreTest, DeleteOlderThanKeepsLifetimeStats) {
    const auto old_id = store_.insert(make_opportunity("BTC", 1.5, base_time() - 40 * kDay), Transport::Rest);
    const auto fresh_id = store_.insert(make_opportunity("BTC", 0.5, base_time() - kDay), Transport::Rest);
    const std::string old_day = date_key(base_time() - 40 * kDay);

    EXPECT_EQ(store_.delete_older_than(30 * kDay), 1u);

    EXPECT_FALSE(store_.find(old_id).has_value());
    EXPECT_TRUE(store_.find(fresh_id).has_value());
    EXPECT_EQ(store_.size(), 1u);

    const auto btc = store_.query_by_symbol("BTC", 10);
    ASSERT_EQ(btc.size(), 1u);
    EXPECT_EQ(btc[0].id, fresh_id);
    EXPECT_TRUE(store_.query_by_date(old_day).empty());
    EXPECT_EQ(store_.count_since(100 * kDay), 1u);

    const auto stats = store_.get_stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_count, 2u);
    EXPECT_EQ(stats->count_by_symbol.at("BTC"), 2u);
    ASSERT_TRUE(stats->best.has_value());
    EXPECT_EQ(stats->best->id, old_id);

    EXPECT_EQ(store_.delete_older_than(30 * kDay), 0u);
}

TEST_F(OpportunityStoreTest, InvalidArgumentsAreQueryErrors) {
    EXPECT_THROW(store_.query_recent(0), QueryError);
    EXPECT_THROW(store_.query_by_symbol("BTC", 0), QueryError);
    EXPECT_THROW(store_.count_since(Duration(-1)), QueryError);
    EXPECT_THROW(store_.delete_older_than(Duration(-1)), QueryError);
}

TEST_F(OpportunityStoreTest, WindowsPastTheEpochAreRejected) {
    store_.insert(make_opportunity("BTC", 0.5, base_time() - std::chrono::hours(12)), Transport::Rest);

    const Duration huge = Duration::max();
    const Duration just_past_epoch = base_time().time_since_epoch() + Duration(1);

    EXPECT_THROW(store_.delete_older_than(huge), QueryError);
    EXPECT_THROW(store_.delete_older_than(just_past_epoch), QueryError);
    EXPECT_THROW(store_.count_since(huge), QueryError);
    EXPECT_EQ(store_.size(), 1u);

    // Reaching back exactly to the epoch is still allowed
    EXPECT_EQ(store_.count_since(base_time().time_since_epoch()), 1u);
    EXPECT_EQ(store_.delete_older_than(base_time().time_since_epoch()), 0u);
}

TEST_F(OpportunityStoreTest, ConcurrentInsertsAndReads) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::mutex ids_mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &ids_mutex, &ids]() {
            const std::string symbol = (t % 2 == 0) ? "BTC" : "ETH";
            for (int i = 0; i < kPerThread; ++i) {
                const auto id = store_.insert(make_opportunity(symbol, 0.3 + i * 0.001), Transport::Stream);
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(id);
            }
        });
    }
    threads.emplace_back([this]() {
        for (int i = 0; i < 200; ++i) {
            const auto stats = store_.get_stats();
            if (stats) {
                std::uint64_t sum = 0;
                for (const auto& entry : stats->count_by_symbol) {
                    sum += entry.second;
                }
                EXPECT_EQ(sum, stats->total_count);
            }
            store_.query_recent(10);
        }
    });
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(store_.size(), ids.size());
    EXPECT_EQ(store_.get_stats()->total_count, ids.size());
}

TEST(OpportunityStoreFailureTest, FailedAppendRecordsNothing) {
    ManualClock clock(base_time());
    auto journal = std::make_unique<FailingJournal>();
    FailingJournal* raw = journal.get();
    OpportunityStore store(clock, std::move(journal));

    EXPECT_THROW(store.insert(make_opportunity("BTC", 0.5), Transport::Rest), StorageError);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_FALSE(store.get_stats().has_value());
    EXPECT_TRUE(store.query_by_symbol("BTC", 10).empty());

    raw->fail_appends = false;
    store.insert(make_opportunity("BTC", 0.5), Transport::Rest);
    EXPECT_EQ(raw->appended.load(), 1);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get_stats()->total_count, 1u);
}

TEST(OpportunityStoreFailureTest, FailedPurgeKeepsRecords) {
    ManualClock clock(base_time());
    auto journal = std::make_unique<FailingJournal>();
    FailingJournal* raw = journal.get();
    OpportunityStore store(clock, std::move(journal));

    raw->fail_appends = false;
    store.insert(make_opportunity("BTC", 0.5, base_time() - std::chrono::hours(24 * 40)), Transport::Rest);
    raw->fail_appends = true;

    EXPECT_THROW(store.delete_older_than(std::chrono::hours(24)), StorageError);
    EXPECT_EQ(store.size(), 1u);
}
