#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "arbscan/clock.hpp"
#include "arbscan/id_generator.hpp"
#include "arbscan/journal.hpp"
#include "arbscan/opportunity.hpp"

namespace arbscan {

// Durable, multi-indexed log of detected opportunities plus the running Stats.
//
// The journal is the only stored copy. The by-id, by-symbol, by-date and
// by-time indexes are views rebuilt from it at open and maintained in memory,
// so a record is visible through every view or through none. One logical
// write is one journal line, appended before any view changes.
//
// Stats are lifetime counters: delete_older_than never decrements them or
// demotes the best record.
class OpportunityStore {
public:
    static constexpr std::size_t UNLIMITED = std::numeric_limits<std::size_t>::max();

    // A null journal gives a purely in-memory store. Replays the journal;
    // throws StorageError if it holds a malformed entry.
    explicit OpportunityStore(Clock& clock, std::unique_ptr<Journal> journal = nullptr);

    // Empty path opens an in-memory store
    static std::unique_ptr<OpportunityStore> open(const std::string& path, Clock& clock);

    OpportunityStore(const OpportunityStore&) = delete;
    OpportunityStore& operator=(const OpportunityStore&) = delete;

    // Returns the new record id. Throws StorageError if the journal append
    // fails, in which case nothing is recorded.
    std::string insert(const Opportunity& opportunity, Transport transport);

    // Newest first
    std::vector<OpportunityRecord> query_by_symbol(const std::string& symbol, std::size_t limit) const;

    // All records detected on the given UTC day (YYYY-MM-DD), insertion order
    std::vector<OpportunityRecord> query_by_date(const std::string& date) const;

    // Newest first across all symbols, by insertion order
    std::vector<OpportunityRecord> query_recent(std::size_t limit) const;

    std::optional<OpportunityRecord> find(const std::string& id) const;

    // Empty until the first insert
    std::optional<Stats> get_stats() const;

    // Records with detectedAt >= now - window. A window reaching back past
    // the epoch is a QueryError, as is a negative one.
    std::uint64_t count_since(Duration window) const;

    // Removes records with detectedAt < now - age from every view. Same
    // bounds on age as count_since.
    std::uint64_t delete_older_than(Duration age);

    // Rewrites the journal as a Stats snapshot followed by the live records
    void compact();

    std::size_t size() const;

    std::string describe() const;

private:
    using Seq = std::uint64_t;

    void load();
    void replay_line(const std::string& line, std::size_t line_no);

    void add_to_views(OpportunityRecord record);
    std::uint64_t remove_before(TimePoint cutoff);

    std::vector<OpportunityRecord> collect(const std::vector<Seq>& seqs) const;

    static void check_limit(std::size_t limit);
    // Returns now - d
    TimePoint checked_cutoff(Duration d, const char* what) const;

    Clock& clock_;
    std::unique_ptr<Journal> journal_;
    IdGenerator ids_;

    mutable std::shared_mutex mutex_;
    Seq next_seq_;
    std::map<Seq, OpportunityRecord> primary_;
    std::unordered_map<std::string, Seq> by_id_;
    std::unordered_map<std::string, std::set<Seq>> by_symbol_;
    std::map<std::string, std::set<Seq>> by_date_;
    std::multimap<std::int64_t, Seq> by_time_;
    std::optional<Stats> stats_;
};

} // namespace arbscan
