#include "arbscan/opportunity_store.hpp"
#include "arbscan/errors.hpp"
#include "arbscan/json_fields.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <mutex>

namespace arbscan {

namespace {
    std::string insert_entry(const OpportunityRecord& record, TimePoint stats_at) {
        std::string line = "{\"type\":\"insert\",";
        record.write_fields(line);
        line += ",\"statsAt\":" + std::to_string(to_epoch_ms(stats_at)) + "}";
        return line;
    }

    std::string record_entry(const char* type, const OpportunityRecord& record) {
        std::string line = std::string("{\"type\":\"") + type + "\",";
        record.write_fields(line);
        line += "}";
        return line;
    }
}

OpportunityStore::OpportunityStore(Clock& clock, std::unique_ptr<Journal> journal)
    : clock_(clock)
    , journal_(std::move(journal))
    , next_seq_(1)
{
    if (journal_) {
        load();
    }
}

std::unique_ptr<OpportunityStore> OpportunityStore::open(const std::string& path, Clock& clock) {
    if (path.empty()) {
        return std::make_unique<OpportunityStore>(clock);
    }
    return std::make_unique<OpportunityStore>(clock, std::make_unique<FileJournal>(path));
}

void OpportunityStore::load() {
    std::size_t entries = 0;
    journal_->replay([this, &entries](const std::string& line, std::size_t line_no) {
        replay_line(line, line_no);
        ++entries;
    });

    std::cout << "[OpportunityStore] Replayed " << entries << " entries from "
              << journal_->describe() << ": " << primary_.size() << " live records, "
              << (stats_ ? stats_->total_count : 0) << " recorded in total" << std::endl;
}

void OpportunityStore::replay_line(const std::string& line, std::size_t line_no) {
    const std::string where = journal_->describe() + ":" + std::to_string(line_no);

    try {
        const json::FlatObject obj = json::parse_object(line);
        const std::string type = obj.get_string("type");

        if (type == "insert") {
            OpportunityRecord record = OpportunityRecord::from_fields(obj);
            const TimePoint stats_at = from_epoch_ms(obj.get_int64("statsAt"));
            if (!stats_) {
                stats_ = Stats{};
            }
            stats_->apply(record, stats_at);
            add_to_views(std::move(record));
        } else if (type == "record") {
            add_to_views(OpportunityRecord::from_fields(obj));
        } else if (type == "purge") {
            remove_before(from_epoch_ms(obj.get_int64("before")));
        } else if (type == "stats") {
            Stats stats;
            stats.total_count = obj.get_uint64("totalCount");
            stats.running_mean_pct = obj.get_double("runningMeanPct");
            stats.last_updated_at = from_epoch_ms(obj.get_int64("lastUpdatedAt"));
            stats_ = std::move(stats);
        } else if (type == "stats_symbol" || type == "stats_direction" || type == "stats_best") {
            if (!stats_) {
                throw StorageError(type + " entry before stats snapshot at " + where);
            }
            if (type == "stats_symbol") {
                stats_->count_by_symbol[obj.get_string("symbol")] = obj.get_uint64("count");
            } else if (type == "stats_direction") {
                stats_->count_by_direction[parse_direction(obj.get_string("direction"))] = obj.get_uint64("count");
            } else {
                stats_->best = OpportunityRecord::from_fields(obj);
            }
        } else {
            throw StorageError("unknown entry type '" + type + "' at " + where);
        }
    } catch (const json::ParseError& e) {
        throw StorageError(std::string(e.what()) + " at " + where);
    } catch (const std::invalid_argument& e) {
        throw StorageError(std::string(e.what()) + " at " + where);
    }
}

void OpportunityStore::add_to_views(OpportunityRecord record) {
    if (by_id_.count(record.id) != 0) {
        throw StorageError("duplicate record id " + record.id);
    }

    const Seq seq = next_seq_++;
    by_id_.emplace(record.id, seq);
    by_symbol_[record.symbol()].insert(seq);
    by_date_[date_key(record.detected_at())].insert(seq);
    by_time_.emplace(to_epoch_ms(record.detected_at()), seq);
    primary_.emplace(seq, std::move(record));
}

std::uint64_t OpportunityStore::remove_before(TimePoint cutoff) {
    const auto end = by_time_.lower_bound(to_epoch_ms(cutoff));
    std::uint64_t removed = 0;

    for (auto it = by_time_.begin(); it != end; ++it) {
        auto rec = primary_.find(it->second);
        if (rec == primary_.end()) {
            continue;
        }
        const OpportunityRecord& record = rec->second;

        by_id_.erase(record.id);

        auto sym = by_symbol_.find(record.symbol());
        if (sym != by_symbol_.end()) {
            sym->second.erase(it->second);
            if (sym->second.empty()) {
                by_symbol_.erase(sym);
            }
        }

        auto day = by_date_.find(date_key(record.detected_at()));
        if (day != by_date_.end()) {
            day->second.erase(it->second);
            if (day->second.empty()) {
                by_date_.erase(day);
            }
        }

        primary_.erase(rec);
        ++removed;
    }

    by_time_.erase(by_time_.begin(), end);
    return removed;
}

std::string OpportunityStore::insert(const Opportunity& opportunity, Transport transport) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const TimePoint now = clock_.now();

    OpportunityRecord record;
    do {
        record.id = ids_.next(now);
    } while (by_id_.count(record.id) != 0);
    record.opportunity = opportunity;
    record.transport = transport;
    record.detected_at_iso = to_iso8601(opportunity.detected_at);

    if (journal_) {
        journal_->append(insert_entry(record, now));
    }

    if (!stats_) {
        stats_ = Stats{};
    }
    stats_->apply(record, now);

    std::string id = record.id;
    add_to_views(std::move(record));
    return id;
}

std::vector<OpportunityRecord> OpportunityStore::collect(const std::vector<Seq>& seqs) const {
    std::vector<OpportunityRecord> out;
    out.reserve(seqs.size());
    for (Seq seq : seqs) {
        out.push_back(primary_.at(seq));
    }
    return out;
}

std::vector<OpportunityRecord> OpportunityStore::query_by_symbol(const std::string& symbol, std::size_t limit) const {
    if (symbol.empty()) {
        throw QueryError("symbol must not be empty");
    }
    check_limit(limit);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) {
        return {};
    }

    std::vector<Seq> seqs(it->second.begin(), it->second.end());
    std::sort(seqs.begin(), seqs.end(), [this](Seq lhs, Seq rhs) {
        const TimePoint l = primary_.at(lhs).detected_at();
        const TimePoint r = primary_.at(rhs).detected_at();
        if (l != r) {
            return l > r;
        }
        return lhs > rhs;
    });
    if (seqs.size() > limit) {
        seqs.resize(limit);
    }
    return collect(seqs);
}

std::vector<OpportunityRecord> OpportunityStore::query_by_date(const std::string& date) const {
    if (!is_valid_date_key(date)) {
        throw QueryError("date must be YYYY-MM-DD, got '" + date + "'");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_date_.find(date);
    if (it == by_date_.end()) {
        return {};
    }
    return collect(std::vector<Seq>(it->second.begin(), it->second.end()));
}

std::vector<OpportunityRecord> OpportunityStore::query_recent(std::size_t limit) const {
    check_limit(limit);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<OpportunityRecord> out;
    out.reserve(std::min(limit, primary_.size()));
    for (auto it = primary_.rbegin(); it != primary_.rend() && out.size() < limit; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::optional<OpportunityRecord> OpportunityStore::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return primary_.at(it->second);
}

std::optional<Stats> OpportunityStore::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stats_;
}

std::uint64_t OpportunityStore::count_since(Duration window) const {
    const std::int64_t since = to_epoch_ms(checked_cutoff(window, "window"));

    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<std::uint64_t>(std::distance(by_time_.lower_bound(since), by_time_.end()));
}

std::uint64_t OpportunityStore::delete_older_than(Duration age) {
    const TimePoint cutoff = checked_cutoff(age, "age");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (by_time_.empty() || by_time_.begin()->first >= to_epoch_ms(cutoff)) {
        return 0;
    }

    if (journal_) {
        journal_->append("{\"type\":\"purge\",\"before\":" + std::to_string(to_epoch_ms(cutoff)) + "}");
    }
    return remove_before(cutoff);
}

void OpportunityStore::compact() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!journal_) {
        return;
    }

    std::vector<std::string> lines;
    lines.reserve(primary_.size() + 8);

    if (stats_) {
        lines.push_back("{\"type\":\"stats\",\"totalCount\":" + std::to_string(stats_->total_count)
                        + ",\"runningMeanPct\":" + json::format_double(stats_->running_mean_pct)
                        + ",\"lastUpdatedAt\":" + std::to_string(to_epoch_ms(stats_->last_updated_at)) + "}");
        for (const auto& [symbol, count] : stats_->count_by_symbol) {
            lines.push_back("{\"type\":\"stats_symbol\",\"symbol\":" + json::quote(symbol)
                            + ",\"count\":" + std::to_string(count) + "}");
        }
        for (const auto& [direction, count] : stats_->count_by_direction) {
            lines.push_back("{\"type\":\"stats_direction\",\"direction\":\"" + std::string(to_string(direction))
                            + "\",\"count\":" + std::to_string(count) + "}");
        }
        if (stats_->best) {
            lines.push_back(record_entry("stats_best", *stats_->best));
        }
    }

    for (const auto& entry : primary_) {
        lines.push_back(record_entry("record", entry.second));
    }

    journal_->rewrite(lines);
    std::cout << "[OpportunityStore] Compacted " << journal_->describe() << " to "
              << lines.size() << " entries" << std::endl;
}

std::size_t OpportunityStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return primary_.size();
}

std::string OpportunityStore::describe() const {
    return journal_ ? journal_->describe() : std::string("<memory>");
}

void OpportunityStore::check_limit(std::size_t limit) {
    if (limit == 0) {
        throw QueryError("limit must be at least 1");
    }
}

TimePoint OpportunityStore::checked_cutoff(Duration d, const char* what) const {
    if (d.count() < 0) {
        throw QueryError(std::string(what) + " must not be negative");
    }
    const TimePoint now = clock_.now();
    if (d > now.time_since_epoch()) {
        throw QueryError(std::string(what) + " of " + std::to_string(d.count())
                         + " ms reaches back before 1970-01-01");
    }
    return now - d;
}

} // namespace arbscan
