#include "riftcrawl/memory_repository.hpp"
#include <algorithm>

namespace riftcrawl {

namespace {

// MatchRef orders by (id, region); cursors walk (region, id).
bool region_order(const MatchRef& a, const MatchRef& b) {
    return std::tie(a.region, a.id) < std::tie(b.region, b.id);
}

} // namespace

void MemoryRepository::set_unavailable(bool unavailable, bool unreachable) {
    std::lock_guard lock(mutex_);
    unavailable_ = unavailable;
    unreachable_ = unreachable;
}

void MemoryRepository::check_available() const {
    if (unavailable_) throw StorageError("memory repository unavailable", unreachable_);
}

bool MemoryRepository::exists(EntityKind kind, const EntityRef& ref) {
    std::lock_guard lock(mutex_);
    check_available();
    if (kind == EntityKind::Match) return matches_.contains(to_match(ref));
    return crawled_players_.contains({ref.region, ref.id});
}

void MemoryRepository::put_match(const MatchRecord& match) {
    std::lock_guard lock(mutex_);
    check_available();
    matches_.try_emplace(match.ref, match);
}

std::optional<MatchRecord> MemoryRepository::get_match(const MatchRef& ref) {
    std::lock_guard lock(mutex_);
    check_available();
    auto it = matches_.find(ref);
    if (it == matches_.end()) return std::nullopt;
    return it->second;
}

int64_t MemoryRepository::match_count() {
    std::lock_guard lock(mutex_);
    check_available();
    return static_cast<int64_t>(matches_.size());
}

int MemoryRepository::put_frontier_entries(const std::vector<FrontierEntry>& entries) {
    std::lock_guard lock(mutex_);
    check_available();

    int inserted = 0;
    for (auto& e : entries) {
        FrontierEntry fresh;
        fresh.kind = e.kind;
        fresh.ref = e.ref;
        fresh.discovered_at = e.discovered_at;
        fresh.not_before = e.discovered_at;
        auto [_, added] = frontier_.try_emplace(key_of(e), Row{next_seq_, fresh});
        if (added) {
            ++next_seq_;
            ++inserted;
        }
    }
    return inserted;
}

std::vector<FrontierEntry> MemoryRepository::claim_next_batch(EntityKind kind, int limit,
                                                              TimePoint now) {
    std::lock_guard lock(mutex_);
    check_available();
    if (limit <= 0) return {};

    std::vector<Row*> ready;
    for (auto& [key, row] : frontier_) {
        auto& e = row.entry;
        if (e.kind == kind && e.state == EntryState::Pending && e.not_before <= now) {
            ready.push_back(&row);
        }
    }
    std::ranges::sort(ready, discovery_order);

    std::vector<FrontierEntry> claimed;
    for (auto* row : ready) {
        if (static_cast<int>(claimed.size()) >= limit) break;
        row->entry.state = EntryState::InFlight;
        row->entry.claimed_at = now;
        claimed.push_back(row->entry);
    }
    return claimed;
}

void MemoryRepository::mark_done(const FrontierEntry& entry) {
    std::lock_guard lock(mutex_);
    check_available();
    auto it = frontier_.find(key_of(entry));
    if (it != frontier_.end()) {
        it->second.entry.state = EntryState::Done;
        it->second.entry.claimed_at.reset();
        it->second.entry.last_error.clear();
    }
    if (entry.kind == EntityKind::Player) {
        crawled_players_.insert({entry.ref.region, entry.ref.id});
    }
}

void MemoryRepository::mark_failed(const FrontierEntry& entry, const std::string& reason) {
    std::lock_guard lock(mutex_);
    check_available();
    auto it = frontier_.find(key_of(entry));
    if (it == frontier_.end()) return;
    auto& e = it->second.entry;
    e.state = EntryState::Failed;
    e.claimed_at.reset();
    e.attempts = entry.attempts;
    e.last_error = reason;
}

void MemoryRepository::requeue(const FrontierEntry& entry, TimePoint not_before,
                               bool count_attempt, const std::string& reason) {
    std::lock_guard lock(mutex_);
    check_available();
    auto it = frontier_.find(key_of(entry));
    if (it == frontier_.end() || it->second.entry.state != EntryState::InFlight) return;
    auto& e = it->second.entry;
    e.state = EntryState::Pending;
    e.claimed_at.reset();
    e.not_before = not_before;
    if (count_attempt) ++e.attempts;
    e.last_error = reason;
}

int MemoryRepository::reclaim_stale(TimePoint claimed_before) {
    std::lock_guard lock(mutex_);
    check_available();
    int reclaimed = 0;
    for (auto& [_, row] : frontier_) {
        auto& e = row.entry;
        if (e.state == EntryState::InFlight && e.claimed_at && *e.claimed_at < claimed_before) {
            e.state = EntryState::Pending;
            e.claimed_at.reset();
            ++reclaimed;
        }
    }
    return reclaimed;
}

int MemoryRepository::reset_failed(EntityKind kind) {
    std::lock_guard lock(mutex_);
    check_available();
    auto now = std::chrono::system_clock::now();
    int reset = 0;
    for (auto& [_, row] : frontier_) {
        auto& e = row.entry;
        if (e.kind == kind && e.state == EntryState::Failed) {
            e.state = EntryState::Pending;
            e.attempts = 0;
            e.last_error.clear();
            e.not_before = now;
            ++reset;
        }
    }
    return reset;
}

std::optional<TimePoint> MemoryRepository::next_ready_time(EntityKind kind) {
    std::lock_guard lock(mutex_);
    check_available();
    std::optional<TimePoint> earliest;
    for (auto& [_, row] : frontier_) {
        auto& e = row.entry;
        if (e.kind != kind || e.state != EntryState::Pending) continue;
        if (!earliest || e.not_before < *earliest) earliest = e.not_before;
    }
    return earliest;
}

FrontierStats MemoryRepository::frontier_stats() {
    std::lock_guard lock(mutex_);
    check_available();
    FrontierStats stats;
    for (auto& [_, row] : frontier_) {
        auto& counts = row.entry.kind == EntityKind::Match ? stats.matches : stats.players;
        switch (row.entry.state) {
            case EntryState::Pending: ++counts.pending; break;
            case EntryState::InFlight: ++counts.in_flight; break;
            case EntryState::Done: ++counts.done; break;
            case EntryState::Failed: ++counts.failed; break;
        }
    }
    return stats;
}

std::vector<FrontierEntry> MemoryRepository::failed_entries() {
    std::lock_guard lock(mutex_);
    check_available();
    std::vector<const Row*> rows;
    for (auto& [_, row] : frontier_) {
        if (row.entry.state == EntryState::Failed) rows.push_back(&row);
    }
    std::ranges::sort(rows, discovery_order);

    std::vector<FrontierEntry> out;
    for (auto* row : rows) out.push_back(row->entry);
    return out;
}

std::vector<MatchRecord> MemoryRepository::read_matches(const std::optional<MatchRef>& after,
                                                        std::size_t limit) {
    std::lock_guard lock(mutex_);
    check_available();

    std::vector<const MatchRecord*> ordered;
    for (auto& [ref, record] : matches_) {
        if (!after || region_order(*after, ref)) ordered.push_back(&record);
    }
    std::ranges::sort(ordered, [](const MatchRecord* a, const MatchRecord* b) {
        return region_order(a->ref, b->ref);
    });

    std::vector<MatchRecord> out;
    for (auto* record : ordered) {
        if (out.size() >= limit) break;
        out.push_back(*record);
    }
    return out;
}

std::optional<MatchRef> MemoryRepository::match_key_at(std::size_t offset) {
    std::lock_guard lock(mutex_);
    check_available();
    if (offset >= matches_.size()) return std::nullopt;

    std::vector<MatchRef> keys;
    for (auto& [ref, _] : matches_) keys.push_back(ref);
    std::ranges::sort(keys, region_order);
    return keys[offset];
}

} // namespace riftcrawl
