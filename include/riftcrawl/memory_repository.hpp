#pragma once

#include "riftcrawl/repository.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <tuple>

namespace riftcrawl {

// Process-local Repository for tests and dry runs. Nothing survives the
// object; every operation holds the state mutex for its whole duration.
class MemoryRepository final : public Repository {
public:
    bool exists(EntityKind kind, const EntityRef& ref) override;

    void put_match(const MatchRecord& match) override;
    std::optional<MatchRecord> get_match(const MatchRef& ref) override;
    int64_t match_count() override;

    int put_frontier_entries(const std::vector<FrontierEntry>& entries) override;
    std::vector<FrontierEntry> claim_next_batch(EntityKind kind, int limit,
                                                TimePoint now) override;
    using Repository::claim_next_batch;

    void mark_done(const FrontierEntry& entry) override;
    void mark_failed(const FrontierEntry& entry, const std::string& reason) override;
    void requeue(const FrontierEntry& entry, TimePoint not_before,
                 bool count_attempt, const std::string& reason) override;
    int reclaim_stale(TimePoint claimed_before) override;
    int reset_failed(EntityKind kind) override;

    std::optional<TimePoint> next_ready_time(EntityKind kind) override;
    FrontierStats frontier_stats() override;
    std::vector<FrontierEntry> failed_entries() override;

    std::vector<MatchRecord> read_matches(const std::optional<MatchRef>& after,
                                          std::size_t limit) override;
    std::optional<MatchRef> match_key_at(std::size_t offset) override;

    // Test hook: every subsequent operation throws StorageError.
    void set_unavailable(bool unavailable, bool unreachable = false);

private:
    using Key = std::tuple<EntityKind, std::string, std::string>; // kind, region, id

    struct Row {
        uint64_t seq = 0;
        FrontierEntry entry;
    };

    std::mutex mutex_;
    std::map<MatchRef, MatchRecord> matches_;
    std::set<std::pair<std::string, std::string>> crawled_players_;
    std::map<Key, Row> frontier_;
    uint64_t next_seq_ = 0;
    bool unavailable_ = false;
    bool unreachable_ = false;

    static Key key_of(const FrontierEntry& e) {
        return {e.kind, e.ref.region, e.ref.id};
    }

    static bool discovery_order(const Row* a, const Row* b) {
        return std::tie(a->entry.discovered_at, a->seq) < std::tie(b->entry.discovered_at, b->seq);
    }

    void check_available() const;
};

} // namespace riftcrawl
