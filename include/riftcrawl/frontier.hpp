#pragma once

#include "riftcrawl/repository.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace riftcrawl {

enum class StopReason {
    Exhausted,      // nothing pending or in flight
    Ceiling,        // max_matches stored
    Deadline,       // wall-clock deadline passed
    Signal,         // external shutdown request
    StorageFailure, // repository unusable
    ClientRejected, // remote service refused our credentials
};

std::string to_string(StopReason reason);

struct StopPolicy {
    int64_t max_matches = 0; // 0 = no ceiling
    std::optional<TimePoint> deadline;
};

/*
  Dedups and sequences discovery work on top of the repository's frontier
  rows. Match entries are always served before player entries so that match
  detail accumulates before the player graph fans out; within a kind the
  oldest discovery goes first.

  The seen-set is only a cache: after a restart it starts empty and the
  repository's (kind, ref) uniqueness keeps discovery idempotent. It is
  dropped whenever it grows past `seen_limit` keys.
*/
class FrontierManager {
public:
    static constexpr std::size_t kDefaultSeenLimit = 1 << 20;

    FrontierManager(Repository& repo, StopPolicy policy,
                    std::size_t seen_limit = kDefaultSeenLimit);

    int discover_players(const std::vector<PlayerRef>& players, TimePoint now);
    int discover_matches(const std::vector<MatchRef>& matches, TimePoint now);

    // Claims up to `limit` entries, never more than `match_slots` matches.
    // Player entries are only handed out when no match entry is claimable.
    std::vector<FrontierEntry> next_batch(int limit, int64_t match_slots, TimePoint now);

    std::optional<StopReason> stop_condition(TimePoint now);

    // Earliest moment a pending entry that is backing off becomes claimable.
    std::optional<TimePoint> next_ready_time();

    int reclaim_stale(std::chrono::milliseconds stale_after, TimePoint now);

    const StopPolicy& policy() const { return policy_; }
    std::size_t seen_size() const;

private:
    Repository& repo_;
    StopPolicy policy_;
    std::size_t seen_limit_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> seen_;

    int discover(EntityKind kind, const std::vector<EntityRef>& refs, TimePoint now);
    void remember(std::string key);
    static std::string cache_key(EntityKind kind, const EntityRef& ref);
};

} // namespace riftcrawl
