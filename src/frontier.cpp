#include "riftcrawl/frontier.hpp"
#include "riftcrawl/logging.hpp"
#include <algorithm>

namespace riftcrawl {

std::string to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Exhausted: return "exhausted";
        case StopReason::Ceiling: return "ceiling";
        case StopReason::Deadline: return "deadline";
        case StopReason::Signal: return "signal";
        case StopReason::StorageFailure: return "storage_failure";
        case StopReason::ClientRejected: return "client_rejected";
    }
    return "exhausted";
}

FrontierManager::FrontierManager(Repository& repo, StopPolicy policy, std::size_t seen_limit)
    : repo_(repo), policy_(std::move(policy)), seen_limit_(std::max<std::size_t>(seen_limit, 1)) {}

std::size_t FrontierManager::seen_size() const {
    std::lock_guard lock(mutex_);
    return seen_.size();
}

// Caller holds mutex_.
void FrontierManager::remember(std::string key) {
    if (seen_.size() >= seen_limit_) {
        RIFTCRAWL_LOG_DEBUG("frontier seen-cache full ({} keys), clearing", seen_.size());
        seen_.clear();
    }
    seen_.insert(std::move(key));
}

std::string FrontierManager::cache_key(EntityKind kind, const EntityRef& ref) {
    return to_string(kind) + "/" + ref.region + "/" + ref.id;
}

int FrontierManager::discover(EntityKind kind, const std::vector<EntityRef>& refs,
                              TimePoint now) {
    std::vector<FrontierEntry> fresh;
    std::vector<std::string> keys;

    for (auto& ref : refs) {
        if (ref.id.empty()) continue;
        auto key = cache_key(kind, ref);
        {
            std::lock_guard lock(mutex_);
            if (seen_.contains(key)) continue;
        }
        if (std::ranges::find(keys, key) != keys.end()) continue;
        if (repo_.exists(kind, ref)) {
            std::lock_guard lock(mutex_);
            remember(std::move(key));
            continue;
        }

        FrontierEntry e;
        e.kind = kind;
        e.ref = ref;
        e.discovered_at = now;
        e.not_before = now;
        fresh.push_back(std::move(e));
        keys.push_back(std::move(key));
    }

    int inserted = repo_.put_frontier_entries(fresh);

    std::lock_guard lock(mutex_);
    for (auto& key : keys) remember(std::move(key));
    return inserted;
}

int FrontierManager::discover_players(const std::vector<PlayerRef>& players, TimePoint now) {
    std::vector<EntityRef> refs;
    refs.reserve(players.size());
    for (auto& p : players) refs.push_back(to_entity(p));
    return discover(EntityKind::Player, refs, now);
}

int FrontierManager::discover_matches(const std::vector<MatchRef>& matches, TimePoint now) {
    std::vector<EntityRef> refs;
    refs.reserve(matches.size());
    for (auto& m : matches) refs.push_back(to_entity(m));
    return discover(EntityKind::Match, refs, now);
}

std::vector<FrontierEntry> FrontierManager::next_batch(int limit, int64_t match_slots,
                                                       TimePoint now) {
    if (limit <= 0) return {};

    // No room left under the ceiling: expanding players would only grow a
    // frontier that can never be drained.
    if (policy_.max_matches > 0 && match_slots <= 0) return {};

    auto match_limit = static_cast<int>(std::min<int64_t>(limit, match_slots));
    if (policy_.max_matches == 0) match_limit = limit;

    auto batch = repo_.claim_next_batch(EntityKind::Match, match_limit, now);
    if (!batch.empty()) return batch;
    return repo_.claim_next_batch(EntityKind::Player, limit, now);
}

std::optional<StopReason> FrontierManager::stop_condition(TimePoint now) {
    if (policy_.deadline && now >= *policy_.deadline) return StopReason::Deadline;
    if (policy_.max_matches > 0 && repo_.match_count() >= policy_.max_matches) {
        return StopReason::Ceiling;
    }

    auto stats = repo_.frontier_stats();
    auto open = stats.players.pending + stats.players.in_flight +
                stats.matches.pending + stats.matches.in_flight;
    if (open == 0) return StopReason::Exhausted;
    return std::nullopt;
}

std::optional<TimePoint> FrontierManager::next_ready_time() {
    auto m = repo_.next_ready_time(EntityKind::Match);
    auto p = repo_.next_ready_time(EntityKind::Player);
    if (m && p) return std::min(*m, *p);
    return m ? m : p;
}

int FrontierManager::reclaim_stale(std::chrono::milliseconds stale_after, TimePoint now) {
    int reclaimed = repo_.reclaim_stale(now - stale_after);
    if (reclaimed > 0) {
        RIFTCRAWL_LOG_WARN("reclaimed {} stale in-flight entries", reclaimed);
    }
    return reclaimed;
}

} // namespace riftcrawl
