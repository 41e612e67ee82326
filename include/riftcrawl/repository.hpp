#pragma once

#include "riftcrawl/errors.hpp"
#include "riftcrawl/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace riftcrawl {

struct KindCounts {
    int64_t pending = 0;
    int64_t in_flight = 0;
    int64_t done = 0;
    int64_t failed = 0;
};

struct FrontierStats {
    KindCounts players;
    KindCounts matches;

    const KindCounts& of(EntityKind kind) const {
        return kind == EntityKind::Match ? matches : players;
    }
};

class Repository;

// Lazy, read-only walk over stored matches in (region, match_id) order.
// position() is the number of records consumed from the start, so a new
// cursor opened at that offset continues where this one stopped.
class MatchCursor {
public:
    MatchCursor(Repository& repo, std::size_t offset, std::size_t page_size);

    std::optional<MatchRecord> next();
    std::size_t position() const { return position_; }

private:
    Repository& repo_;
    std::size_t page_size_;
    std::size_t position_;
    std::optional<MatchRef> last_key_;
    std::vector<MatchRecord> page_;
    std::size_t page_index_ = 0;
    bool started_ = false;
    bool exhausted_ = false;
};

/*
  Durable store for matches, players and crawl-frontier rows.

  Every operation is atomic on its own. Backend failures surface as
  StorageError; a put_match either stores the match with all of its
  participants or nothing.
*/
class Repository {
public:
    virtual ~Repository() = default;

    // Match: stored. Player: match list already crawled.
    virtual bool exists(EntityKind kind, const EntityRef& ref) = 0;

    // Upsert; storing the same match twice leaves the first copy in place.
    virtual void put_match(const MatchRecord& match) = 0;
    virtual std::optional<MatchRecord> get_match(const MatchRef& ref) = 0;
    virtual int64_t match_count() = 0;

    // Inserts entries not yet known by (kind, ref); returns how many were new.
    // Known entries keep their state, whatever it is.
    virtual int put_frontier_entries(const std::vector<FrontierEntry>& entries) = 0;

    // Atomically moves up to `limit` claimable pending entries (not_before <= now)
    // to in-flight, oldest discovery first. Concurrent callers never receive the
    // same entry.
    virtual std::vector<FrontierEntry> claim_next_batch(EntityKind kind, int limit,
                                                        TimePoint now) = 0;

    std::vector<FrontierEntry> claim_next_batch(EntityKind kind, int limit) {
        return claim_next_batch(kind, limit, std::chrono::system_clock::now());
    }

    virtual void mark_done(const FrontierEntry& entry) = 0;
    virtual void mark_failed(const FrontierEntry& entry, const std::string& reason) = 0;

    // in-flight -> pending, claimable again from `not_before`.
    virtual void requeue(const FrontierEntry& entry, TimePoint not_before,
                         bool count_attempt, const std::string& reason) = 0;

    // Returns in-flight entries claimed before `claimed_before` to pending.
    virtual int reclaim_stale(TimePoint claimed_before) = 0;

    // Returns failed entries of `kind` to pending with a fresh attempt count.
    virtual int reset_failed(EntityKind kind) = 0;

    virtual std::optional<TimePoint> next_ready_time(EntityKind kind) = 0;
    virtual FrontierStats frontier_stats() = 0;
    virtual std::vector<FrontierEntry> failed_entries() = 0;

    // Keyset page of matches strictly after `after` in (region, match_id) order.
    virtual std::vector<MatchRecord> read_matches(const std::optional<MatchRef>& after,
                                                  std::size_t limit) = 0;

    // Key of the match at zero-based position `offset`, if any.
    virtual std::optional<MatchRef> match_key_at(std::size_t offset) = 0;

    MatchCursor iterate_matches(std::size_t offset = 0, std::size_t page_size = 256) {
        return MatchCursor(*this, offset, page_size);
    }
};

} // namespace riftcrawl
