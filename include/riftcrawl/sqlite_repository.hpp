#pragma once

#include "riftcrawl/repository.hpp"
#include "riftcrawl/sqlite_db.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace riftcrawl {

// SQLite-backed Repository. Each operation runs on a pooled connection of its
// own, so concurrent workers are isolated by SQLite's locking rather than by a
// process-local mutex.
class SqliteRepository final : public Repository {
public:
    explicit SqliteRepository(std::string path);

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

private:
    class Lease {
    public:
        Lease(SqliteRepository& owner, std::unique_ptr<SqliteDB> db)
            : owner_(owner), db_(std::move(db)) {}
        ~Lease() { owner_.release(std::move(db_)); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        SqliteDB& operator*() { return *db_; }
        SqliteDB* operator->() { return db_.get(); }

    private:
        SqliteRepository& owner_;
        std::unique_ptr<SqliteDB> db_;
    };

    std::string path_;
    std::mutex pool_mutex_;
    std::vector<std::unique_ptr<SqliteDB>> idle_;

    Lease acquire();
    void release(std::unique_ptr<SqliteDB> db);
    void migrate(SqliteDB& db);

    std::vector<ParticipantRecord> load_participants(SqliteDB& db, const MatchRef& ref);
};

} // namespace riftcrawl
