#include <gtest/gtest.h>
#include "riftcrawl/memory_repository.hpp"
#include "riftcrawl/sqlite_repository.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <unistd.h>

using namespace riftcrawl;
using namespace riftcrawl::test_support;
using namespace std::chrono;

namespace {

class RepositoryTest : public ::testing::TestWithParam<std::string> {
protected:
    std::filesystem::path db_path;
    std::unique_ptr<Repository> repo;

    void SetUp() override {
        if (GetParam() == "sqlite") {
            std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
            std::replace(test_name.begin(), test_name.end(), '/', '_');
            db_path = std::filesystem::temp_directory_path() /
                      ("riftcrawl_repo_" + std::to_string(::getpid()) + "_" + test_name + ".db");
            remove_db();
            repo = std::make_unique<SqliteRepository>(db_path.string());
        } else {
            repo = std::make_unique<MemoryRepository>();
        }
    }

    void TearDown() override {
        repo.reset();
        if (!db_path.empty()) remove_db();
    }

    void remove_db() {
        for (auto suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(db_path.string() + suffix);
        }
    }

    void reopen() {
        if (GetParam() != "sqlite") return;
        repo.reset();
        repo = std::make_unique<SqliteRepository>(db_path.string());
    }
};

std::string param_name(const ::testing::TestParamInfo<std::string>& info) {
    return info.param;
}

} // namespace

INSTANTIATE_TEST_SUITE_P(Backends, RepositoryTest,
                         ::testing::Values(std::string("memory"), std::string("sqlite")),
                         param_name);

TEST_P(RepositoryTest, PutMatchIsIdempotent) {
    auto m = make_match("EUW1_1", "euw1", 0);
    repo->put_match(m);

    auto again = m;
    again.duration_secs = 99;
    repo->put_match(again);

    EXPECT_EQ(repo->match_count(), 1);
    auto stored = repo->get_match({"EUW1_1", "euw1"});
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->duration_secs, m.duration_secs);
    EXPECT_EQ(stored->queue_id, 420);
    ASSERT_EQ(stored->participants.size(), 10u);
    EXPECT_EQ(stored->participants[0].player.id, m.participants[0].player.id);
    EXPECT_EQ(stored->participants[0].stats.kills, m.participants[0].stats.kills);
    EXPECT_EQ(stored->raw_payload, m.raw_payload);
}

TEST_P(RepositoryTest, AbsentStatsSurviveStorage) {
    auto m = make_match("EUW1_2", "euw1", 0);
    m.participants[3].stats.gold_earned.reset();
    m.participants[3].summoner1_id.reset();
    m.participants[3].win.reset();
    repo->put_match(m);

    auto stored = repo->get_match(m.ref);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->participants[3].stats.gold_earned.has_value());
    EXPECT_FALSE(stored->participants[3].summoner1_id.has_value());
    EXPECT_FALSE(stored->participants[3].win.has_value());
    EXPECT_TRUE(stored->participants[4].stats.gold_earned.has_value());
}

TEST_P(RepositoryTest, GetMissingMatch) {
    EXPECT_FALSE(repo->get_match({"nope", "euw1"}).has_value());
    EXPECT_FALSE(repo->exists(EntityKind::Match, {"nope", "euw1"}));
}

TEST_P(RepositoryTest, SameIdInOtherRegionIsDistinct) {
    repo->put_match(make_match("1", "euw1", 0));
    repo->put_match(make_match("1", "na1", 0));
    EXPECT_EQ(repo->match_count(), 2);
}

TEST_P(RepositoryTest, PlayerExistsOnlyOnceCrawled) {
    auto now = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Player, "p1", now)});
    EXPECT_FALSE(repo->exists(EntityKind::Player, {"p1", "euw1"}));

    auto claimed = repo->claim_next_batch(EntityKind::Player, 1, now);
    ASSERT_EQ(claimed.size(), 1u);
    repo->mark_done(claimed[0]);
    EXPECT_TRUE(repo->exists(EntityKind::Player, {"p1", "euw1"}));
}

TEST_P(RepositoryTest, FrontierDedupNeverResurrects) {
    auto now = ms_now();
    std::vector<FrontierEntry> entries{make_entry(EntityKind::Match, "m1", now),
                                       make_entry(EntityKind::Match, "m2", now)};
    EXPECT_EQ(repo->put_frontier_entries(entries), 2);
    EXPECT_EQ(repo->put_frontier_entries(entries), 0);

    auto claimed = repo->claim_next_batch(EntityKind::Match, 1, now);
    ASSERT_EQ(claimed.size(), 1u);
    repo->mark_done(claimed[0]);

    EXPECT_EQ(repo->put_frontier_entries(entries), 0);
    auto stats = repo->frontier_stats();
    EXPECT_EQ(stats.matches.done, 1);
    EXPECT_EQ(stats.matches.pending, 1);
    EXPECT_EQ(stats.players.pending, 0);
}

TEST_P(RepositoryTest, ClaimsOldestDiscoveryFirst) {
    auto t0 = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Match, "late", t0 + seconds(2))});
    repo->put_frontier_entries({make_entry(EntityKind::Match, "early", t0)});
    repo->put_frontier_entries({make_entry(EntityKind::Player, "player", t0 - seconds(5))});

    auto batch = repo->claim_next_batch(EntityKind::Match, 5, t0 + seconds(10));
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].ref.id, "early");
    EXPECT_EQ(batch[1].ref.id, "late");
    EXPECT_EQ(batch[0].state, EntryState::InFlight);
}

TEST_P(RepositoryTest, BackoffDelaysClaim) {
    auto now = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Match, "m1", now)});
    auto claimed = repo->claim_next_batch(EntityKind::Match, 1, now);
    ASSERT_EQ(claimed.size(), 1u);

    repo->requeue(claimed[0], now + seconds(30), true, "HTTP 503");
    EXPECT_TRUE(repo->claim_next_batch(EntityKind::Match, 1, now).empty());
    EXPECT_EQ(repo->next_ready_time(EntityKind::Match), now + seconds(30));

    auto later = repo->claim_next_batch(EntityKind::Match, 1, now + seconds(31));
    ASSERT_EQ(later.size(), 1u);
    EXPECT_EQ(later[0].attempts, 1);
}

TEST_P(RepositoryTest, UncountedRequeueKeepsAttempts) {
    auto now = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Match, "m1", now)});
    auto claimed = repo->claim_next_batch(EntityKind::Match, 1, now);
    repo->requeue(claimed[0], now, false, "rate_limited");

    auto again = repo->claim_next_batch(EntityKind::Match, 1, now);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].attempts, 0);
}

TEST_P(RepositoryTest, ConcurrentClaimsAreExclusive) {
    auto now = ms_now();
    std::vector<FrontierEntry> entries;
    for (int i = 0; i < 120; ++i) {
        entries.push_back(make_entry(EntityKind::Match, "m" + std::to_string(i), now));
    }
    repo->put_frontier_entries(entries);

    std::mutex m;
    std::vector<std::string> seen;
    std::vector<std::thread> workers;
    for (int w = 0; w < 6; ++w) {
        workers.emplace_back([&] {
            while (true) {
                auto batch = repo->claim_next_batch(EntityKind::Match, 7, now);
                if (batch.empty()) return;
                std::lock_guard lock(m);
                for (auto& e : batch) seen.push_back(e.ref.id);
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(seen.size(), 120u);
    std::set<std::string> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), 120u);
    EXPECT_EQ(repo->frontier_stats().matches.in_flight, 120);
}

TEST_P(RepositoryTest, ReclaimsOnlyStaleInFlight) {
    auto now = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Match, "m1", now),
                                make_entry(EntityKind::Match, "m2", now)});
    auto claimed = repo->claim_next_batch(EntityKind::Match, 1, now);
    ASSERT_EQ(claimed.size(), 1u);

    EXPECT_EQ(repo->reclaim_stale(now - hours(1)), 0);
    EXPECT_EQ(repo->reclaim_stale(ms_now() + seconds(1)), 1);

    auto stats = repo->frontier_stats();
    EXPECT_EQ(stats.matches.pending, 2);
    EXPECT_EQ(stats.matches.in_flight, 0);
}

TEST_P(RepositoryTest, FailedEntriesAndReset) {
    auto now = ms_now();
    repo->put_frontier_entries({make_entry(EntityKind::Match, "gone", now)});
    auto claimed = repo->claim_next_batch(EntityKind::Match, 1, now);
    ASSERT_EQ(claimed.size(), 1u);

    auto failed = claimed[0];
    failed.attempts = 1;
    repo->mark_failed(failed, "not_found: HTTP 404");

    auto listed = repo->failed_entries();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].ref.id, "gone");
    EXPECT_EQ(listed[0].attempts, 1);
    EXPECT_EQ(listed[0].state, EntryState::Failed);
    EXPECT_EQ(listed[0].last_error, "not_found: HTTP 404");
    EXPECT_TRUE(repo->claim_next_batch(EntityKind::Match, 1, now + hours(1)).empty());

    EXPECT_EQ(repo->reset_failed(EntityKind::Player), 0);
    EXPECT_EQ(repo->reset_failed(EntityKind::Match), 1);
    EXPECT_TRUE(repo->failed_entries().empty());

    auto retry = repo->claim_next_batch(EntityKind::Match, 1, ms_now() + seconds(1));
    ASSERT_EQ(retry.size(), 1u);
    EXPECT_EQ(retry[0].attempts, 0);
}

TEST_P(RepositoryTest, CursorWalksInRegionThenIdOrder) {
    repo->put_match(make_match("B", "na1", 0));
    repo->put_match(make_match("A", "na1", 0));
    repo->put_match(make_match("Z", "euw1", 0));
    repo->put_match(make_match("C", "euw1", 0));
    repo->put_match(make_match("M", "kr", 0));

    std::vector<std::string> order;
    auto cursor = repo->iterate_matches(0, 2);
    while (auto m = cursor.next()) order.push_back(m->ref.region + "/" + m->ref.id);

    EXPECT_EQ(order, (std::vector<std::string>{"euw1/C", "euw1/Z", "kr/M", "na1/A", "na1/B"}));
    EXPECT_EQ(cursor.position(), 5u);
}

TEST_P(RepositoryTest, CursorResumesFromOffset) {
    for (auto id : {"1", "2", "3", "4", "5"}) repo->put_match(make_match(id, "euw1", 0));

    auto first = repo->iterate_matches(0, 2);
    first.next();
    first.next();
    auto offset = first.position();

    auto resumed = repo->iterate_matches(offset, 2);
    std::vector<std::string> rest;
    while (auto m = resumed.next()) rest.push_back(m->ref.id);
    EXPECT_EQ(rest, (std::vector<std::string>{"3", "4", "5"}));

    auto past_end = repo->iterate_matches(10);
    EXPECT_FALSE(past_end.next().has_value());
}

TEST_P(RepositoryTest, StateSurvivesReopen) {
    auto now = ms_now();
    repo->put_match(make_match("EUW1_9", "euw1", 0));
    repo->put_frontier_entries({make_entry(EntityKind::Match, "m1", now)});
    repo->claim_next_batch(EntityKind::Match, 1, now);

    reopen();

    EXPECT_EQ(repo->match_count(), 1);
    EXPECT_EQ(repo->frontier_stats().matches.in_flight, 1);
    EXPECT_EQ(repo->reclaim_stale(ms_now() + seconds(1)), 1);
}

TEST(SqliteRepository, UnopenablePathIsUnreachable) {
    try {
        SqliteRepository repo("/nonexistent-dir/riftcrawl/test.db");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_TRUE(e.unreachable());
    }
}

TEST(SqliteRepository, NonDatabaseFileIsUnreachable) {
    auto path = std::filesystem::temp_directory_path() /
                ("riftcrawl_garbage_" + std::to_string(::getpid()) + ".db");
    {
        std::ofstream f(path, std::ios::binary);
        f << std::string(4096, 'x');
    }
    try {
        SqliteRepository repo(path.string());
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_TRUE(e.unreachable());
    }
    // The failed open released its handle, so the file can be replaced.
    EXPECT_TRUE(std::filesystem::remove(path));
    {
        SqliteRepository fresh(path.string());
        EXPECT_EQ(fresh.match_count(), 0);
    }
    for (auto suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path.string() + suffix);
}

TEST(MemoryRepository, UnavailableThrows) {
    MemoryRepository repo;
    repo.set_unavailable(true, true);
    try {
        repo.match_count();
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_TRUE(e.unreachable());
    }
    repo.set_unavailable(false);
    EXPECT_EQ(repo.match_count(), 0);
}
