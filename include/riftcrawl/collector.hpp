#pragma once

#include "riftcrawl/config.hpp"
#include "riftcrawl/frontier.hpp"
#include "riftcrawl/remote_client.hpp"
#include "riftcrawl/repository.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace riftcrawl {

using ProgressCallback = std::function<void(int64_t stored, int64_t ceiling)>;

struct FailedEntry {
    EntityKind kind = EntityKind::Match;
    EntityRef ref;
    int attempts = 0;
    std::string reason;
};

struct CrawlSummary {
    int64_t matches_stored = 0; // this run
    int64_t total_matches = 0;  // in the repository at exit
    int64_t players_crawled = 0;
    int64_t matches_filtered = 0;
    int64_t retries = 0;
    int64_t rate_limited = 0;
    int64_t storage_errors = 0;
    std::vector<FailedEntry> failures;
    StopReason stop_reason = StopReason::Exhausted;
    std::chrono::milliseconds elapsed{0};
};

/*
  Drives the crawl: a pool of workers claims batches from the frontier,
  fetches through the shared RemoteClient and commits through the
  repository.

  Per entry: pending -> in-flight -> done | failed(n). Transient errors are
  re-queued with exponential backoff until max_attempts; rate limits pause
  every worker for the cooldown and are never counted; not-found is
  terminal. request_stop() lets workers finish the batch in hand and then
  exit without claiming more.
*/
class Collector {
public:
    Collector(Repository& repo, RemoteClient& client, CrawlConfig config);

    CrawlSummary run(ProgressCallback on_progress = nullptr);

    // Safe to call from any thread, including a signal-watching one.
    void request_stop();

    std::chrono::milliseconds backoff_for(int attempts) const;

private:
    Repository& repo_;
    RemoteClient& client_;
    CrawlConfig config_;
    std::optional<FrontierManager> frontier_;
    ProgressCallback on_progress_;

    std::atomic<bool> stop_requested_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::optional<StopReason> stop_reason_;
    bool fatal_ = false;
    int64_t reserved_slots_ = 0;
    int consecutive_storage_errors_ = 0;
    std::chrono::steady_clock::time_point cooldown_until_{};
    std::chrono::steady_clock::time_point last_reclaim_{};
    CrawlSummary summary_;

    void seed();
    void worker_loop();
    bool should_stop();
    void halt(StopReason reason, bool fatal);
    void wait_out_cooldown();
    void idle_wait();
    void maybe_reclaim(TimePoint now);

    int64_t reserve_slots(int wanted);
    void release_slots(int64_t n);

    void process(const FrontierEntry& entry);
    void process_player(const FrontierEntry& entry);
    void process_match(const FrontierEntry& entry);
    void expand_participants(const MatchRecord& match);
    void handle_fetch_error(const FrontierEntry& entry, const FetchError& err);
    void handle_storage_error(const std::optional<FrontierEntry>& entry, const StorageError& err);
    void fail(const FrontierEntry& entry, int attempts, const std::string& reason);
    void release_unprocessed(const std::vector<FrontierEntry>& batch, size_t from);

    MatchWindow listing_window() const;
};

} // namespace riftcrawl
