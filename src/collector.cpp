#include "riftcrawl/collector.hpp"
#include "riftcrawl/logging.hpp"
#include <algorithm>
#include <iterator>
#include <thread>

namespace riftcrawl {

namespace {

using SteadyClock = std::chrono::steady_clock;

TimePoint wall_now() {
    return std::chrono::system_clock::now();
}

std::string describe(const FrontierEntry& e) {
    return to_string(e.kind) + " " + e.ref.region + "/" + e.ref.id;
}

} // namespace

Collector::Collector(Repository& repo, RemoteClient& client, CrawlConfig config)
    : repo_(repo), client_(client), config_(std::move(config)) {}

void Collector::request_stop() {
    stop_requested_ = true;
    std::lock_guard lock(mutex_);
    wake_.notify_all();
}

std::chrono::milliseconds Collector::backoff_for(int attempts) const {
    auto delay = config_.base_backoff;
    for (int i = 1; i < attempts; ++i) {
        delay *= 2;
        if (delay >= config_.max_backoff) return config_.max_backoff;
    }
    return std::min(delay, config_.max_backoff);
}

MatchWindow Collector::listing_window() const {
    return {
        .recency = std::min(config_.window, config_.retention),
        .max_count = config_.matches_per_player,
        .queue_id = config_.queue,
    };
}

CrawlSummary Collector::run(ProgressCallback on_progress) {
    on_progress_ = std::move(on_progress);
    auto started = SteadyClock::now();
    auto start_wall = wall_now();

    StopPolicy policy{.max_matches = config_.max_matches, .deadline = std::nullopt};
    if (config_.deadline) policy.deadline = start_wall + *config_.deadline;
    frontier_.emplace(repo_, policy);

    {
        std::lock_guard lock(mutex_);
        summary_ = CrawlSummary{};
        stop_reason_.reset();
        fatal_ = false;
        reserved_slots_ = 0;
        consecutive_storage_errors_ = 0;
    }

    RIFTCRAWL_LOG_INFO("crawl starting: region={} workers={} batch={} ceiling={}",
                       config_.region, config_.workers, config_.batch_size,
                       config_.max_matches);

    try {
        frontier_->reclaim_stale(config_.stale_after, start_wall);
        seed();
    } catch (const StorageError& e) {
        RIFTCRAWL_LOG_ERROR("storage error during startup: {}", e.what());
        std::lock_guard lock(mutex_);
        ++summary_.storage_errors;
        if (!stop_reason_) stop_reason_ = StopReason::StorageFailure;
        fatal_ = true;
    }
    last_reclaim_ = SteadyClock::now();

    if (!should_stop()) {
        std::vector<std::thread> workers;
        for (int i = 0; i < config_.workers; ++i) {
            workers.emplace_back([this] { worker_loop(); });
        }
        for (auto& t : workers) t.join();
    }

    try {
        summary_.total_matches = repo_.match_count();
    } catch (const StorageError& e) {
        RIFTCRAWL_LOG_ERROR("cannot read final match count: {}", e.what());
    }

    std::lock_guard lock(mutex_);
    summary_.stop_reason = stop_reason_.value_or(StopReason::Signal);
    summary_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - started);

    RIFTCRAWL_LOG_INFO("crawl stopped ({}): {} matches stored this run, {} total, "
                       "{} players crawled, {} failed",
                       to_string(summary_.stop_reason), summary_.matches_stored,
                       summary_.total_matches, summary_.players_crawled,
                       summary_.failures.size());
    return summary_;
}

void Collector::seed() {
    std::vector<PlayerRef> seeds;
    for (auto& id : config_.seeds) seeds.push_back({id, config_.region});

    for (auto& tier : config_.seed_ladders) {
        // Rate limits wait out the cooldown without spending an attempt.
        int failures = 0;
        bool listed = false;
        while (!listed && failures < config_.max_attempts && !should_stop()) {
            wait_out_cooldown();
            auto ladder = client_.list_ladder_players(tier);
            if (ladder) {
                RIFTCRAWL_LOG_INFO("ladder {}: {} players", tier, ladder->size());
                std::ranges::copy(*ladder, std::back_inserter(seeds));
                listed = true;
                break;
            }

            auto& err = ladder.error();
            if (err.kind == FetchErrorKind::Unauthorized) {
                RIFTCRAWL_LOG_ERROR("ladder {} rejected: {}", tier, err.message);
                halt(StopReason::ClientRejected, true);
                return;
            }
            if (err.kind == FetchErrorKind::RateLimited) {
                std::lock_guard lock(mutex_);
                cooldown_until_ = std::max(cooldown_until_, SteadyClock::now() + err.retry_after);
                ++summary_.rate_limited;
                continue;
            }
            ++failures;
            RIFTCRAWL_LOG_WARN("ladder {} attempt {} failed: {}", tier, failures, err.message);
            if (err.kind == FetchErrorKind::NotFound) break;
            if (failures < config_.max_attempts) std::this_thread::sleep_for(backoff_for(failures));
        }
        if (!listed) RIFTCRAWL_LOG_WARN("ladder {} skipped after {} failed attempts", tier, failures);
    }

    int added = frontier_->discover_players(seeds, wall_now());
    RIFTCRAWL_LOG_INFO("seeded {} new players ({} candidates)", added, seeds.size());
}

bool Collector::should_stop() {
    std::lock_guard lock(mutex_);
    if (stop_requested_ && !stop_reason_) {
        stop_reason_ = StopReason::Signal;
        RIFTCRAWL_LOG_INFO("shutdown requested: finishing in-flight work");
    }
    return stop_reason_.has_value();
}

void Collector::halt(StopReason reason, bool fatal) {
    std::lock_guard lock(mutex_);
    if (!stop_reason_) stop_reason_ = reason;
    if (fatal) fatal_ = true;
    wake_.notify_all();
}

void Collector::wait_out_cooldown() {
    std::unique_lock lock(mutex_);
    while (SteadyClock::now() < cooldown_until_) {
        wake_.wait_until(lock, cooldown_until_);
    }
}

void Collector::idle_wait() {
    auto wait = config_.idle_poll;
    try {
        if (auto ready = frontier_->next_ready_time()) {
            auto until_ready = std::chrono::duration_cast<std::chrono::milliseconds>(
                *ready - wall_now());
            if (until_ready.count() > 0) wait = std::min(wait, until_ready);
        }
    } catch (const StorageError& e) {
        RIFTCRAWL_LOG_DEBUG("next ready time unavailable: {}", e.what());
    }

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, wait, [this] { return stop_reason_ || stop_requested_; });
}

void Collector::maybe_reclaim(TimePoint now) {
    {
        std::lock_guard lock(mutex_);
        if (SteadyClock::now() - last_reclaim_ < config_.stale_after / 2) return;
        last_reclaim_ = SteadyClock::now();
    }
    frontier_->reclaim_stale(config_.stale_after, now);
}

int64_t Collector::reserve_slots(int wanted) {
    if (config_.max_matches == 0) return wanted;

    // Counted under the lock: a worker stores before it releases its slot,
    // so a match is never missing from both the count and the reservations.
    std::lock_guard lock(mutex_);
    auto room = config_.max_matches - repo_.match_count() - reserved_slots_;
    auto slots = std::clamp<int64_t>(room, 0, wanted);
    reserved_slots_ += slots;
    return slots;
}

void Collector::release_slots(int64_t n) {
    if (config_.max_matches == 0 || n <= 0) return;
    std::lock_guard lock(mutex_);
    reserved_slots_ = std::max<int64_t>(0, reserved_slots_ - n);
}

void Collector::worker_loop() {
    while (!should_stop()) {
        wait_out_cooldown();
        auto now = wall_now();

        std::vector<FrontierEntry> batch;
        int64_t held = 0;
        try {
            maybe_reclaim(now);
            if (auto reason = frontier_->stop_condition(now)) {
                halt(*reason, false);
                break;
            }

            auto slots = reserve_slots(config_.batch_size);
            try {
                batch = frontier_->next_batch(config_.batch_size, slots, now);
            } catch (const StorageError&) {
                release_slots(slots);
                throw;
            }
            held = std::ranges::count(batch, EntityKind::Match, &FrontierEntry::kind);
            release_slots(slots - held);
        } catch (const StorageError& e) {
            handle_storage_error(std::nullopt, e);
            idle_wait();
            continue;
        }

        if (batch.empty()) {
            idle_wait();
            continue;
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            {
                std::lock_guard lock(mutex_);
                if (fatal_) {
                    release_unprocessed(batch, i);
                    break;
                }
            }

            bool ok = true;
            try {
                process(batch[i]);
                std::lock_guard lock(mutex_);
                consecutive_storage_errors_ = 0;
            } catch (const StorageError& e) {
                handle_storage_error(batch[i], e);
                ok = false;
            }

            if (batch[i].kind == EntityKind::Match) {
                release_slots(1);
                --held;
            }
            if (!ok) {
                release_unprocessed(batch, i + 1);
                break;
            }
        }
        release_slots(held);
    }
}

void Collector::process(const FrontierEntry& entry) {
    wait_out_cooldown();
    if (entry.kind == EntityKind::Player) {
        process_player(entry);
    } else {
        process_match(entry);
    }
}

void Collector::process_player(const FrontierEntry& entry) {
    auto ids = client_.list_match_ids(to_player(entry.ref), listing_window());
    if (!ids) {
        handle_fetch_error(entry, ids.error());
        return;
    }

    int added = frontier_->discover_matches(*ids, wall_now());
    repo_.mark_done(entry);
    RIFTCRAWL_LOG_DEBUG("player {}: {} matches listed, {} new", entry.ref.id, ids->size(), added);

    std::lock_guard lock(mutex_);
    ++summary_.players_crawled;
}

void Collector::process_match(const FrontierEntry& entry) {
    auto ref = to_match(entry.ref);

    // Stored by a run that died before marking the entry done.
    if (repo_.exists(EntityKind::Match, entry.ref)) {
        if (auto stored = repo_.get_match(ref)) expand_participants(*stored);
        repo_.mark_done(entry);
        return;
    }

    auto fetched = client_.fetch_match(ref);
    if (!fetched) {
        handle_fetch_error(entry, fetched.error());
        return;
    }
    fetched->ref = ref;

    if (config_.queue > 0 && fetched->queue_id != config_.queue) {
        repo_.mark_done(entry);
        RIFTCRAWL_LOG_DEBUG("match {} skipped: queue {}", ref.id, fetched->queue_id);
        std::lock_guard lock(mutex_);
        ++summary_.matches_filtered;
        return;
    }

    repo_.put_match(*fetched);
    expand_participants(*fetched);
    repo_.mark_done(entry);

    int64_t stored = 0;
    {
        std::lock_guard lock(mutex_);
        stored = ++summary_.matches_stored;
    }
    if (stored % config_.progress_every == 0) {
        RIFTCRAWL_LOG_INFO("{} matches stored this run (ceiling {})", stored, config_.max_matches);
    }
    if (on_progress_) on_progress_(stored, config_.max_matches);
}

void Collector::expand_participants(const MatchRecord& match) {
    std::vector<PlayerRef> players;
    players.reserve(match.participants.size());
    for (auto& p : match.participants) {
        if (!p.player.id.empty()) players.push_back(p.player);
    }
    frontier_->discover_players(players, wall_now());
}

void Collector::handle_fetch_error(const FrontierEntry& entry, const FetchError& err) {
    auto now = wall_now();
    switch (err.kind) {
        case FetchErrorKind::NotFound:
            fail(entry, entry.attempts + 1, "not_found: " + err.message);
            return;

        case FetchErrorKind::RateLimited: {
            {
                std::lock_guard lock(mutex_);
                cooldown_until_ = std::max(cooldown_until_, SteadyClock::now() + err.retry_after);
                ++summary_.rate_limited;
                wake_.notify_all();
            }
            RIFTCRAWL_LOG_WARN("rate limited on {}: all workers cooling down for {} ms",
                               describe(entry), err.retry_after.count());
            repo_.requeue(entry, now + err.retry_after, false, "rate_limited");
            return;
        }

        case FetchErrorKind::Transient: {
            int attempts = entry.attempts + 1;
            if (attempts >= config_.max_attempts) {
                fail(entry, attempts, "transient: " + err.message);
                return;
            }
            auto delay = backoff_for(attempts);
            RIFTCRAWL_LOG_WARN("{} attempt {} failed ({}), retrying in {} ms",
                               describe(entry), attempts, err.message, delay.count());
            repo_.requeue(entry, now + delay, true, err.message);
            std::lock_guard lock(mutex_);
            ++summary_.retries;
            return;
        }

        case FetchErrorKind::Unauthorized:
            RIFTCRAWL_LOG_ERROR("remote service rejected credentials: {}", err.message);
            repo_.requeue(entry, now, false, "unauthorized");
            halt(StopReason::ClientRejected, true);
            return;
    }
}

void Collector::handle_storage_error(const std::optional<FrontierEntry>& entry,
                                     const StorageError& err) {
    bool fatal = false;
    {
        std::lock_guard lock(mutex_);
        ++summary_.storage_errors;
        ++consecutive_storage_errors_;
        fatal = err.unreachable() ||
                consecutive_storage_errors_ >= config_.max_storage_errors;
    }

    if (fatal) {
        RIFTCRAWL_LOG_ERROR("storage failure, halting run: {}", err.what());
        halt(StopReason::StorageFailure, true);
        return;
    }

    if (!entry) {
        RIFTCRAWL_LOG_ERROR("storage error: {}", err.what());
        return;
    }

    RIFTCRAWL_LOG_ERROR("storage error on {}: {}; abandoning batch", describe(*entry), err.what());
    try {
        int attempts = entry->attempts + 1;
        if (attempts >= config_.max_attempts) {
            fail(*entry, attempts, std::string("storage: ") + err.what());
        } else {
            repo_.requeue(*entry, wall_now() + backoff_for(attempts), true,
                          std::string("storage: ") + err.what());
        }
    } catch (const StorageError& again) {
        RIFTCRAWL_LOG_WARN("{} left in flight for stale reclaim: {}", describe(*entry), again.what());
    }
}

void Collector::fail(const FrontierEntry& entry, int attempts, const std::string& reason) {
    auto failed = entry;
    failed.attempts = attempts;
    repo_.mark_failed(failed, reason);
    RIFTCRAWL_LOG_WARN("{} failed after {} attempt(s): {}", describe(entry), attempts, reason);

    std::lock_guard lock(mutex_);
    summary_.failures.push_back({entry.kind, entry.ref, attempts, reason});
}

void Collector::release_unprocessed(const std::vector<FrontierEntry>& batch, size_t from) {
    for (size_t i = from; i < batch.size(); ++i) {
        try {
            repo_.requeue(batch[i], batch[i].not_before, false, "batch abandoned");
        } catch (const StorageError& e) {
            RIFTCRAWL_LOG_WARN("{} left in flight for stale reclaim: {}",
                               describe(batch[i]), e.what());
        }
    }
}

} // namespace riftcrawl
