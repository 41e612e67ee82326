#include "riftcrawl/rate_limiter.hpp"
#include "riftcrawl/logging.hpp"
#include <algorithm>
#include <sstream>
#include <thread>

namespace riftcrawl {

namespace {

std::vector<std::pair<int, int>> split_pairs(const std::string& header) {
    std::vector<std::pair<int, int>> pairs;
    std::stringstream ss(header);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto colon = item.find(':');
        if (colon == std::string::npos) continue;
        try {
            pairs.emplace_back(std::stoi(item.substr(0, colon)),
                               std::stoi(item.substr(colon + 1)));
        } catch (const std::exception&) {
            continue;
        }
    }
    return pairs;
}

} // namespace

std::vector<QuotaWindow> parse_rate_limit_headers(const std::string& limits,
                                                  const std::string& counts) {
    std::vector<QuotaWindow> windows;
    for (auto [limit, secs] : split_pairs(limits)) {
        if (limit <= 0 || secs <= 0) continue;
        windows.push_back({limit, std::chrono::seconds(secs), 0});
    }
    for (auto [used, secs] : split_pairs(counts)) {
        auto it = std::ranges::find(windows, std::chrono::seconds(secs), &QuotaWindow::span);
        if (it != windows.end()) it->used = used;
    }
    return windows;
}

RateLimiter::RateLimiter(int per_second, int per_two_minutes)
    : RateLimiter(std::vector<Window>{
          {per_second, std::chrono::seconds(1)},
          {per_two_minutes, std::chrono::seconds(120)},
      }) {}

RateLimiter::RateLimiter(std::vector<Window> windows) {
    for (auto& w : windows) {
        tracks_.push_back({w, {}});
    }
}

std::chrono::nanoseconds RateLimiter::time_to_slot(Clock::time_point now) {
    std::chrono::nanoseconds wait{0};
    if (paused_until_ > now) wait = paused_until_ - now;

    for (auto& track : tracks_) {
        while (!track.timestamps.empty() &&
               (now - track.timestamps.front()) >= track.window.span) {
            track.timestamps.pop_front();
        }
        if (static_cast<int>(track.timestamps.size()) >= track.window.max_requests) {
            auto free_at = track.timestamps.front() + track.window.span;
            wait = std::max<std::chrono::nanoseconds>(wait, free_at - now);
        }
    }
    return wait;
}

void RateLimiter::wait_for_slot() {
    std::unique_lock lock(mutex_);
    while (true) {
        auto now = Clock::now();
        auto wait = time_to_slot(now);
        if (wait.count() <= 0) {
            for (auto& track : tracks_) track.timestamps.push_back(now);
            return;
        }
        lock.unlock();
        std::this_thread::sleep_for(wait);
        lock.lock();
    }
}

void RateLimiter::pause_for(std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    auto until = Clock::now() + duration;
    if (until > paused_until_) {
        paused_until_ = until;
        ++pause_count_;
        RIFTCRAWL_LOG_WARN("rate limit cooldown: pausing all requests for {} ms",
                           duration.count());
    }
}

void RateLimiter::observe(const std::vector<QuotaWindow>& quota) {
    std::chrono::milliseconds longest{0};
    for (auto& q : quota) {
        if (q.limit > 0 && q.used >= q.limit) {
            longest = std::max<std::chrono::milliseconds>(longest, q.span);
        }
    }
    if (longest.count() > 0) pause_for(longest);
}

bool RateLimiter::paused() const {
    std::lock_guard lock(mutex_);
    return paused_until_ > Clock::now();
}

int RateLimiter::pause_count() const {
    std::lock_guard lock(mutex_);
    return pause_count_;
}

} // namespace riftcrawl
