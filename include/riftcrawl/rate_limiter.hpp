#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace riftcrawl {

// One "limit:seconds" pair from an X-App-Rate-Limit style header, with the
// matching count from the -Count header when known.
struct QuotaWindow {
    int limit = 0;
    std::chrono::seconds span{0};
    int used = 0;
};

// Parses "20:1,100:120" (and the matching count header, if given) into
// windows. Malformed pairs are skipped.
std::vector<QuotaWindow> parse_rate_limit_headers(const std::string& limits,
                                                  const std::string& counts = "");

// Process-wide request gate. Every outgoing request waits on wait_for_slot();
// a pause set by any caller holds back all callers until it expires.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Window {
        int max_requests;
        std::chrono::milliseconds span;
    };

    RateLimiter(int per_second = 20, int per_two_minutes = 100);
    explicit RateLimiter(std::vector<Window> windows);

    void wait_for_slot();

    void pause_for(std::chrono::milliseconds duration);

    // Applies remaining-quota signals reported by the server.
    void observe(const std::vector<QuotaWindow>& quota);

    bool paused() const;
    int pause_count() const;

private:
    struct Track {
        Window window;
        std::deque<Clock::time_point> timestamps;
    };

    std::vector<Track> tracks_;
    Clock::time_point paused_until_{};
    int pause_count_ = 0;
    mutable std::mutex mutex_;

    std::chrono::nanoseconds time_to_slot(Clock::time_point now);
};

} // namespace riftcrawl
