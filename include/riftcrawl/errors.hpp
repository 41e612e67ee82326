#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace riftcrawl {

enum class FetchErrorKind {
    NotFound,     // expired or removed, never retried
    RateLimited,  // retried after cooldown, not counted as an attempt
    Transient,    // network or 5xx, retried with backoff
    Unauthorized, // bad or expired key, halts the run
};

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::Transient;
    int status_code = 0;
    std::string message;
    std::chrono::milliseconds retry_after{0};
};

std::string to_string(FetchErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& msg, bool unreachable = false)
        : std::runtime_error(msg), unreachable_(unreachable) {}

    bool unreachable() const { return unreachable_; }

private:
    bool unreachable_;
};

} // namespace riftcrawl
