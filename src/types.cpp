#include "riftcrawl/errors.hpp"
#include "riftcrawl/types.hpp"

namespace riftcrawl {

std::string to_string(EntityKind kind) {
    return kind == EntityKind::Match ? "match" : "player";
}

std::string to_string(EntryState state) {
    switch (state) {
        case EntryState::Pending: return "pending";
        case EntryState::InFlight: return "in_flight";
        case EntryState::Done: return "done";
        case EntryState::Failed: return "failed";
    }
    return "pending";
}

std::optional<EntityKind> parse_entity_kind(const std::string& s) {
    if (s == "match") return EntityKind::Match;
    if (s == "player") return EntityKind::Player;
    return std::nullopt;
}

std::optional<EntryState> parse_entry_state(const std::string& s) {
    if (s == "pending") return EntryState::Pending;
    if (s == "in_flight") return EntryState::InFlight;
    if (s == "done") return EntryState::Done;
    if (s == "failed") return EntryState::Failed;
    return std::nullopt;
}

std::string to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::NotFound: return "not_found";
        case FetchErrorKind::RateLimited: return "rate_limited";
        case FetchErrorKind::Transient: return "transient";
        case FetchErrorKind::Unauthorized: return "unauthorized";
    }
    return "transient";
}

} // namespace riftcrawl
