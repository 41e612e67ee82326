#pragma once

#include "riftcrawl/errors.hpp"
#include "riftcrawl/types.hpp"
#include <expected>
#include <string>
#include <vector>

namespace riftcrawl {

// Gateway to the remote statistics service. One instance is shared by all
// workers and is the only place request pacing happens.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // Empty result means the player has no qualifying matches.
    virtual std::expected<std::vector<MatchRef>, FetchError> list_match_ids(
        const PlayerRef& player, const MatchWindow& window) = 0;

    virtual std::expected<MatchRecord, FetchError> fetch_match(const MatchRef& match) = 0;

    // Players on a ranked ladder ("challenger", "grandmaster", "master").
    virtual std::expected<std::vector<PlayerRef>, FetchError> list_ladder_players(
        const std::string& tier) = 0;
};

} // namespace riftcrawl
