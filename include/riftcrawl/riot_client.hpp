#pragma once

#include "riftcrawl/config.hpp"
#include "riftcrawl/rate_limiter.hpp"
#include "riftcrawl/remote_client.hpp"
#include <nlohmann/json.hpp>

namespace riftcrawl {

// Regional routing host ("europe", "americas", "asia", "sea") for a platform.
std::string routing_for_platform(const std::string& platform);

// Maps an HTTP status to the error taxonomy; nullopt for success.
std::optional<FetchError> classify_status(int status, const std::string& body,
                                          std::chrono::seconds retry_after = {});

MatchRecord parse_match(const nlohmann::json& j, const std::string& region);
std::vector<MatchRef> parse_match_ids(const nlohmann::json& j, const std::string& region);
std::vector<PlayerRef> parse_ladder(const nlohmann::json& j, const std::string& region);

class RiotClient final : public RemoteClient {
public:
    RiotClient(ClientConfig config, RateLimiter& limiter);

    std::expected<std::vector<MatchRef>, FetchError> list_match_ids(
        const PlayerRef& player, const MatchWindow& window) override;

    std::expected<MatchRecord, FetchError> fetch_match(const MatchRef& match) override;

    std::expected<std::vector<PlayerRef>, FetchError> list_ladder_players(
        const std::string& tier) override;

private:
    ClientConfig config_;
    RateLimiter& limiter_;

    std::expected<nlohmann::json, FetchError> fetch_endpoint(
        const std::string& host, const std::string& path);
};

} // namespace riftcrawl
