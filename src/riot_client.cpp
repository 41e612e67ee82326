#include "riftcrawl/riot_client.hpp"
#include "riftcrawl/logging.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>

namespace riftcrawl {

namespace {

constexpr int ids_page_size = 100;

std::optional<int> opt_int(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int>();
    return std::nullopt;
}

std::optional<int64_t> opt_int64(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return std::nullopt;
}

const nlohmann::json& object_at(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.is_object() && j.contains(key) && j[key].is_object()) return j[key];
    return empty;
}

std::optional<bool> opt_bool(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return std::nullopt;
}

std::string safe_str(const nlohmann::json& j, const char* key,
                     const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::optional<int> sum_opt(std::optional<int> a, std::optional<int> b) {
    if (!a && !b) return std::nullopt;
    return a.value_or(0) + b.value_or(0);
}

ParticipantRecord parse_participant(const nlohmann::json& p, const std::string& region) {
    ParticipantRecord r;
    r.player = {safe_str(p, "puuid"), region};
    r.team_id = opt_int(p, "teamId").value_or(0);
    r.position = safe_str(p, "teamPosition");
    r.champion = safe_str(p, "championName");
    r.summoner1_id = opt_int(p, "summoner1Id");
    r.summoner2_id = opt_int(p, "summoner2Id");
    r.win = opt_bool(p, "win");

    auto& s = r.stats;
    s.kills = opt_int(p, "kills");
    s.deaths = opt_int(p, "deaths");
    s.assists = opt_int(p, "assists");
    s.gold_earned = opt_int(p, "goldEarned");
    s.minions_killed = sum_opt(opt_int(p, "totalMinionsKilled"),
                               opt_int(p, "neutralMinionsKilled"));
    s.vision_score = opt_int(p, "visionScore");
    s.damage_to_champions = opt_int(p, "totalDamageDealtToChampions");
    s.champ_level = opt_int(p, "champLevel");
    return r;
}

std::string error_message(int status, const std::string& body) {
    std::string msg = "HTTP " + std::to_string(status);
    if (body.empty()) return msg;
    auto err_json = nlohmann::json::parse(body, nullptr, false);
    if (err_json.is_object() && err_json.contains("status") &&
        err_json["status"].is_object()) {
        msg += ": " + safe_str(err_json["status"], "message");
    }
    return msg;
}

FetchError malformed_body(const nlohmann::json::exception& e) {
    return {FetchErrorKind::Transient, 200, std::string("Malformed response: ") + e.what(), {}};
}

} // namespace

std::string routing_for_platform(const std::string& platform) {
    static const std::unordered_map<std::string, std::string> routes = {
        {"euw1", "europe"}, {"eun1", "europe"}, {"tr1", "europe"},
        {"ru", "europe"}, {"me1", "europe"},
        {"na1", "americas"}, {"br1", "americas"}, {"la1", "americas"},
        {"la2", "americas"},
        {"kr", "asia"}, {"jp1", "asia"},
        {"oc1", "sea"}, {"ph2", "sea"}, {"sg2", "sea"}, {"th2", "sea"},
        {"tw2", "sea"}, {"vn2", "sea"},
    };
    std::string key = platform;
    std::ranges::transform(key, key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = routes.find(key);
    return it != routes.end() ? it->second : "europe";
}

std::optional<FetchError> classify_status(int status, const std::string& body,
                                          std::chrono::seconds retry_after) {
    if (status == 200) return std::nullopt;

    FetchError err{FetchErrorKind::Transient, status, error_message(status, body), {}};
    if (status == 404) {
        err.kind = FetchErrorKind::NotFound;
    } else if (status == 429) {
        err.kind = FetchErrorKind::RateLimited;
        err.retry_after = retry_after.count() > 0 ? retry_after : std::chrono::seconds(2);
    } else if (status == 401 || status == 403) {
        err.kind = FetchErrorKind::Unauthorized;
    }
    return err;
}

MatchRecord parse_match(const nlohmann::json& j, const std::string& region) {
    MatchRecord m;
    const auto& meta = object_at(j, "metadata");
    const auto& info = object_at(j, "info");

    m.ref = {safe_str(meta, "matchId"), region};
    auto start_ms = opt_int64(info, "gameStartTimestamp").value_or(0);
    m.game_start = TimePoint(std::chrono::milliseconds(start_ms));

    // Older payloads report gameDuration in milliseconds and lack gameEndTimestamp.
    auto duration = opt_int64(info, "gameDuration").value_or(0);
    if (!info.contains("gameEndTimestamp")) duration /= 1000;
    m.duration_secs = static_cast<int>(duration);
    m.queue_id = opt_int(info, "queueId").value_or(0);

    if (info.contains("participants") && info["participants"].is_array()) {
        for (auto& p : info["participants"]) {
            if (!p.is_object()) continue;
            m.participants.push_back(parse_participant(p, region));
        }
    }

    m.raw_payload = j.dump();
    m.fetched_at = std::chrono::system_clock::now();
    return m;
}

std::vector<MatchRef> parse_match_ids(const nlohmann::json& j, const std::string& region) {
    std::vector<MatchRef> refs;
    if (!j.is_array()) return refs;
    for (auto& id : j) {
        if (id.is_string()) refs.push_back({id.get<std::string>(), region});
    }
    return refs;
}

std::vector<PlayerRef> parse_ladder(const nlohmann::json& j, const std::string& region) {
    std::vector<PlayerRef> players;
    if (!j.contains("entries") || !j["entries"].is_array()) return players;
    for (auto& e : j["entries"]) {
        auto puuid = safe_str(e, "puuid");
        if (!puuid.empty()) players.push_back({puuid, region});
    }
    return players;
}

RiotClient::RiotClient(ClientConfig config, RateLimiter& limiter)
    : config_(std::move(config)), limiter_(limiter) {}

std::expected<nlohmann::json, FetchError> RiotClient::fetch_endpoint(
    const std::string& host, const std::string& path) {

    limiter_.wait_for_slot();

    httplib::SSLClient client(host);
    client.set_connection_timeout(config_.connect_timeout);
    client.set_read_timeout(config_.read_timeout);

    httplib::Headers headers{{"X-Riot-Token", config_.api_key}};
    auto res = client.Get(path, headers);
    if (!res) {
        return std::unexpected(FetchError{FetchErrorKind::Transient, 0,
                                          "Connection failed: " + httplib::to_string(res.error())});
    }

    limiter_.observe(parse_rate_limit_headers(
        res->get_header_value("X-App-Rate-Limit"),
        res->get_header_value("X-App-Rate-Limit-Count")));

    std::chrono::seconds retry_after{0};
    if (res->has_header("Retry-After")) {
        try {
            retry_after = std::chrono::seconds(std::stoi(res->get_header_value("Retry-After")));
        } catch (const std::exception&) {
            retry_after = std::chrono::seconds(0);
        }
    }

    if (auto err = classify_status(res->status, res->body, retry_after)) {
        if (err->kind == FetchErrorKind::RateLimited) {
            limiter_.pause_for(err->retry_after);
        }
        RIFTCRAWL_LOG_DEBUG("GET {}{} -> {}", host, path, err->message);
        return std::unexpected(*err);
    }

    try {
        return nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(FetchError{FetchErrorKind::Transient, res->status,
                                          std::string("JSON parse error: ") + e.what()});
    }
}

std::expected<std::vector<MatchRef>, FetchError> RiotClient::list_match_ids(
    const PlayerRef& player, const MatchWindow& window) {

    auto host = routing_for_platform(player.region) + ".api.riotgames.com";
    auto start_time = std::chrono::duration_cast<std::chrono::seconds>(
        (std::chrono::system_clock::now() - window.recency).time_since_epoch());

    std::vector<MatchRef> all;
    for (int start = 0; start < window.max_count; start += ids_page_size) {
        int count = std::min(ids_page_size, window.max_count - start);
        std::string path = "/lol/match/v5/matches/by-puuid/" + player.id +
                           "/ids?startTime=" + std::to_string(start_time.count()) +
                           "&start=" + std::to_string(start) +
                           "&count=" + std::to_string(count);
        if (window.queue_id > 0) path += "&queue=" + std::to_string(window.queue_id);

        auto result = fetch_endpoint(host, path);
        if (!result) return std::unexpected(result.error());

        std::vector<MatchRef> page;
        try {
            page = parse_match_ids(*result, player.region);
        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(malformed_body(e));
        }
        bool last_page = static_cast<int>(page.size()) < count;
        std::ranges::move(page, std::back_inserter(all));
        if (last_page) break;
    }
    return all;
}

std::expected<MatchRecord, FetchError> RiotClient::fetch_match(const MatchRef& match) {
    auto host = routing_for_platform(match.region) + ".api.riotgames.com";
    auto result = fetch_endpoint(host, "/lol/match/v5/matches/" + match.id);
    if (!result) return std::unexpected(result.error());

    try {
        auto record = parse_match(*result, match.region);
        if (record.ref.id.empty()) record.ref.id = match.id;
        return record;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(malformed_body(e));
    }
}

std::expected<std::vector<PlayerRef>, FetchError> RiotClient::list_ladder_players(
    const std::string& tier) {

    auto host = config_.region + ".api.riotgames.com";
    auto result = fetch_endpoint(host, "/lol/league/v4/" + tier +
                                           "leagues/by-queue/RANKED_SOLO_5x5");
    if (!result) return std::unexpected(result.error());
    try {
        return parse_ladder(*result, config_.region);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(malformed_body(e));
    }
}

} // namespace riftcrawl
