#pragma once

#include "riftcrawl/remote_client.hpp"
#include "riftcrawl/types.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace riftcrawl::test_support {

inline TimePoint ms_now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

inline FrontierEntry make_entry(EntityKind kind, const std::string& id, TimePoint at,
                                const std::string& region = "euw1") {
    FrontierEntry e;
    e.kind = kind;
    e.ref = {id, region};
    e.discovered_at = at;
    e.not_before = at;
    return e;
}

inline ParticipantRecord make_participant(const std::string& player, const std::string& region,
                                          int team_id, const std::string& position, int seed) {
    ParticipantRecord p;
    p.player = {player, region};
    p.team_id = team_id;
    p.position = position;
    p.champion = "Champ" + std::to_string(seed);
    p.summoner1_id = 4;
    p.summoner2_id = team_id == 100 ? 14 : 12;
    p.win = team_id == 100;
    p.stats.kills = 2 + seed % 5;
    p.stats.deaths = 1 + seed % 3;
    p.stats.assists = 4 + seed % 7;
    p.stats.gold_earned = 9000 + 250 * seed;
    p.stats.minions_killed = 150 + seed;
    p.stats.vision_score = 15 + seed % 10;
    p.stats.damage_to_champions = 12000 + 300 * seed;
    p.stats.champ_level = 14 + seed % 4;
    return p;
}

// Full 10-player ranked match; blue side (100) wins.
inline MatchRecord make_match(const std::string& id, const std::string& region, int seed,
                              std::vector<std::string> players = {}) {
    static const char* positions[] = {"TOP", "JUNGLE", "MIDDLE", "BOTTOM", "UTILITY"};

    MatchRecord m;
    m.ref = {id, region};
    m.game_start = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000 + seed));
    m.duration_secs = 1800;
    m.queue_id = 420;
    for (int i = static_cast<int>(players.size()); i < 10; ++i) {
        players.push_back(id + "-p" + std::to_string(i));
    }
    for (int i = 0; i < 10; ++i) {
        m.participants.push_back(make_participant(players[i], region, i < 5 ? 100 : 200,
                                                  positions[i % 5], seed + i));
    }
    m.raw_payload = R"({"metadata":{"matchId":")" + id + R"("}})";
    m.fetched_at = ms_now();
    return m;
}

// A match whose only participants are `players`.
inline MatchRecord make_small_match(const std::string& id, const std::vector<std::string>& players,
                                    int queue_id = 420) {
    MatchRecord m;
    m.ref = {id, "euw1"};
    m.duration_secs = 1500;
    m.queue_id = queue_id;
    for (size_t i = 0; i < players.size(); ++i) {
        m.participants.push_back(make_participant(players[i], "euw1", i % 2 ? 200 : 100,
                                                  "TOP", static_cast<int>(i)));
    }
    m.raw_payload = "{}";
    return m;
}

// In-memory player/match graph served through the RemoteClient interface.
class FakeRemoteClient : public RemoteClient {
public:
    void add_player(const std::string& player, std::vector<std::string> match_ids) {
        std::lock_guard lock(mutex_);
        player_matches_[player] = std::move(match_ids);
    }

    void add_match(MatchRecord match) {
        std::lock_guard lock(mutex_);
        auto id = match.ref.id;
        matches_[id] = std::move(match);
    }

    void add_ladder(const std::string& tier, std::vector<std::string> players) {
        std::lock_guard lock(mutex_);
        ladders_[tier] = std::move(players);
    }

    // Errors returned, in order, by the next fetches of `match_id`.
    void script_errors(const std::string& match_id, std::vector<FetchError> errors) {
        std::lock_guard lock(mutex_);
        for (auto& e : errors) scripted_[match_id].push_back(e);
    }

    void script_ladder_errors(const std::string& tier, std::vector<FetchError> errors) {
        std::lock_guard lock(mutex_);
        for (auto& e : errors) ladder_errors_[tier].push_back(e);
    }

    void always_fail(const std::string& match_id, FetchError error) {
        std::lock_guard lock(mutex_);
        permanent_[match_id] = std::move(error);
    }

    std::expected<std::vector<MatchRef>, FetchError> list_match_ids(
        const PlayerRef& player, const MatchWindow& window) override {
        std::lock_guard lock(mutex_);
        last_window_ = window;
        ++list_calls_[player.id];
        std::vector<MatchRef> refs;
        auto it = player_matches_.find(player.id);
        if (it == player_matches_.end()) return refs;
        for (auto& id : it->second) {
            if (static_cast<int>(refs.size()) >= window.max_count) break;
            refs.push_back({id, player.region});
        }
        return refs;
    }

    std::expected<MatchRecord, FetchError> fetch_match(const MatchRef& match) override {
        std::lock_guard lock(mutex_);
        ++fetch_calls_[match.id];
        fetch_log_.push_back({match.id, std::chrono::steady_clock::now()});

        if (auto it = permanent_.find(match.id); it != permanent_.end()) {
            return std::unexpected(it->second);
        }
        if (auto it = scripted_.find(match.id); it != scripted_.end() && !it->second.empty()) {
            auto err = it->second.front();
            it->second.pop_front();
            return std::unexpected(err);
        }
        auto it = matches_.find(match.id);
        if (it == matches_.end()) {
            return std::unexpected(FetchError{FetchErrorKind::NotFound, 404, "HTTP 404", {}});
        }
        auto record = it->second;
        record.fetched_at = ms_now();
        return record;
    }

    std::expected<std::vector<PlayerRef>, FetchError> list_ladder_players(
        const std::string& tier) override {
        std::lock_guard lock(mutex_);
        ++ladder_calls_[tier];
        if (auto it = ladder_errors_.find(tier); it != ladder_errors_.end() && !it->second.empty()) {
            auto err = it->second.front();
            it->second.pop_front();
            return std::unexpected(err);
        }
        std::vector<PlayerRef> players;
        for (auto& id : ladders_[tier]) players.push_back({id, "euw1"});
        return players;
    }

    int fetch_count(const std::string& match_id) {
        std::lock_guard lock(mutex_);
        return fetch_calls_[match_id];
    }

    int list_count(const std::string& player) {
        std::lock_guard lock(mutex_);
        return list_calls_[player];
    }

    int ladder_count(const std::string& tier) {
        std::lock_guard lock(mutex_);
        return ladder_calls_[tier];
    }

    MatchWindow last_window() {
        std::lock_guard lock(mutex_);
        return last_window_;
    }

    std::vector<std::pair<std::string, std::chrono::steady_clock::time_point>> fetch_log() {
        std::lock_guard lock(mutex_);
        return fetch_log_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> player_matches_;
    std::map<std::string, MatchRecord> matches_;
    std::map<std::string, std::vector<std::string>> ladders_;
    std::map<std::string, std::deque<FetchError>> scripted_;
    std::map<std::string, FetchError> permanent_;
    std::map<std::string, std::deque<FetchError>> ladder_errors_;
    std::map<std::string, int> ladder_calls_;
    std::map<std::string, int> fetch_calls_;
    std::map<std::string, int> list_calls_;
    std::vector<std::pair<std::string, std::chrono::steady_clock::time_point>> fetch_log_;
    MatchWindow last_window_;
};

inline FetchError transient_error() {
    return {FetchErrorKind::Transient, 503, "HTTP 503", {}};
}

inline FetchError rate_limited_error(std::chrono::milliseconds retry_after) {
    return {FetchErrorKind::RateLimited, 429, "HTTP 429", retry_after};
}

} // namespace riftcrawl::test_support
