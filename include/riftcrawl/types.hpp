#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riftcrawl {

using TimePoint = std::chrono::system_clock::time_point;

enum class EntityKind { Player, Match };

enum class EntryState { Pending, InFlight, Done, Failed };

std::string to_string(EntityKind kind);
std::string to_string(EntryState state);
std::optional<EntityKind> parse_entity_kind(const std::string& s);
std::optional<EntryState> parse_entry_state(const std::string& s);

struct PlayerRef {
    std::string id;     // puuid
    std::string region; // platform shard, e.g. euw1

    bool operator==(const PlayerRef&) const = default;
};

struct MatchRef {
    std::string id;
    std::string region;

    bool operator==(const MatchRef&) const = default;
    auto operator<=>(const MatchRef&) const = default;
};

// Identifier shared by both kinds of frontier work.
struct EntityRef {
    std::string id;
    std::string region;

    bool operator==(const EntityRef&) const = default;
};

inline EntityRef to_entity(const PlayerRef& p) { return {p.id, p.region}; }
inline EntityRef to_entity(const MatchRef& m) { return {m.id, m.region}; }
inline PlayerRef to_player(const EntityRef& e) { return {e.id, e.region}; }
inline MatchRef to_match(const EntityRef& e) { return {e.id, e.region}; }

struct ParticipantStats {
    std::optional<int> kills;
    std::optional<int> deaths;
    std::optional<int> assists;
    std::optional<int> gold_earned;
    std::optional<int> minions_killed; // lane + neutral
    std::optional<int> vision_score;
    std::optional<int> damage_to_champions;
    std::optional<int> champ_level;
};

struct ParticipantRecord {
    PlayerRef player;
    int team_id = 0;             // 100 = blue, 200 = red
    std::string position;        // TOP, JUNGLE, MIDDLE, BOTTOM, UTILITY or empty
    std::string champion;
    std::optional<int> summoner1_id;
    std::optional<int> summoner2_id;
    std::optional<bool> win;
    ParticipantStats stats;
};

struct MatchRecord {
    MatchRef ref;
    TimePoint game_start;
    int duration_secs = 0;
    int queue_id = 0;
    std::vector<ParticipantRecord> participants;
    std::string raw_payload; // serialized remote JSON
    TimePoint fetched_at;
};

struct FrontierEntry {
    EntityKind kind = EntityKind::Player;
    EntityRef ref;
    TimePoint discovered_at;
    int attempts = 0;
    EntryState state = EntryState::Pending;
    TimePoint not_before;            // earliest time the entry may be claimed
    std::optional<TimePoint> claimed_at;
    std::string last_error;
};

struct FeatureRecord {
    MatchRef ref;
    std::vector<double> features;
    double label = 0.0;
    int blue_win = 0;
    int imputed = 0;
};

// Match listing window: how far back to look for a player's matches.
struct MatchWindow {
    std::chrono::seconds recency{std::chrono::hours(24 * 7)};
    int max_count = 20;
    int queue_id = 0; // 0 = any queue
};

} // namespace riftcrawl
