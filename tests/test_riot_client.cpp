#include <gtest/gtest.h>
#include "riftcrawl/riot_client.hpp"

using namespace riftcrawl;
using nlohmann::json;

namespace {

json sample_match() {
    return json::parse(R"({
        "metadata": {"matchId": "EUW1_7000000001", "participants": ["p1", "p2"]},
        "info": {
            "gameStartTimestamp": 1700000000000,
            "gameEndTimestamp": 1700001800000,
            "gameDuration": 1800,
            "queueId": 420,
            "participants": [
                {
                    "puuid": "p1", "teamId": 100, "teamPosition": "TOP",
                    "championName": "Garen", "summoner1Id": 4, "summoner2Id": 12,
                    "win": true, "kills": 7, "deaths": 2, "assists": 5,
                    "goldEarned": 12000, "totalMinionsKilled": 180,
                    "neutralMinionsKilled": 12, "visionScore": 20,
                    "totalDamageDealtToChampions": 21000, "champLevel": 16
                },
                {
                    "puuid": "p2", "teamId": 200, "teamPosition": "",
                    "championName": "Ahri", "win": false
                }
            ]
        }
    })");
}

} // namespace

TEST(RiotParse, MatchHeader) {
    auto m = parse_match(sample_match(), "euw1");
    EXPECT_EQ(m.ref.id, "EUW1_7000000001");
    EXPECT_EQ(m.ref.region, "euw1");
    EXPECT_EQ(m.queue_id, 420);
    EXPECT_EQ(m.duration_secs, 1800);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(
                  m.game_start.time_since_epoch()).count(),
              1700000000000);
    EXPECT_FALSE(m.raw_payload.empty());
    EXPECT_EQ(json::parse(m.raw_payload)["metadata"]["matchId"], "EUW1_7000000001");
}

TEST(RiotParse, ParticipantStats) {
    auto m = parse_match(sample_match(), "euw1");
    ASSERT_EQ(m.participants.size(), 2u);

    auto& p = m.participants[0];
    EXPECT_EQ(p.player.id, "p1");
    EXPECT_EQ(p.player.region, "euw1");
    EXPECT_EQ(p.team_id, 100);
    EXPECT_EQ(p.position, "TOP");
    EXPECT_EQ(p.champion, "Garen");
    EXPECT_EQ(p.summoner1_id, 4);
    EXPECT_EQ(p.summoner2_id, 12);
    EXPECT_EQ(p.win, true);
    EXPECT_EQ(p.stats.kills, 7);
    EXPECT_EQ(p.stats.minions_killed, 192);
    EXPECT_EQ(p.stats.damage_to_champions, 21000);
    EXPECT_EQ(p.stats.champ_level, 16);
}

TEST(RiotParse, AbsentFieldsStayAbsent) {
    auto m = parse_match(sample_match(), "euw1");
    auto& p = m.participants[1];
    EXPECT_FALSE(p.summoner1_id.has_value());
    EXPECT_FALSE(p.stats.kills.has_value());
    EXPECT_FALSE(p.stats.gold_earned.has_value());
    EXPECT_FALSE(p.stats.minions_killed.has_value());
    EXPECT_FALSE(p.stats.champ_level.has_value());
    EXPECT_TRUE(p.position.empty());
}

TEST(RiotParse, LegacyDurationInMilliseconds) {
    auto j = sample_match();
    j["info"].erase("gameEndTimestamp");
    j["info"]["gameDuration"] = 1800000;
    EXPECT_EQ(parse_match(j, "euw1").duration_secs, 1800);
}

TEST(RiotParse, MistypedBodiesDoNotThrow) {
    auto null_info = json::parse(R"({"metadata":{"matchId":"EUW1_9"},"info":null})");
    MatchRecord m;
    EXPECT_NO_THROW(m = parse_match(null_info, "euw1"));
    EXPECT_EQ(m.ref.id, "EUW1_9");
    EXPECT_TRUE(m.participants.empty());
    EXPECT_EQ(m.duration_secs, 0);

    auto bad_numbers = json::parse(
        R"({"info":{"gameStartTimestamp":"x","gameDuration":"long","participants":[1,{"puuid":"a"}]}})");
    EXPECT_NO_THROW(m = parse_match(bad_numbers, "euw1"));
    EXPECT_EQ(m.game_start, TimePoint(std::chrono::milliseconds(0)));
    ASSERT_EQ(m.participants.size(), 1u);
    EXPECT_EQ(m.participants[0].player.id, "a");

    EXPECT_NO_THROW(parse_match(json::array(), "euw1"));
    EXPECT_NO_THROW(parse_ladder(json::parse(R"({"entries":[null,"x"]})"), "kr"));
}

TEST(RiotParse, MatchIds) {
    auto refs = parse_match_ids(json::parse(R"(["EUW1_1", 42, "EUW1_2"])"), "euw1");
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0], (MatchRef{"EUW1_1", "euw1"}));
    EXPECT_EQ(refs[1], (MatchRef{"EUW1_2", "euw1"}));
    EXPECT_TRUE(parse_match_ids(json::object(), "euw1").empty());
}

TEST(RiotParse, Ladder) {
    auto players = parse_ladder(json::parse(R"({
        "tier": "CHALLENGER",
        "entries": [{"puuid": "a"}, {"summonerId": "legacy"}, {"puuid": "b"}]
    })"), "kr");
    ASSERT_EQ(players.size(), 2u);
    EXPECT_EQ(players[0].id, "a");
    EXPECT_EQ(players[1].region, "kr");
}

TEST(RiotRouting, PlatformToRegion) {
    EXPECT_EQ(routing_for_platform("euw1"), "europe");
    EXPECT_EQ(routing_for_platform("NA1"), "americas");
    EXPECT_EQ(routing_for_platform("kr"), "asia");
    EXPECT_EQ(routing_for_platform("oc1"), "sea");
}

TEST(RiotRouting, NonAsciiPlatformFallsBackToEurope) {
    EXPECT_EQ(routing_for_platform("\xC3\x89UW1"), "europe");
    EXPECT_EQ(routing_for_platform("KR"), "asia");
}

TEST(RiotStatus, SuccessIsNotAnError) {
    EXPECT_FALSE(classify_status(200, "").has_value());
}

TEST(RiotStatus, Taxonomy) {
    EXPECT_EQ(classify_status(404, "")->kind, FetchErrorKind::NotFound);
    EXPECT_EQ(classify_status(401, "")->kind, FetchErrorKind::Unauthorized);
    EXPECT_EQ(classify_status(403, "")->kind, FetchErrorKind::Unauthorized);
    EXPECT_EQ(classify_status(500, "")->kind, FetchErrorKind::Transient);
    EXPECT_EQ(classify_status(503, "")->kind, FetchErrorKind::Transient);
    EXPECT_EQ(classify_status(400, "")->kind, FetchErrorKind::Transient);
}

TEST(RiotStatus, RateLimitCarriesCooldown) {
    auto err = classify_status(429, "", std::chrono::seconds(7));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, FetchErrorKind::RateLimited);
    EXPECT_EQ(err->retry_after, std::chrono::seconds(7));

    auto fallback = classify_status(429, "");
    EXPECT_EQ(fallback->retry_after, std::chrono::seconds(2));
}

TEST(RiotStatus, MessageIncludesServerStatus) {
    auto err = classify_status(403, R"({"status": {"message": "Forbidden", "status_code": 403}})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->status_code, 403);
    EXPECT_EQ(err->message, "HTTP 403: Forbidden");
}
