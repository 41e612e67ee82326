#include "riftcrawl/sqlite_repository.hpp"
#include "riftcrawl/logging.hpp"

namespace riftcrawl {

namespace {

constexpr const char* schema_sql = R"sql(
CREATE TABLE IF NOT EXISTS matches (
    region        TEXT NOT NULL,
    match_id      TEXT NOT NULL,
    game_start    INTEGER NOT NULL,
    duration_secs INTEGER NOT NULL,
    queue_id      INTEGER NOT NULL,
    raw_payload   TEXT NOT NULL,
    fetched_at    INTEGER NOT NULL,
    PRIMARY KEY (region, match_id)
);

CREATE TABLE IF NOT EXISTS participants (
    region              TEXT NOT NULL,
    match_id            TEXT NOT NULL,
    slot                INTEGER NOT NULL,
    puuid               TEXT NOT NULL,
    team_id             INTEGER NOT NULL,
    position            TEXT NOT NULL,
    champion            TEXT NOT NULL,
    summoner1_id        INTEGER,
    summoner2_id        INTEGER,
    win                 INTEGER,
    kills               INTEGER,
    deaths              INTEGER,
    assists             INTEGER,
    gold_earned         INTEGER,
    minions_killed      INTEGER,
    vision_score        INTEGER,
    damage_to_champions INTEGER,
    champ_level         INTEGER,
    PRIMARY KEY (region, match_id, slot),
    FOREIGN KEY (region, match_id) REFERENCES matches (region, match_id)
);

CREATE INDEX IF NOT EXISTS idx_participants_player ON participants (region, puuid);

CREATE TABLE IF NOT EXISTS players (
    region     TEXT NOT NULL,
    puuid      TEXT NOT NULL,
    crawled_at INTEGER NOT NULL,
    PRIMARY KEY (region, puuid)
);

CREATE TABLE IF NOT EXISTS frontier (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    kind          TEXT NOT NULL,
    region        TEXT NOT NULL,
    ref_id        TEXT NOT NULL,
    discovered_at INTEGER NOT NULL,
    attempts      INTEGER NOT NULL DEFAULT 0,
    state         TEXT NOT NULL DEFAULT 'pending',
    not_before    INTEGER NOT NULL,
    claimed_at    INTEGER,
    last_error    TEXT NOT NULL DEFAULT '',
    UNIQUE (kind, region, ref_id)
);

CREATE INDEX IF NOT EXISTS idx_frontier_claim
    ON frontier (kind, state, discovered_at, id);
)sql";

constexpr const char* frontier_columns =
    "kind, region, ref_id, discovered_at, attempts, state, not_before, claimed_at, last_error";

int64_t to_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::optional<int> from_opt_bool(std::optional<bool> b) {
    if (!b) return std::nullopt;
    return *b ? 1 : 0;
}

// Reads the columns listed in frontier_columns starting at `col`.
FrontierEntry read_entry(const Statement& st, int col = 0) {
    FrontierEntry e;
    e.kind = parse_entity_kind(st.col_text(col)).value_or(EntityKind::Player);
    e.ref = {st.col_text(col + 2), st.col_text(col + 1)};
    e.discovered_at = from_ms(st.col_int(col + 3));
    e.attempts = static_cast<int>(st.col_int(col + 4));
    e.state = parse_entry_state(st.col_text(col + 5)).value_or(EntryState::Pending);
    e.not_before = from_ms(st.col_int(col + 6));
    if (!st.is_null(col + 7)) e.claimed_at = from_ms(st.col_int(col + 7));
    e.last_error = st.col_text(col + 8);
    return e;
}

} // namespace

SqliteRepository::SqliteRepository(std::string path) : path_(std::move(path)) {
    auto lease = acquire();
    migrate(*lease);
    RIFTCRAWL_LOG_DEBUG("opened sqlite repository at {}", path_);
}

SqliteRepository::Lease SqliteRepository::acquire() {
    {
        std::lock_guard lock(pool_mutex_);
        if (!idle_.empty()) {
            auto db = std::move(idle_.back());
            idle_.pop_back();
            return Lease(*this, std::move(db));
        }
    }
    return Lease(*this, std::make_unique<SqliteDB>(path_));
}

void SqliteRepository::release(std::unique_ptr<SqliteDB> db) {
    if (!db) return;
    std::lock_guard lock(pool_mutex_);
    idle_.push_back(std::move(db));
}

void SqliteRepository::migrate(SqliteDB& db) {
    SqliteTransaction tx(db);
    db.exec(schema_sql);
    tx.commit();
}

bool SqliteRepository::exists(EntityKind kind, const EntityRef& ref) {
    auto db = acquire();
    const char* sql = kind == EntityKind::Match
        ? "SELECT 1 FROM matches WHERE region=? AND match_id=?;"
        : "SELECT 1 FROM players WHERE region=? AND puuid=?;";
    Statement st(*db, sql);
    st.bind(1, ref.region).bind(2, ref.id);
    return st.step();
}

void SqliteRepository::put_match(const MatchRecord& match) {
    auto db = acquire();
    SqliteTransaction tx(*db);

    Statement insert(*db,
        "INSERT OR IGNORE INTO matches "
        "(region, match_id, game_start, duration_secs, queue_id, raw_payload, fetched_at) "
        "VALUES (?,?,?,?,?,?,?);");
    insert.bind(1, match.ref.region)
        .bind(2, match.ref.id)
        .bind(3, to_ms(match.game_start))
        .bind(4, int64_t{match.duration_secs})
        .bind(5, int64_t{match.queue_id})
        .bind(6, match.raw_payload)
        .bind(7, to_ms(match.fetched_at));
    insert.step();

    // Already stored: matches are immutable, the second write is a no-op.
    if (db->changes() == 0) {
        tx.commit();
        return;
    }

    Statement part(*db,
        "INSERT INTO participants "
        "(region, match_id, slot, puuid, team_id, position, champion, summoner1_id, "
        " summoner2_id, win, kills, deaths, assists, gold_earned, minions_killed, "
        " vision_score, damage_to_champions, champ_level) "
        "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

    for (size_t slot = 0; slot < match.participants.size(); ++slot) {
        auto& p = match.participants[slot];
        part.bind(1, match.ref.region)
            .bind(2, match.ref.id)
            .bind(3, static_cast<int64_t>(slot))
            .bind(4, p.player.id)
            .bind(5, int64_t{p.team_id})
            .bind(6, p.position)
            .bind(7, p.champion)
            .bind(8, p.summoner1_id)
            .bind(9, p.summoner2_id)
            .bind(10, from_opt_bool(p.win))
            .bind(11, p.stats.kills)
            .bind(12, p.stats.deaths)
            .bind(13, p.stats.assists)
            .bind(14, p.stats.gold_earned)
            .bind(15, p.stats.minions_killed)
            .bind(16, p.stats.vision_score)
            .bind(17, p.stats.damage_to_champions)
            .bind(18, p.stats.champ_level);
        part.step();
        part.reset();
    }

    tx.commit();
}

std::vector<ParticipantRecord> SqliteRepository::load_participants(SqliteDB& db,
                                                                   const MatchRef& ref) {
    Statement st(db,
        "SELECT puuid, team_id, position, champion, summoner1_id, summoner2_id, win, "
        "kills, deaths, assists, gold_earned, minions_killed, vision_score, "
        "damage_to_champions, champ_level "
        "FROM participants WHERE region=? AND match_id=? ORDER BY slot;");
    st.bind(1, ref.region).bind(2, ref.id);

    std::vector<ParticipantRecord> out;
    while (st.step()) {
        ParticipantRecord p;
        p.player = {st.col_text(0), ref.region};
        p.team_id = static_cast<int>(st.col_int(1));
        p.position = st.col_text(2);
        p.champion = st.col_text(3);
        p.summoner1_id = st.col_opt_int(4);
        p.summoner2_id = st.col_opt_int(5);
        if (auto win = st.col_opt_int(6)) p.win = *win != 0;
        p.stats.kills = st.col_opt_int(7);
        p.stats.deaths = st.col_opt_int(8);
        p.stats.assists = st.col_opt_int(9);
        p.stats.gold_earned = st.col_opt_int(10);
        p.stats.minions_killed = st.col_opt_int(11);
        p.stats.vision_score = st.col_opt_int(12);
        p.stats.damage_to_champions = st.col_opt_int(13);
        p.stats.champ_level = st.col_opt_int(14);
        out.push_back(std::move(p));
    }
    return out;
}

std::optional<MatchRecord> SqliteRepository::get_match(const MatchRef& ref) {
    auto db = acquire();
    Statement st(*db,
        "SELECT game_start, duration_secs, queue_id, raw_payload, fetched_at "
        "FROM matches WHERE region=? AND match_id=?;");
    st.bind(1, ref.region).bind(2, ref.id);
    if (!st.step()) return std::nullopt;

    MatchRecord m;
    m.ref = ref;
    m.game_start = from_ms(st.col_int(0));
    m.duration_secs = static_cast<int>(st.col_int(1));
    m.queue_id = static_cast<int>(st.col_int(2));
    m.raw_payload = st.col_text(3);
    m.fetched_at = from_ms(st.col_int(4));
    m.participants = load_participants(*db, ref);
    return m;
}

int64_t SqliteRepository::match_count() {
    auto db = acquire();
    Statement st(*db, "SELECT COUNT(*) FROM matches;");
    st.step();
    return st.col_int(0);
}

int SqliteRepository::put_frontier_entries(const std::vector<FrontierEntry>& entries) {
    if (entries.empty()) return 0;

    auto db = acquire();
    SqliteTransaction tx(*db);
    Statement st(*db,
        "INSERT OR IGNORE INTO frontier (kind, region, ref_id, discovered_at, not_before) "
        "VALUES (?,?,?,?,?);");

    int inserted = 0;
    for (auto& e : entries) {
        st.bind(1, to_string(e.kind))
            .bind(2, e.ref.region)
            .bind(3, e.ref.id)
            .bind(4, to_ms(e.discovered_at))
            .bind(5, to_ms(e.discovered_at));
        st.step();
        inserted += static_cast<int>(db->changes());
        st.reset();
    }

    tx.commit();
    return inserted;
}

std::vector<FrontierEntry> SqliteRepository::claim_next_batch(EntityKind kind, int limit,
                                                              TimePoint now) {
    if (limit <= 0) return {};

    auto db = acquire();
    SqliteTransaction tx(*db);

    std::vector<std::pair<int64_t, FrontierEntry>> candidates;
    {
        std::string sql = std::string("SELECT id, ") + frontier_columns +
                          " FROM frontier WHERE kind=? AND state='pending' AND not_before<=?"
                          " ORDER BY discovered_at, id LIMIT ?;";
        Statement st(*db, sql.c_str());
        st.bind(1, to_string(kind)).bind(2, to_ms(now)).bind(3, int64_t{limit});
        while (st.step()) {
            candidates.emplace_back(st.col_int(0), read_entry(st, 1));
        }
    }

    std::vector<FrontierEntry> claimed;
    Statement mark(*db,
        "UPDATE frontier SET state='in_flight', claimed_at=? WHERE id=? AND state='pending';");
    for (auto& [id, entry] : candidates) {
        mark.bind(1, to_ms(now)).bind(2, id);
        mark.step();
        if (db->changes() == 1) {
            entry.state = EntryState::InFlight;
            entry.claimed_at = now;
            claimed.push_back(std::move(entry));
        }
        mark.reset();
    }

    tx.commit();
    return claimed;
}

void SqliteRepository::mark_done(const FrontierEntry& entry) {
    auto db = acquire();
    SqliteTransaction tx(*db);

    Statement st(*db,
        "UPDATE frontier SET state='done', claimed_at=NULL, last_error='' "
        "WHERE kind=? AND region=? AND ref_id=?;");
    st.bind(1, to_string(entry.kind)).bind(2, entry.ref.region).bind(3, entry.ref.id);
    st.step();

    if (entry.kind == EntityKind::Player) {
        Statement player(*db,
            "INSERT INTO players (region, puuid, crawled_at) VALUES (?,?,?) "
            "ON CONFLICT (region, puuid) DO UPDATE SET crawled_at=excluded.crawled_at;");
        player.bind(1, entry.ref.region)
            .bind(2, entry.ref.id)
            .bind(3, to_ms(std::chrono::system_clock::now()));
        player.step();
    }

    tx.commit();
}

void SqliteRepository::mark_failed(const FrontierEntry& entry, const std::string& reason) {
    auto db = acquire();
    Statement st(*db,
        "UPDATE frontier SET state='failed', claimed_at=NULL, attempts=?, last_error=? "
        "WHERE kind=? AND region=? AND ref_id=?;");
    st.bind(1, int64_t{entry.attempts})
        .bind(2, reason)
        .bind(3, to_string(entry.kind))
        .bind(4, entry.ref.region)
        .bind(5, entry.ref.id);
    st.step();
}

void SqliteRepository::requeue(const FrontierEntry& entry, TimePoint not_before,
                               bool count_attempt, const std::string& reason) {
    auto db = acquire();
    Statement st(*db,
        "UPDATE frontier SET state='pending', claimed_at=NULL, not_before=?, "
        "attempts=attempts+?, last_error=? "
        "WHERE kind=? AND region=? AND ref_id=? AND state='in_flight';");
    st.bind(1, to_ms(not_before))
        .bind(2, int64_t{count_attempt ? 1 : 0})
        .bind(3, reason)
        .bind(4, to_string(entry.kind))
        .bind(5, entry.ref.region)
        .bind(6, entry.ref.id);
    st.step();
}

int SqliteRepository::reclaim_stale(TimePoint claimed_before) {
    auto db = acquire();
    Statement st(*db,
        "UPDATE frontier SET state='pending', claimed_at=NULL "
        "WHERE state='in_flight' AND claimed_at<?;");
    st.bind(1, to_ms(claimed_before));
    st.step();
    return static_cast<int>(db->changes());
}

int SqliteRepository::reset_failed(EntityKind kind) {
    auto db = acquire();
    Statement st(*db,
        "UPDATE frontier SET state='pending', attempts=0, last_error='', not_before=? "
        "WHERE state='failed' AND kind=?;");
    st.bind(1, to_ms(std::chrono::system_clock::now())).bind(2, to_string(kind));
    st.step();
    return static_cast<int>(db->changes());
}

std::optional<TimePoint> SqliteRepository::next_ready_time(EntityKind kind) {
    auto db = acquire();
    Statement st(*db,
        "SELECT MIN(not_before) FROM frontier WHERE kind=? AND state='pending';");
    st.bind(1, to_string(kind));
    if (!st.step() || st.is_null(0)) return std::nullopt;
    return from_ms(st.col_int(0));
}

FrontierStats SqliteRepository::frontier_stats() {
    auto db = acquire();
    Statement st(*db, "SELECT kind, state, COUNT(*) FROM frontier GROUP BY kind, state;");

    FrontierStats stats;
    while (st.step()) {
        auto kind = parse_entity_kind(st.col_text(0));
        auto state = parse_entry_state(st.col_text(1));
        if (!kind || !state) continue;
        auto& counts = *kind == EntityKind::Match ? stats.matches : stats.players;
        auto n = st.col_int(2);
        switch (*state) {
            case EntryState::Pending: counts.pending = n; break;
            case EntryState::InFlight: counts.in_flight = n; break;
            case EntryState::Done: counts.done = n; break;
            case EntryState::Failed: counts.failed = n; break;
        }
    }
    return stats;
}

std::vector<FrontierEntry> SqliteRepository::failed_entries() {
    auto db = acquire();
    std::string sql = std::string("SELECT ") + frontier_columns +
                      " FROM frontier WHERE state='failed' ORDER BY discovered_at, id;";
    Statement st(*db, sql.c_str());

    std::vector<FrontierEntry> out;
    while (st.step()) out.push_back(read_entry(st));
    return out;
}

std::vector<MatchRecord> SqliteRepository::read_matches(const std::optional<MatchRef>& after,
                                                        std::size_t limit) {
    auto db = acquire();
    std::vector<MatchRef> keys;
    {
        Statement st(*db, after
            ? "SELECT region, match_id FROM matches "
              "WHERE region>?1 OR (region=?1 AND match_id>?2) "
              "ORDER BY region, match_id LIMIT ?3;"
            : "SELECT region, match_id FROM matches ORDER BY region, match_id LIMIT ?3;");
        if (after) st.bind(1, after->region).bind(2, after->id);
        st.bind(3, static_cast<int64_t>(limit));
        while (st.step()) keys.push_back({st.col_text(1), st.col_text(0)});
    }

    std::vector<MatchRecord> out;
    out.reserve(keys.size());
    Statement st(*db,
        "SELECT game_start, duration_secs, queue_id, raw_payload, fetched_at "
        "FROM matches WHERE region=? AND match_id=?;");
    for (auto& key : keys) {
        st.bind(1, key.region).bind(2, key.id);
        if (st.step()) {
            MatchRecord m;
            m.ref = key;
            m.game_start = from_ms(st.col_int(0));
            m.duration_secs = static_cast<int>(st.col_int(1));
            m.queue_id = static_cast<int>(st.col_int(2));
            m.raw_payload = st.col_text(3);
            m.fetched_at = from_ms(st.col_int(4));
            out.push_back(std::move(m));
        }
        st.reset();
    }
    for (auto& m : out) m.participants = load_participants(*db, m.ref);
    return out;
}

std::optional<MatchRef> SqliteRepository::match_key_at(std::size_t offset) {
    auto db = acquire();
    Statement st(*db,
        "SELECT region, match_id FROM matches ORDER BY region, match_id LIMIT 1 OFFSET ?;");
    st.bind(1, static_cast<int64_t>(offset));
    if (!st.step()) return std::nullopt;
    return MatchRef{st.col_text(1), st.col_text(0)};
}

} // namespace riftcrawl
