#include "riftcrawl/feature_builder.hpp"
#include "riftcrawl/logging.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <tuple>

namespace riftcrawl {

namespace {

constexpr int kBlueTeam = 100;

struct SlotColumn {
    const char* name;
    bool real; // printed with fixed decimals
};

constexpr std::array<SlotColumn, 14> kSlotColumns = {{
    {"role", false},
    {"spell1", false},
    {"spell2", false},
    {"kills", false},
    {"deaths", false},
    {"assists", false},
    {"gold", false},
    {"cs", false},
    {"vision", false},
    {"damage", false},
    {"champ_level", false},
    {"kda", true},
    {"gold_per_min", true},
    {"cs_per_min", true},
}};

// Explicit defaults for absent stats. Zero is a legitimate value for every
// counting stat; a champion is never below level 1.
struct Defaults {
    static constexpr int kills = 0;
    static constexpr int deaths = 0;
    static constexpr int assists = 0;
    static constexpr int gold = 0;
    static constexpr int cs = 0;
    static constexpr int vision = 0;
    static constexpr int damage = 0;
    static constexpr int champ_level = 1;
};

int role_rank(Role role) {
    return role == Role::Unknown ? 99 : static_cast<int>(role);
}

int take(const std::optional<int>& v, int fallback, int& imputed) {
    if (v) return *v;
    ++imputed;
    return fallback;
}

std::string fixed(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << v;
    return oss.str();
}

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

std::optional<bool> blue_side_won(const std::vector<const ParticipantRecord*>& slots) {
    for (auto* p : slots) {
        if (!p->win) continue;
        return p->team_id == kBlueTeam ? *p->win : !*p->win;
    }
    return std::nullopt;
}

} // namespace

Role parse_role(const std::string& position) {
    if (position == "TOP") return Role::Top;
    if (position == "JUNGLE") return Role::Jungle;
    if (position == "MIDDLE") return Role::Middle;
    if (position == "BOTTOM") return Role::Bottom;
    if (position == "UTILITY") return Role::Utility;
    return Role::Unknown;
}

SummonerSpell encode_spell(std::optional<int> riot_spell_id) {
    if (!riot_spell_id) return SummonerSpell::Unknown;
    switch (*riot_spell_id) {
        case 4: return SummonerSpell::Flash;
        case 14: return SummonerSpell::Ignite;
        case 12: return SummonerSpell::Teleport;
        case 11: return SummonerSpell::Smite;
        case 7: return SummonerSpell::Heal;
        case 3: return SummonerSpell::Exhaust;
        case 21: return SummonerSpell::Barrier;
        case 1: return SummonerSpell::Cleanse;
        case 6: return SummonerSpell::Ghost;
        default: return SummonerSpell::Unknown;
    }
}

std::vector<const ParticipantRecord*> canonical_order(const MatchRecord& match) {
    std::vector<size_t> index(match.participants.size());
    for (size_t i = 0; i < index.size(); ++i) index[i] = i;

    auto key = [&](size_t i) {
        auto& p = match.participants[i];
        int side = p.team_id == kBlueTeam ? 0 : 1;
        return std::tuple(side, role_rank(parse_role(p.position)), i);
    };
    std::ranges::sort(index, [&](size_t a, size_t b) { return key(a) < key(b); });

    std::vector<const ParticipantRecord*> out;
    out.reserve(index.size());
    for (auto i : index) out.push_back(&match.participants[i]);
    return out;
}

const std::vector<std::string>& dataset_columns() {
    static const std::vector<std::string> columns = [] {
        std::vector<std::string> c{"region", "match_id"};
        for (int slot = 0; slot < kSlots; ++slot) {
            for (auto& col : kSlotColumns) {
                c.push_back("p" + std::to_string(slot) + "_" + col.name);
            }
        }
        c.push_back("blue_win");
        c.push_back("imputed");
        c.push_back("label");
        return c;
    }();
    return columns;
}

std::optional<FeatureRecord> extract_features(const MatchRecord& match) {
    if (match.participants.size() != kSlots) return std::nullopt;

    auto slots = canonical_order(match);
    FeatureRecord rec;
    rec.ref = match.ref;
    rec.features.reserve(kSlots * kSlotColumns.size());

    double minutes = match.duration_secs / 60.0;
    int64_t blue_gold = 0;
    int64_t red_gold = 0;

    for (auto* p : slots) {
        auto& s = p->stats;
        int& imp = rec.imputed;
        int kills = take(s.kills, Defaults::kills, imp);
        int deaths = take(s.deaths, Defaults::deaths, imp);
        int assists = take(s.assists, Defaults::assists, imp);
        int gold = take(s.gold_earned, Defaults::gold, imp);
        int cs = take(s.minions_killed, Defaults::cs, imp);
        int vision = take(s.vision_score, Defaults::vision, imp);
        int damage = take(s.damage_to_champions, Defaults::damage, imp);
        int level = take(s.champ_level, Defaults::champ_level, imp);

        double gold_per_min = 0.0;
        double cs_per_min = 0.0;
        if (minutes > 0) {
            gold_per_min = gold / minutes;
            cs_per_min = cs / minutes;
        } else {
            imp += 2;
        }

        auto& f = rec.features;
        f.push_back(static_cast<int>(parse_role(p->position)));
        f.push_back(static_cast<int>(encode_spell(p->summoner1_id)));
        f.push_back(static_cast<int>(encode_spell(p->summoner2_id)));
        f.push_back(kills);
        f.push_back(deaths);
        f.push_back(assists);
        f.push_back(gold);
        f.push_back(cs);
        f.push_back(vision);
        f.push_back(damage);
        f.push_back(level);
        f.push_back(static_cast<double>(kills + assists) / std::max(1, deaths));
        f.push_back(gold_per_min);
        f.push_back(cs_per_min);

        (p->team_id == kBlueTeam ? blue_gold : red_gold) += gold;
    }

    auto won = blue_side_won(slots);
    if (!won) ++rec.imputed;
    rec.blue_win = won.value_or(false) ? 1 : 0;

    double total_gold = static_cast<double>(blue_gold + red_gold);
    double gold_share = total_gold > 0 ? blue_gold / total_gold : 0.5;
    rec.label = 0.55 * gold_share + 0.45 * rec.blue_win;
    return rec;
}

std::string format_row(const FeatureRecord& record) {
    std::ostringstream row;
    row << csv_field(record.ref.region) << ',' << csv_field(record.ref.id);
    for (size_t i = 0; i < record.features.size(); ++i) {
        double v = record.features[i];
        row << ',';
        if (kSlotColumns[i % kSlotColumns.size()].real) {
            row << fixed(v);
        } else {
            row << static_cast<int64_t>(v);
        }
    }
    row << ',' << record.blue_win << ',' << record.imputed << ',' << fixed(record.label);
    return row.str();
}

FeatureBuilder::FeatureBuilder(Repository& repo, std::size_t page_size)
    : repo_(repo), page_size_(page_size) {}

std::vector<FeatureRecord> FeatureBuilder::build(std::size_t offset) {
    skipped_ = 0;
    std::vector<FeatureRecord> out;
    auto cursor = repo_.iterate_matches(offset, page_size_);
    while (auto match = cursor.next()) {
        if (auto rec = extract_features(*match)) {
            out.push_back(std::move(*rec));
        } else {
            ++skipped_;
            RIFTCRAWL_LOG_DEBUG("match {} skipped: {} participants",
                                match->ref.id, match->participants.size());
        }
    }
    return out;
}

std::expected<BuildReport, std::string> FeatureBuilder::write_dataset(
    const std::filesystem::path& out) {
    auto started = std::chrono::steady_clock::now();
    BuildReport report;
    report.path = out;

    std::error_code ec;
    if (out.has_parent_path()) {
        std::filesystem::create_directories(out.parent_path(), ec);
        if (ec) return std::unexpected("cannot create " + out.parent_path().string() + ": " + ec.message());
    }

    auto tmp = out;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) return std::unexpected("cannot open " + tmp.string() + " for writing");

        auto& columns = dataset_columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            file << (i ? "," : "") << columns[i];
        }
        file << '\n';

        skipped_ = 0;
        try {
            auto cursor = repo_.iterate_matches(0, page_size_);
            while (auto match = cursor.next()) {
                ++report.matches_read;
                auto rec = extract_features(*match);
                if (!rec) {
                    ++skipped_;
                    continue;
                }
                file << format_row(*rec) << '\n';
                ++report.rows_written;
            }
        } catch (const StorageError& e) {
            file.close();
            std::filesystem::remove(tmp, ec);
            return std::unexpected(std::string("reading matches failed: ") + e.what());
        }

        file.flush();
        if (!file) {
            std::filesystem::remove(tmp, ec);
            return std::unexpected("write to " + tmp.string() + " failed");
        }
    }

    std::filesystem::rename(tmp, out, ec);
    if (ec) return std::unexpected("cannot replace " + out.string() + ": " + ec.message());

    report.skipped = skipped_;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    RIFTCRAWL_LOG_INFO("dataset {}: {} rows written, {} matches skipped",
                       out.string(), report.rows_written, report.skipped);
    return report;
}

} // namespace riftcrawl
