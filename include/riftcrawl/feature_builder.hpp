#pragma once

#include "riftcrawl/repository.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace riftcrawl {

inline constexpr int kTeamSize = 5;
inline constexpr int kSlots = 2 * kTeamSize;

// Fixed encodings. Code 0 is the "unknown" bucket for values outside the
// enumeration; codes never change once published.
enum class Role { Unknown = 0, Top, Jungle, Middle, Bottom, Utility };

enum class SummonerSpell {
    Unknown = 0,
    Flash,
    Ignite,
    Teleport,
    Smite,
    Heal,
    Exhaust,
    Barrier,
    Cleanse,
    Ghost,
};

Role parse_role(const std::string& position);
SummonerSpell encode_spell(std::optional<int> riot_spell_id);

// Blue side first, then TOP..UTILITY, unknown positions last, ties by
// original participant index.
std::vector<const ParticipantRecord*> canonical_order(const MatchRecord& match);

// Column order of one dataset row, region and match_id first.
const std::vector<std::string>& dataset_columns();

// nullopt when the match does not have exactly kSlots participants.
std::optional<FeatureRecord> extract_features(const MatchRecord& match);

struct BuildReport {
    int64_t matches_read = 0;
    int64_t rows_written = 0;
    int64_t skipped = 0;
    std::filesystem::path path;
    std::chrono::milliseconds elapsed{0};
};

class FeatureBuilder {
public:
    explicit FeatureBuilder(Repository& repo, std::size_t page_size = 256);

    // All rows in (region, match_id) order, starting `offset` matches in.
    std::vector<FeatureRecord> build(std::size_t offset = 0);

    // Replaces `out` with a freshly built CSV dataset.
    std::expected<BuildReport, std::string> write_dataset(const std::filesystem::path& out);

    int64_t skipped() const { return skipped_; }

private:
    Repository& repo_;
    std::size_t page_size_;
    int64_t skipped_ = 0;
};

std::string format_row(const FeatureRecord& record);

} // namespace riftcrawl
