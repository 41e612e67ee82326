#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace riftcrawl {

// One `.env` assignment. Accepts an optional `export` prefix; quoted values
// are kept verbatim, unquoted ones lose a trailing " # comment".
std::optional<std::pair<std::string, std::string>> parse_env_line(std::string_view line);

// Exports every assignment in `path` without overriding variables already set.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

// Empty values count as unset.
std::optional<std::string> get_env(const std::string& key);

} // namespace riftcrawl
