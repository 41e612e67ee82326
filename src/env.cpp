#include "riftcrawl/env.hpp"
#include <cstdlib>
#include <fstream>

namespace riftcrawl {

namespace {

constexpr std::string_view kBlank = " \t\r\n";
constexpr std::string_view kExport = "export ";

std::string_view strip(std::string_view sv) {
    auto first = sv.find_first_not_of(kBlank);
    if (first == std::string_view::npos) return {};
    return sv.substr(first, sv.find_last_not_of(kBlank) - first + 1);
}

bool quoted(std::string_view v) {
    return v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front();
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_env_line(std::string_view line) {
    line = strip(line);
    if (line.empty() || line.front() == '#') return std::nullopt;
    if (line.starts_with(kExport)) line = strip(line.substr(kExport.size()));

    auto eq = line.find('=');
    if (eq == std::string_view::npos) return std::nullopt;
    auto key = strip(line.substr(0, eq));
    if (key.empty()) return std::nullopt;

    auto value = strip(line.substr(eq + 1));
    if (quoted(value)) {
        value = value.substr(1, value.size() - 2);
    } else if (auto comment = value.find(" #"); comment != std::string_view::npos) {
        value = strip(value.substr(0, comment));
    }
    return std::pair{std::string(key), std::string(value)};
}

std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path) {
    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    for (std::string line; file && std::getline(file, line);) {
        auto kv = parse_env_line(line);
        if (!kv) continue;
        ::setenv(kv->first.c_str(), kv->second.c_str(), 0);
        vars.insert_or_assign(std::move(kv->first), std::move(kv->second));
    }
    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    if (val == nullptr || *val == '\0') return std::nullopt;
    return std::string(val);
}

} // namespace riftcrawl
