#include "riftcrawl/config.hpp"
#include "riftcrawl/env.hpp"
#include "riftcrawl/logging.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace riftcrawl {

namespace {

constexpr std::array<std::string_view, 26> known_keys = {
    "seeds", "seed_ladders", "region", "window", "retention", "max_matches",
    "deadline", "max_attempts", "base_backoff", "max_backoff", "workers",
    "batch_size", "matches_per_player", "queue", "stale_after", "idle_poll",
    "max_storage_errors", "progress_every", "database", "dataset", "log_level",
    "requests_per_second", "requests_per_two_minutes", "api_key",
    "connect_timeout", "read_timeout",
};

constexpr std::array<std::string_view, 3> ladder_tiers = {
    "challenger", "grandmaster", "master",
};

std::expected<std::chrono::milliseconds, std::string> read_duration(
    const nlohmann::json& j, const std::string& key) {

    const auto& v = j[key];
    if (v.is_number_integer()) {
        return std::chrono::seconds(v.get<int64_t>());
    }
    if (v.is_string()) {
        if (auto d = parse_duration(v.get<std::string>())) return *d;
    }
    return std::unexpected("'" + key + "' must be a duration such as \"30s\" or \"7d\"");
}

template <typename Duration>
std::optional<std::string> apply_duration(const nlohmann::json& j, const std::string& key,
                                          Duration& out) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    auto d = read_duration(j, key);
    if (!d) return d.error();
    out = std::chrono::duration_cast<Duration>(*d);
    return std::nullopt;
}

std::optional<std::string> apply_int(const nlohmann::json& j, const std::string& key,
                                     int& out, int min_value) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_integer()) return "'" + key + "' must be an integer";
    int v = j[key].get<int>();
    if (v < min_value) {
        return "'" + key + "' must be >= " + std::to_string(min_value);
    }
    out = v;
    return std::nullopt;
}

std::optional<std::string> apply_string(const nlohmann::json& j, const std::string& key,
                                        std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) return "'" + key + "' must be a string";
    out = j[key].get<std::string>();
    return std::nullopt;
}

std::optional<std::string> apply_string_list(const nlohmann::json& j, const std::string& key,
                                             std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_array()) return "'" + key + "' must be an array of strings";
    out.clear();
    for (auto& item : j[key]) {
        if (!item.is_string()) return "'" + key + "' must be an array of strings";
        out.push_back(item.get<std::string>());
    }
    return std::nullopt;
}

} // namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string& text) {
    if (text.empty()) return std::nullopt;

    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0) return std::nullopt;

    int64_t value = 0;
    try {
        value = std::stoll(text.substr(0, digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    auto unit = text.substr(digits);
    using namespace std::chrono;
    if (unit.empty() || unit == "s") return duration_cast<milliseconds>(seconds(value));
    if (unit == "ms") return milliseconds(value);
    if (unit == "m") return duration_cast<milliseconds>(minutes(value));
    if (unit == "h") return duration_cast<milliseconds>(hours(value));
    if (unit == "d") return duration_cast<milliseconds>(hours(24 * value));
    return std::nullopt;
}

std::expected<CrawlConfig, std::string> config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::unexpected("configuration must be a JSON object");

    for (auto& [key, _] : j.items()) {
        if (std::ranges::find(known_keys, key) == known_keys.end()) {
            RIFTCRAWL_LOG_WARN("ignoring unknown configuration key '{}'", key);
        }
    }

    CrawlConfig cfg;
    std::optional<std::chrono::seconds> deadline;
    if (j.contains("deadline") && !j["deadline"].is_null()) {
        std::chrono::seconds d{0};
        if (auto err = apply_duration(j, "deadline", d)) return std::unexpected(*err);
        deadline = d;
    }
    cfg.deadline = deadline;

    std::optional<std::string> err;
    if ((err = apply_string_list(j, "seeds", cfg.seeds)) ||
        (err = apply_string_list(j, "seed_ladders", cfg.seed_ladders)) ||
        (err = apply_string(j, "region", cfg.region)) ||
        (err = apply_duration(j, "window", cfg.window)) ||
        (err = apply_duration(j, "retention", cfg.retention)) ||
        (err = apply_int(j, "max_matches", cfg.max_matches, 0)) ||
        (err = apply_int(j, "max_attempts", cfg.max_attempts, 1)) ||
        (err = apply_duration(j, "base_backoff", cfg.base_backoff)) ||
        (err = apply_duration(j, "max_backoff", cfg.max_backoff)) ||
        (err = apply_int(j, "workers", cfg.workers, 1)) ||
        (err = apply_int(j, "batch_size", cfg.batch_size, 1)) ||
        (err = apply_int(j, "matches_per_player", cfg.matches_per_player, 1)) ||
        (err = apply_int(j, "queue", cfg.queue, 0)) ||
        (err = apply_duration(j, "stale_after", cfg.stale_after)) ||
        (err = apply_duration(j, "idle_poll", cfg.idle_poll)) ||
        (err = apply_int(j, "max_storage_errors", cfg.max_storage_errors, 1)) ||
        (err = apply_int(j, "progress_every", cfg.progress_every, 1)) ||
        (err = apply_string(j, "database", cfg.database)) ||
        (err = apply_string(j, "dataset", cfg.dataset)) ||
        (err = apply_string(j, "log_level", cfg.log_level)) ||
        (err = apply_string(j, "api_key", cfg.client.api_key)) ||
        (err = apply_int(j, "requests_per_second", cfg.client.requests_per_second, 1)) ||
        (err = apply_int(j, "requests_per_two_minutes",
                         cfg.client.requests_per_two_minutes, 1)) ||
        (err = apply_duration(j, "connect_timeout", cfg.client.connect_timeout)) ||
        (err = apply_duration(j, "read_timeout", cfg.client.read_timeout))) {
        return std::unexpected(*err);
    }

    if (cfg.region.empty()) return std::unexpected("'region' must not be empty");
    if (cfg.stale_after.count() <= 0) return std::unexpected("'stale_after' must be positive");
    if (cfg.idle_poll.count() <= 0) return std::unexpected("'idle_poll' must be positive");
    if (cfg.max_backoff < cfg.base_backoff) {
        return std::unexpected("'max_backoff' must not be shorter than 'base_backoff'");
    }
    for (auto& tier : cfg.seed_ladders) {
        if (std::ranges::find(ladder_tiers, tier) == ladder_tiers.end()) {
            return std::unexpected("unknown ladder tier '" + tier + "'");
        }
    }

    cfg.client.region = cfg.region;
    return cfg;
}

std::optional<std::string> apply_env_overrides(CrawlConfig& cfg) {
    if (auto key = get_env("RIOT_API_KEY")) cfg.client.api_key = *key;
    if (auto region = get_env("RIFTCRAWL_REGION")) cfg.client.region = cfg.region = *region;
    if (auto db = get_env("RIFTCRAWL_DATABASE")) cfg.database = *db;
    if (auto out = get_env("RIFTCRAWL_DATASET")) cfg.dataset = *out;

    auto read_count = [](const char* name, int min_value, int& out) -> std::optional<std::string> {
        auto text = get_env(name);
        if (!text) return std::nullopt;
        int value = 0;
        try {
            size_t used = 0;
            value = std::stoi(*text, &used);
            if (used != text->size()) throw std::invalid_argument(name);
        } catch (const std::logic_error&) {
            return std::string(name) + " must be an integer";
        }
        if (value < min_value) return std::string(name) + " must be >= " + std::to_string(min_value);
        out = value;
        return std::nullopt;
    };

    std::optional<std::string> err;
    if ((err = read_count("RIFTCRAWL_WORKERS", 1, cfg.workers)) ||
        (err = read_count("RIFTCRAWL_MAX_MATCHES", 0, cfg.max_matches))) {
        return err;
    }
    return std::nullopt;
}

std::expected<CrawlConfig, std::string> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected("cannot open config file " + path.string());
    }

    try {
        return config_from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("invalid JSON in " + path.string() + ": " + e.what());
    }
}

} // namespace riftcrawl
