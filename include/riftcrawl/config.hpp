#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace riftcrawl {

struct ClientConfig {
    std::string api_key;
    std::string region = "euw1";
    int requests_per_second = 20;
    int requests_per_two_minutes = 100;
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
};

struct CrawlConfig {
    std::vector<std::string> seeds;
    std::vector<std::string> seed_ladders;
    std::string region = "euw1";
    std::chrono::seconds window{std::chrono::hours(24 * 7)};
    std::chrono::seconds retention{std::chrono::hours(24 * 730)};
    int max_matches = 0; // 0 = no ceiling
    std::optional<std::chrono::seconds> deadline;
    int max_attempts = 5;
    std::chrono::milliseconds base_backoff{2000};
    std::chrono::milliseconds max_backoff{std::chrono::minutes(5)};
    int workers = 4;
    int batch_size = 8;
    int matches_per_player = 20;
    int queue = 420; // ranked solo
    std::chrono::seconds stale_after{std::chrono::minutes(10)};
    std::chrono::milliseconds idle_poll{250};
    int max_storage_errors = 5;
    int progress_every = 25;
    std::string database = "data/riftcrawl.db";
    std::string dataset = "data/features.csv";
    std::string log_level = "info";
    ClientConfig client;
};

// Accepts "500ms", "30s", "15m", "6h", "7d" or a bare integer (seconds).
std::optional<std::chrono::milliseconds> parse_duration(const std::string& text);

std::expected<CrawlConfig, std::string> config_from_json(const nlohmann::json& j);

// RIOT_API_KEY, RIFTCRAWL_REGION, RIFTCRAWL_DATABASE, RIFTCRAWL_DATASET,
// RIFTCRAWL_WORKERS and RIFTCRAWL_MAX_MATCHES win over the file; returns an
// error message for a malformed number.
std::optional<std::string> apply_env_overrides(CrawlConfig& cfg);

std::expected<CrawlConfig, std::string> load_config(const std::filesystem::path& path);

} // namespace riftcrawl
