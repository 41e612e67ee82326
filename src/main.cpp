#include "riftcrawl/collector.hpp"
#include "riftcrawl/config.hpp"
#include "riftcrawl/display.hpp"
#include "riftcrawl/env.hpp"
#include "riftcrawl/feature_builder.hpp"
#include "riftcrawl/logging.hpp"
#include "riftcrawl/rate_limiter.hpp"
#include "riftcrawl/riot_client.hpp"
#include "riftcrawl/sqlite_repository.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>

namespace {

constexpr const char* kDefaultConfig = "riftcrawl.json";

std::atomic<bool> g_signalled{false};

void on_signal(int) {
    g_signalled = true;
}

struct CliArgs {
    std::string command;
    std::optional<std::string> config;
    std::optional<std::string> db;
    std::optional<std::string> out;
    std::optional<int> max_matches;
    std::optional<int> workers;
    std::string kind = "match";
};

void print_usage() {
    std::cerr << R"(Usage: riftcrawl <command> [options]
Commands:
  crawl          Crawl players and matches into the database
  build          Write the feature dataset from stored matches
  status         Show frontier and match counts
  reset-failed   Return failed entries to pending
Options:
  --config <file>         JSON config (default: riftcrawl.json if present)
  --db <file>             SQLite database (overrides config)
  --max-matches <n>       Stored-match ceiling, 0 = none (crawl)
  --workers <n>           Concurrent fetch workers (crawl)
  --out <file>            Dataset path (build)
  --kind <match|player>   Entries to reset (reset-failed, default: match)
Environment:
  RIOT_API_KEY            API key, also read from .env
  RIFTCRAWL_LOG_LEVEL     debug|info|warn|error
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[i + 1];

        try {
            if (flag == "--config") args.config = val;
            else if (flag == "--db") args.db = val;
            else if (flag == "--out") args.out = val;
            else if (flag == "--max-matches") args.max_matches = std::stoi(val);
            else if (flag == "--workers") args.workers = std::stoi(val);
            else if (flag == "--kind") args.kind = val;
            else {
                std::cerr << "Unknown option: " << flag << "\n";
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid number for " << flag << ": " << val << "\n";
            return std::nullopt;
        }
    }

    return args;
}

std::optional<riftcrawl::CrawlConfig> resolve_config(const CliArgs& args) {
    riftcrawl::CrawlConfig config;
    auto path = args.config.value_or(kDefaultConfig);
    if (args.config || std::filesystem::exists(path)) {
        auto loaded = riftcrawl::load_config(path);
        if (!loaded) {
            std::cerr << "Config error: " << loaded.error() << "\n";
            return std::nullopt;
        }
        config = std::move(*loaded);
    }

    if (auto err = riftcrawl::apply_env_overrides(config)) {
        std::cerr << "Environment error: " << *err << "\n";
        return std::nullopt;
    }

    if (args.db) config.database = *args.db;
    if (args.out) config.dataset = *args.out;
    if (args.max_matches) config.max_matches = *args.max_matches;
    if (args.workers) config.workers = *args.workers;
    if (config.max_matches < 0 || config.workers < 1) {
        std::cerr << "--max-matches must be >= 0 and --workers >= 1\n";
        return std::nullopt;
    }
    return config;
}

int run_crawl(const riftcrawl::CrawlConfig& config, riftcrawl::Repository& repo) {
    if (config.client.api_key.empty()) {
        std::cerr << "RIOT_API_KEY is not set (environment or .env)\n";
        return 1;
    }
    if (config.seeds.empty() && config.seed_ladders.empty()) {
        std::cerr << "Warning: no seeds or seed_ladders configured; "
                     "resuming from the stored frontier only\n";
    }

    riftcrawl::RateLimiter limiter(config.client.requests_per_second,
                                   config.client.requests_per_two_minutes);
    riftcrawl::RiotClient client(config.client, limiter);
    riftcrawl::Collector collector(repo, client, config);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished) {
            if (g_signalled) {
                collector.request_stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto summary = collector.run(riftcrawl::display_progress);
    finished = true;
    watcher.join();
    std::cerr << "\n";

    riftcrawl::print_element(riftcrawl::render_summary(summary), std::cout);

    switch (summary.stop_reason) {
        case riftcrawl::StopReason::StorageFailure:
        case riftcrawl::StopReason::ClientRejected:
            return 2;
        default:
            return 0;
    }
}

int run_build(const riftcrawl::CrawlConfig& config, riftcrawl::Repository& repo) {
    riftcrawl::FeatureBuilder builder(repo);
    auto report = builder.write_dataset(config.dataset);
    if (!report) {
        std::cerr << "Build failed: " << report.error() << "\n";
        return 1;
    }
    riftcrawl::print_element(riftcrawl::render_build_report(*report), std::cout);
    return 0;
}

int run_status(riftcrawl::Repository& repo) {
    auto stats = repo.frontier_stats();
    auto count = repo.match_count();
    auto failed = repo.failed_entries();
    riftcrawl::print_element(riftcrawl::render_status(stats, count, failed), std::cout);
    return 0;
}

int run_reset_failed(const CliArgs& args, riftcrawl::Repository& repo) {
    auto kind = riftcrawl::parse_entity_kind(args.kind);
    if (!kind) {
        std::cerr << "Unknown kind: " << args.kind << " (expected match or player)\n";
        return 1;
    }
    int reset = repo.reset_failed(*kind);
    std::cout << "Reset " << reset << " failed " << args.kind << " entries to pending\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    static const std::unordered_set<std::string> commands{"crawl", "build", "status",
                                                          "reset-failed"};
    if (!commands.contains(args->command)) {
        std::cerr << "Unknown command: " << args->command << "\n";
        print_usage();
        return 1;
    }

    riftcrawl::load_env();
    auto config = resolve_config(*args);
    if (!config) return 1;
    riftcrawl::init_logging(config->log_level);

    try {
        if (auto parent = std::filesystem::path(config->database).parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        riftcrawl::SqliteRepository repo(config->database);

        if (args->command == "crawl") return run_crawl(*config, repo);
        if (args->command == "build") return run_build(*config, repo);
        if (args->command == "status") return run_status(repo);
        return run_reset_failed(*args, repo);
    } catch (const riftcrawl::StorageError& e) {
        std::cerr << "Storage error: " << e.what() << "\n";
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
