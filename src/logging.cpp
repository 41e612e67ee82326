#include "riftcrawl/logging.hpp"
#include "riftcrawl/env.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace riftcrawl {

namespace {

constexpr const char* logger_name = "riftcrawl";
constexpr const char* default_pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] %v";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> active_logger;

std::shared_ptr<spdlog::logger> make_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    log->set_pattern(default_pattern);
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

void init_logging(const std::string& level, const std::string& pattern) {
    std::lock_guard lock(logger_mutex);
    if (!active_logger) active_logger = make_logger();

    auto resolved = get_env("RIFTCRAWL_LOG_LEVEL").value_or(level);
    active_logger->set_level(spdlog::level::from_str(resolved));
    active_logger->set_pattern(pattern.empty() ? default_pattern : pattern);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex);
    if (!active_logger) active_logger = make_logger();
    return active_logger;
}

} // namespace riftcrawl
