#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace riftcrawl {

// Installs the process-wide "riftcrawl" logger. RIFTCRAWL_LOG_LEVEL wins over
// `level`; an empty pattern keeps the default.
void init_logging(const std::string& level = "info", const std::string& pattern = "");

std::shared_ptr<spdlog::logger> logger();

} // namespace riftcrawl

#define RIFTCRAWL_LOG_DEBUG(...) ::riftcrawl::logger()->debug(__VA_ARGS__)
#define RIFTCRAWL_LOG_INFO(...) ::riftcrawl::logger()->info(__VA_ARGS__)
#define RIFTCRAWL_LOG_WARN(...) ::riftcrawl::logger()->warn(__VA_ARGS__)
#define RIFTCRAWL_LOG_ERROR(...) ::riftcrawl::logger()->error(__VA_ARGS__)
