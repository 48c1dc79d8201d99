#pragma once
#include "minimcp/settings.hpp"

#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace minimcp::log
{

/// Map a level name (TRACE, DEBUG, INFO, WARN/WARNING, ERROR, CRITICAL, OFF;
/// any case) to its spdlog level. Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

/// Build a logger writing to stderr, and also to `settings.log_file` when set.
/// stdout is reserved for protocol traffic.
std::shared_ptr<spdlog::logger> make_logger(const Settings& settings);

/// Process logger, created from Settings::from_env() on first use.
std::shared_ptr<spdlog::logger> logger();

void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace minimcp::log
