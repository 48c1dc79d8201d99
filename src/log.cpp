#include "minimcp/log.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace minimcp::log
{

namespace
{
std::shared_ptr<spdlog::logger>& instance()
{
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}
} // namespace

spdlog::level::level_enum parse_level(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")
        return spdlog::level::trace;
    if (upper == "DEBUG")
        return spdlog::level::debug;
    if (upper == "WARN" || upper == "WARNING")
        return spdlog::level::warn;
    if (upper == "ERROR")
        return spdlog::level::err;
    if (upper == "CRITICAL")
        return spdlog::level::critical;
    if (upper == "OFF")
        return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_logger(const Settings& settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (settings.log_file)
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*settings.log_file));

    // Not registered with spdlog's global registry, so repeated calls never clash on the name
    auto logger = std::make_shared<spdlog::logger>("minimcp", sinks.begin(), sinks.end());
    logger->set_level(parse_level(settings.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::err);
    return logger;
}

std::shared_ptr<spdlog::logger> logger()
{
    auto& logger = instance();
    if (!logger)
        logger = make_logger(Settings::from_env());
    return logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    instance() = std::move(logger);
}

} // namespace minimcp::log
