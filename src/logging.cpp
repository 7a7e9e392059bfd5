#include "multimcp/logging.hpp"

#include <algorithm>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace multimcp::log
{

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = []
    {
        auto existing = spdlog::get("multimcp");
        if (existing)
            return existing;
        auto created = spdlog::stderr_color_mt("multimcp");
        created->set_pattern("%Y-%m-%d %H:%M:%S - multimcp - %l - %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

spdlog::level::level_enum parse_level(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
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

void configure(const Settings& settings)
{
    logger()->set_level(parse_level(settings.log_level));
}

} // namespace multimcp::log
