#pragma once
#include "multimcp/settings.hpp"

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace multimcp::log
{

/// Shared "multimcp" logger writing to stderr
std::shared_ptr<spdlog::logger> logger();

/// Apply level and pattern from settings
void configure(const Settings& settings);

/// Map a settings level name (INFO, WARN, ...) onto spdlog
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace multimcp::log
