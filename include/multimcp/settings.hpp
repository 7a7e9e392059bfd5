#pragma once
#include "multimcp/types.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace multimcp
{

struct Settings
{
    std::string log_level{"INFO"};
    bool auto_launch{true};

    /// Per-user state directory holding the registry and the log directory
    std::filesystem::path state_dir;
    /// Empty means <state_dir>/logs
    std::filesystem::path log_dir;

    std::chrono::milliseconds launch_grace{1000};
    std::chrono::milliseconds stop_timeout{5000};
    std::chrono::milliseconds stop_poll_interval{500};
    /// Deadline for protocol calls; zero disables it
    std::chrono::milliseconds request_timeout{60000};

    std::filesystem::path registry_path() const;
    std::filesystem::path logs_path() const;

    static std::filesystem::path default_state_dir();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace multimcp
