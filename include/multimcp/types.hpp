#pragma once
#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace multimcp
{

using Json = nlohmann::json;

/// Outcome of a launch or stop request. Bulk operations collect these per
/// server instead of aborting on the first failure.
struct LaunchOutcome
{
    bool ok{false};
    std::string detail;

    explicit operator bool() const
    {
        return ok;
    }
};

using StopOutcome = LaunchOutcome;

/// Liveness as seen by the orchestrator
struct RunState
{
    bool running{false};
    std::optional<int> pid;
};

/// Log file locations of the most recent launch of a server
struct ServerLogs
{
    std::optional<std::string> stdout_log;
    std::optional<std::string> stderr_log;
};

inline void to_json(Json& j, const ServerLogs& logs)
{
    j = Json{{"stdout", logs.stdout_log ? Json(*logs.stdout_log) : Json(nullptr)},
             {"stderr", logs.stderr_log ? Json(*logs.stderr_log) : Json(nullptr)}};
}

} // namespace multimcp
