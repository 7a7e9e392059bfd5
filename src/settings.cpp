#include "multimcp/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace multimcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_bool(const std::string& v, bool defv)
{
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no")
        return false;
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v)
        return defv;
    try
    {
        return std::chrono::milliseconds(std::stoll(v));
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

std::filesystem::path Settings::default_state_dir()
{
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    std::filesystem::path base = home ? std::filesystem::path(home)
                                      : std::filesystem::temp_directory_path();
    return base / ".mcp-client-multi-server";
}

std::filesystem::path Settings::registry_path() const
{
    auto dir = state_dir.empty() ? default_state_dir() : state_dir;
    return dir / "server_registry.json";
}

std::filesystem::path Settings::logs_path() const
{
    if (!log_dir.empty())
        return log_dir;
    auto dir = state_dir.empty() ? default_state_dir() : state_dir;
    return dir / "logs";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MULTIMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.auto_launch = parse_bool(getenv_str("MULTIMCP_AUTO_LAUNCH", ""), s.auto_launch);
    s.state_dir = getenv_str("MULTIMCP_STATE_DIR", "");
    if (s.state_dir.empty())
        s.state_dir = default_state_dir();
    s.log_dir = getenv_str("MULTIMCP_LOG_DIR", "");
    s.launch_grace = getenv_ms("MULTIMCP_LAUNCH_GRACE_MS", s.launch_grace);
    s.stop_timeout = getenv_ms("MULTIMCP_STOP_TIMEOUT_MS", s.stop_timeout);
    s.request_timeout = getenv_ms("MULTIMCP_REQUEST_TIMEOUT_MS", s.request_timeout);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.state_dir = default_state_dir();
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("auto_launch"))
        s.auto_launch = j.at("auto_launch").get<bool>();
    if (j.contains("state_dir"))
        s.state_dir = j.at("state_dir").get<std::string>();
    if (j.contains("log_dir"))
        s.log_dir = j.at("log_dir").get<std::string>();
    if (j.contains("launch_grace_ms"))
        s.launch_grace = std::chrono::milliseconds(j.at("launch_grace_ms").get<long long>());
    if (j.contains("stop_timeout_ms"))
        s.stop_timeout = std::chrono::milliseconds(j.at("stop_timeout_ms").get<long long>());
    if (j.contains("stop_poll_interval_ms"))
        s.stop_poll_interval =
            std::chrono::milliseconds(j.at("stop_poll_interval_ms").get<long long>());
    if (j.contains("request_timeout_ms"))
        s.request_timeout = std::chrono::milliseconds(j.at("request_timeout_ms").get<long long>());
    return s;
}

} // namespace multimcp
