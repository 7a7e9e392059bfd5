#pragma once
#include "multimcp/types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace multimcp
{

/// How a stdio command is launched, decided once when the config is loaded
enum class LauncherKind
{
    Generic,           ///< Opaque command, argv passed through
    DirectInterpreter, ///< python/node/...: script path + remaining args
    PackageRunner      ///< npx/uvx/...: fetch and run an ecosystem package
};

inline std::string to_string(LauncherKind kind)
{
    switch (kind)
    {
    case LauncherKind::Generic:
        return "generic";
    case LauncherKind::DirectInterpreter:
        return "direct-interpreter";
    case LauncherKind::PackageRunner:
        return "package-runner";
    }
    return "generic";
}

/// Classify a command by its basename against the known launcher table
LauncherKind classify_launcher(const std::string& command);

/// Flag a package runner uses to skip its install confirmation ("" if none)
std::string package_runner_confirm_flag(const std::string& command);

/// Declared configuration of one server, immutable once loaded
struct ServerConfig
{
    std::string type;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;

    // websocket URL synthesis
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> path;
    bool secure{false};

    std::map<std::string, std::string> headers;
    /// Opaque cookie data forwarded as a Cookie header
    std::optional<std::string> cookies;

    /// Text a launched server prints once it accepts requests
    std::optional<std::string> ready_marker;
    std::chrono::milliseconds ready_timeout{10000};

    /// Remaining transport options (timeouts, ping intervals)
    Json options = Json::object();

    LauncherKind launcher{LauncherKind::Generic};

    /// The declared JSON object, used for fingerprinting
    Json raw = Json::object();

    bool is_stdio() const
    {
        return type == "stdio";
    }

    bool is_launchable() const
    {
        return is_stdio() && command.has_value() && !command->empty();
    }

    /// @throws ConfigError when a known field has the wrong JSON type
    static ServerConfig from_json(const Json& j);
};

inline void from_json(const Json& j, ServerConfig& c)
{
    c = ServerConfig::from_json(j);
}

inline void to_json(Json& j, const ServerConfig& c)
{
    j = c.raw;
}

/// Name -> configuration map, compatible with the desktop assistant
/// `{"mcpServers": {...}}` file format
class ConfigStore
{
  public:
    ConfigStore() = default;

    static ConfigStore from_json(const Json& j);
    static ConfigStore load_file(const std::filesystem::path& path);
    static ConfigStore load_default();
    static std::filesystem::path default_config_path();

    std::vector<std::string> list_servers() const;

    /// nullptr when the name is unknown
    const ServerConfig* get(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return servers_.count(name) > 0;
    }

    void add_server(const std::string& name, ServerConfig config);

    size_t size() const
    {
        return servers_.size();
    }

  private:
    std::map<std::string, ServerConfig> servers_;
};

} // namespace multimcp
