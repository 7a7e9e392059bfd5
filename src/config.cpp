#include "multimcp/config.hpp"

#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>

namespace multimcp
{

namespace
{
struct RunnerInfo
{
    const char* name;
    const char* confirm_flag;
};

constexpr RunnerInfo kPackageRunners[] = {
    {"npx", "-y"},
    {"bunx", ""},
    {"uvx", ""},
    {"pipx", ""},
};

constexpr const char* kInterpreters[] = {"python", "python3", "node", "deno", "bun"};

std::string command_basename(const std::string& command)
{
    std::string base = std::filesystem::path(command).filename().string();
    std::transform(base.begin(), base.end(), base.begin(), ::tolower);
    for (const char* ext : {".exe", ".cmd", ".bat"})
    {
        std::string suffix(ext);
        if (base.size() > suffix.size() &&
            base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0)
        {
            base.erase(base.size() - suffix.size());
            break;
        }
    }
    return base;
}

std::string to_env_string(const Json& v)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return "";
    return v.dump();
}

std::string cookie_header(const Json& v)
{
    if (v.is_string())
        return v.get<std::string>();
    std::string out;
    if (v.is_object())
    {
        for (auto& [key, value] : v.items())
        {
            if (!out.empty())
                out += "; ";
            out += key + "=" + to_env_string(value);
        }
    }
    return out;
}

const std::set<std::string> kKnownKeys = {
    "type", "command", "args",    "env",     "url",         "host",          "port",
    "path", "secure",  "headers", "cookies", "readyMarker", "readyTimeoutMs"};

std::optional<std::string> string_field(const Json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    if (!j[key].is_string())
        throw ConfigError(std::string("'") + key + "' must be a string");
    return j[key].get<std::string>();
}

const Json& object_field(const Json& j, const char* key)
{
    static const Json empty = Json::object();
    if (!j.contains(key) || j[key].is_null())
        return empty;
    if (!j[key].is_object())
        throw ConfigError(std::string("'") + key + "' must be a JSON object");
    return j[key];
}
} // namespace

LauncherKind classify_launcher(const std::string& command)
{
    auto base = command_basename(command);
    for (const auto& runner : kPackageRunners)
        if (base == runner.name)
            return LauncherKind::PackageRunner;
    for (const char* interp : kInterpreters)
        if (base == interp)
            return LauncherKind::DirectInterpreter;
    return LauncherKind::Generic;
}

std::string package_runner_confirm_flag(const std::string& command)
{
    auto base = command_basename(command);
    for (const auto& runner : kPackageRunners)
        if (base == runner.name)
            return runner.confirm_flag;
    return "";
}

ServerConfig ServerConfig::from_json(const Json& j)
{
    if (!j.is_object())
        throw ConfigError("server configuration must be a JSON object");

    ServerConfig c;
    c.raw = j;
    c.type = string_field(j, "type").value_or("");
    c.command = string_field(j, "command");
    if (j.contains("args"))
    {
        if (!j["args"].is_array())
            throw ConfigError("'args' must be an array");
        for (const auto& a : j["args"])
            c.args.push_back(to_env_string(a));
    }
    for (auto& [key, value] : object_field(j, "env").items())
        c.env[key] = to_env_string(value);
    c.url = string_field(j, "url");

    c.host = string_field(j, "host");
    if (j.contains("port"))
    {
        if (j["port"].is_number_integer())
            c.port = j["port"].get<int>();
        else if (j["port"].is_string())
        {
            try
            {
                c.port = std::stoi(j["port"].get<std::string>());
            }
            catch (const std::exception&)
            {
                throw ConfigError("'port' is not a number: " + j["port"].get<std::string>());
            }
        }
        else
            throw ConfigError("'port' must be a number");
    }
    c.path = string_field(j, "path");
    if (j.contains("secure"))
    {
        if (!j["secure"].is_boolean())
            throw ConfigError("'secure' must be true or false");
        c.secure = j["secure"].get<bool>();
    }

    for (auto& [key, value] : object_field(j, "headers").items())
        c.headers[key] = to_env_string(value);
    if (j.contains("cookies"))
    {
        auto cookie = cookie_header(j["cookies"]);
        if (!cookie.empty())
            c.cookies = cookie;
    }

    c.ready_marker = string_field(j, "readyMarker");
    if (j.contains("readyTimeoutMs"))
    {
        const auto& timeout = j["readyTimeoutMs"];
        if (!timeout.is_number_integer() || timeout.get<long long>() < 0)
            throw ConfigError("'readyTimeoutMs' must be a non-negative integer");
        c.ready_timeout = std::chrono::milliseconds(timeout.get<long long>());
    }

    for (auto& [key, value] : j.items())
        if (!kKnownKeys.count(key))
            c.options[key] = value;

    if (c.command)
        c.launcher = classify_launcher(*c.command);
    return c;
}

ConfigStore ConfigStore::from_json(const Json& j)
{
    ConfigStore store;
    if (!j.is_object())
        throw ConfigError("configuration root must be a JSON object");
    if (!j.contains("mcpServers"))
        return store;
    const auto& servers = j["mcpServers"];
    if (!servers.is_object())
        throw ConfigError("'mcpServers' must be a JSON object");
    for (auto& [name, value] : servers.items())
    {
        try
        {
            store.add_server(name, ServerConfig::from_json(value));
        }
        catch (const ConfigError& e)
        {
            throw ConfigError("server '" + name + "': " + e.what());
        }
    }
    return store;
}

ConfigStore ConfigStore::load_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        log::logger()->warn("Config file not found: {}", path.string());
        return ConfigStore{};
    }

    std::ifstream in(path);
    if (!in)
        throw ConfigError("Failed to open config file: " + path.string());

    Json j;
    try
    {
        in >> j;
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("Failed to parse config file " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

std::filesystem::path ConfigStore::default_config_path()
{
    namespace fs = std::filesystem;
#if defined(_WIN32)
    const char* appdata = std::getenv("APPDATA");
    return fs::path(appdata ? appdata : "") / "Claude" / "claude_desktop_config.json";
#elif defined(__APPLE__)
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : "") / "Library" / "Application Support" / "Claude" /
           "claude_desktop_config.json";
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"))
        return fs::path(xdg) / "Claude" / "claude_desktop_config.json";
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : "") / ".config" / "Claude" / "claude_desktop_config.json";
#endif
}

ConfigStore ConfigStore::load_default()
{
    auto path = default_config_path();
    if (!std::filesystem::exists(path))
    {
        log::logger()->warn("No config found at default location: {}", path.string());
        return ConfigStore{};
    }
    return load_file(path);
}

std::vector<std::string> ConfigStore::list_servers() const
{
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& [name, _] : servers_)
        names.push_back(name);
    return names;
}

const ServerConfig* ConfigStore::get(const std::string& name) const
{
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : &it->second;
}

void ConfigStore::add_server(const std::string& name, ServerConfig config)
{
    servers_[name] = std::move(config);
    log::logger()->debug("Registered server configuration: {}", name);
}

} // namespace multimcp
