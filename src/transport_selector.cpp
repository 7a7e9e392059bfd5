#include "multimcp/transport_selector.hpp"

#include "multimcp/exceptions.hpp"

#include <algorithm>

namespace multimcp
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

/// Path component of a URL without query or fragment
std::string url_path(const std::string& url)
{
    auto scheme_pos = url.find("://");
    size_t host_start = scheme_pos == std::string::npos ? 0 : scheme_pos + 3;
    auto path_pos = url.find('/', host_start);
    if (path_pos == std::string::npos)
        return "/";
    auto end = url.find_first_of("?#", path_pos);
    return url.substr(path_pos, end == std::string::npos ? std::string::npos : end - path_pos);
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_confirm_flag(const std::string& arg)
{
    return arg == "-y" || arg == "--yes";
}

std::map<std::string, std::string> http_headers(const ServerConfig& config)
{
    auto headers = config.headers;
    if (config.cookies && !config.cookies->empty())
        headers["Cookie"] = *config.cookies;
    return headers;
}

TransportDescriptor select_network(const std::string& name, const ServerConfig& config)
{
    const std::string& url = *config.url;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw UnsupportedConfigError(name, "url has no scheme: " + url);

    std::string scheme = lower(url.substr(0, scheme_pos));
    TransportDescriptor d;
    d.url = url;

    if (scheme == "ws" || scheme == "wss")
    {
        d.kind = TransportKind::WebSocket;
        return d;
    }
    if (scheme != "http" && scheme != "https")
        throw UnsupportedConfigError(name, "unsupported url scheme '" + scheme + "'");

    d.headers = http_headers(config);
    std::string path = url_path(url);

    if (config.type == "sse")
        d.kind = TransportKind::Sse;
    else if (config.type == "streamable-http" || path.find("/stream") != std::string::npos)
        d.kind = TransportKind::StreamableHttp;
    else if (ends_with(path, "/sse") || ends_with(path, "/sse/"))
        d.kind = TransportKind::Sse;
    else
        d.kind = TransportKind::StreamableHttp;
    return d;
}

TransportDescriptor synthesize_websocket(const std::string& name, const ServerConfig& config)
{
    if (!config.port)
        throw UnsupportedConfigError(name, "websocket server needs either 'url' or 'port'");

    std::string path = config.path.value_or("/");
    if (path.empty() || path[0] != '/')
        path.insert(path.begin(), '/');

    TransportDescriptor d;
    d.kind = TransportKind::WebSocket;
    d.url = std::string(config.secure ? "wss" : "ws") + "://" + config.host.value_or("localhost") +
            ":" + std::to_string(*config.port) + path;
    return d;
}

TransportDescriptor select_stdio(const std::string& name, const ServerConfig& config)
{
    TransportDescriptor d;
    d.kind = TransportKind::Stdio;
    d.command = *config.command;
    d.env = config.env;
    d.launcher = config.launcher;

    switch (config.launcher)
    {
    case LauncherKind::DirectInterpreter:
        if (!config.args.empty())
        {
            d.script = config.args.front();
            d.args.assign(config.args.begin() + 1, config.args.end());
        }
        break;

    case LauncherKind::PackageRunner:
    {
        // runner [flags...] package [args...]; the confirm flag is dropped here
        // and re-added in the runner's own spelling by argv()
        auto it = config.args.begin();
        for (; it != config.args.end(); ++it)
        {
            if (is_confirm_flag(*it))
                continue;
            if (!it->empty() && (*it)[0] == '-')
            {
                d.runner_flags.push_back(*it);
                continue;
            }
            break;
        }
        if (it == config.args.end())
            throw UnsupportedConfigError(name, "package runner '" + d.command +
                                                   "' has no package to run");
        d.package = *it;
        d.args.assign(it + 1, config.args.end());
        d.confirm_flag = package_runner_confirm_flag(d.command);
        break;
    }

    case LauncherKind::Generic:
        d.args = config.args;
        break;
    }
    return d;
}
} // namespace

std::string to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::Stdio:
        return "stdio";
    case TransportKind::WebSocket:
        return "websocket";
    case TransportKind::Sse:
        return "sse";
    case TransportKind::StreamableHttp:
        return "streamable-http";
    }
    return "stdio";
}

std::vector<std::string> TransportDescriptor::argv() const
{
    std::vector<std::string> out;
    if (kind != TransportKind::Stdio)
        return out;

    out.push_back(command);
    if (script)
        out.push_back(*script);
    if (package)
    {
        if (!confirm_flag.empty())
            out.push_back(confirm_flag);
        out.insert(out.end(), runner_flags.begin(), runner_flags.end());
        out.push_back(*package);
    }
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

TransportDescriptor select_transport(const std::string& name, const ServerConfig& config)
{
    if (config.url && !config.url->empty())
        return select_network(name, config);

    if (config.type == "websocket")
        return synthesize_websocket(name, config);

    if (config.type == "stdio")
    {
        if (!config.command || config.command->empty())
            throw UnsupportedConfigError(name, "stdio server has no 'command'");
        return select_stdio(name, config);
    }

    throw UnsupportedConfigError(name, config.type.empty()
                                           ? "no 'type' and no 'url'"
                                           : "unknown server type '" + config.type + "'");
}

} // namespace multimcp
