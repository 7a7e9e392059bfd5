#include "multimcp/argument_adapter.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/process_launcher.hpp"
#include "multimcp/server_manager.hpp"
#include "multimcp/util/json.hpp"
#include "multimcp/version.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "multimcp " << multimcp::VERSION_MAJOR << "." << multimcp::VERSION_MINOR << "."
              << multimcp::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  multimcp [global options] <command> [command options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  list                               List configured servers and their status\n";
    std::cout << "  query   -s <server> [-t <tool>] [-m <message>] [-a <json>]\n";
    std::cout << "                                     Call a tool (default tool: process_message)\n";
    std::cout << "  tools   -s <server>                List the tools a server offers\n";
    std::cout << "  launch  -s <server>                Start a local server in the background\n";
    std::cout << "  stop    -s <server>                Stop a running server\n";
    std::cout << "  stop-all                           Stop every running server\n";
    std::cout << "  logs    -s <server>                Show the log files of a server\n";
    std::cout << "\n";
    std::cout << "Global options:\n";
    std::cout << "  -c, --config <path>                Config file (default: desktop assistant config)\n";
    std::cout << "  -v, --verbose                      Debug logging\n";
    std::cout << "  --no-auto-launch                   Never start servers on demand\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag,
                                                     const std::string& alias = {})
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag || (!alias.empty() && args[i] == alias))
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag,
                         const std::string& alias = {})
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag || (!alias.empty() && args[i] == alias))
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<std::string> require_server(std::vector<std::string>& args,
                                                 const std::string& command)
{
    auto server = consume_flag_value(args, "--server", "-s");
    if (!server)
        std::cerr << "Error: " << command << " requires --server <name>\n";
    return server;
}

static int list_servers(multimcp::ServerManager& manager)
{
    auto servers = manager.list_servers();
    if (servers.empty())
    {
        std::cout << "No MCP servers configured.\n";
        return 0;
    }

    std::cout << "Configured MCP servers:\n";
    for (const auto& name : servers)
    {
        auto config = manager.get_server_config(name);
        if (!config)
            continue;
        auto state = manager.is_running(name);
        std::string status;
        if (state.running)
            status = "Running (PID: " + std::to_string(state.pid.value_or(0)) + ")";
        else
            status = config->is_launchable() ? "Not running" : "N/A";

        std::cout << "  - " << name << " (Type: " << (config->type.empty() ? "unknown" : config->type)
                  << ", URL: " << config->url.value_or("N/A") << ", Status: " << status << ")\n";
    }
    return 0;
}

static int query_server(multimcp::ServerManager& manager, std::vector<std::string>& args)
{
    auto server = require_server(args, "query");
    if (!server)
        return 2;

    auto message = consume_flag_value(args, "--message", "-m");
    std::string tool = consume_flag_value(args, "--tool", "-t").value_or(multimcp::default_tool(*server));
    if (tool == "process_message")
        tool = multimcp::default_tool(*server);

    multimcp::Json tool_args = multimcp::Json::object();
    if (auto raw = consume_flag_value(args, "--args", "-a"))
    {
        auto parsed = multimcp::util::json::try_parse(*raw);
        if (!parsed || !parsed->is_object())
        {
            std::cerr << "Error: --args must be a JSON object\n";
            return 2;
        }
        tool_args = *parsed;
    }

    if (message)
    {
        std::cout << "Querying server '" << *server << "' with message: " << *message << "\n";
        auto first = message->find_first_not_of(" \t\r\n");
        if (first != std::string::npos && (*message)[first] == '{' &&
            !multimcp::util::json::try_parse(*message))
        {
            std::cerr << "Warning: message looks like JSON but does not parse; check its format\n";
            return 2;
        }
    }
    else
    {
        std::cout << "Querying server '" << *server << "' with tool: " << tool << "\n";
    }

    try
    {
        auto result = manager.query(*server, tool, tool_args, message);
        std::cout << "\nResponse:\n";
        bool printed = false;
        for (const auto& block : result.content)
        {
            if (auto* text = std::get_if<multimcp::client::TextContent>(&block))
            {
                std::cout << text->text << "\n";
                printed = true;
            }
        }
        if (!printed)
            std::cout << multimcp::client::result_to_json(result).dump(2) << "\n";
        return result.isError ? 1 : 0;
    }
    catch (const multimcp::ToolNotFoundError& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
    catch (const multimcp::LaunchFailedError& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        if (!e.stderr_tail.empty())
            std::cerr << "\nError details:\n" << e.stderr_tail;
        if (!e.stderr_log.empty())
            std::cerr << "Full log: " << e.stderr_log << "\n";
        return 1;
    }
}

static int list_tools(multimcp::ServerManager& manager, std::vector<std::string>& args)
{
    auto server = require_server(args, "tools");
    if (!server)
        return 2;

    std::cout << "Listing tools for server '" << *server << "'...\n";
    auto tools = manager.list_server_tools(*server);
    if (tools.empty())
    {
        std::cout << "No tools found on server '" << *server << "'.\n";
        return 0;
    }

    std::cout << "\nTools available on server '" << *server << "':\n";
    for (const auto& tool : tools)
    {
        std::cout << "  - " << tool.name << "\n";
        if (tool.description && !tool.description->empty())
            std::cout << "      Description: " << *tool.description << "\n";
        if (tool.inputSchema.contains("properties") && tool.inputSchema["properties"].is_object() &&
            !tool.inputSchema["properties"].empty())
        {
            std::string params;
            for (auto& [key, _] : tool.inputSchema["properties"].items())
                params += (params.empty() ? "" : ", ") + key;
            std::cout << "      Parameters: " << params << "\n";
        }
    }
    return 0;
}

static int launch_server(multimcp::ServerManager& manager, std::vector<std::string>& args)
{
    auto server = require_server(args, "launch");
    if (!server)
        return 2;

    std::cout << "Launching server '" << *server << "'...\n";
    auto outcome = manager.launch_server(*server);
    if (outcome)
    {
        std::cout << outcome.detail << "\n";
        std::cout << "Server '" << *server << "' will keep running in the background.\n";
        std::cout << "Stop it with: multimcp stop --server " << *server << "\n";
        std::cout << "Server logs are stored in: " << manager.settings().logs_path().string()
                  << "\n";
        return 0;
    }

    std::cerr << "Failed to launch server '" << *server << "'.\n";
    std::cerr << outcome.detail << "\n";
    std::cerr << "\nThis may be caused by missing dependencies or configuration issues.\n";
    std::cerr << "Full logs are available at: " << manager.settings().logs_path().string() << "\n";
    return 1;
}

static int stop_server(multimcp::ServerManager& manager, std::vector<std::string>& args)
{
    auto server = require_server(args, "stop");
    if (!server)
        return 2;

    std::cout << "Stopping server '" << *server << "'...\n";
    auto outcome = manager.stop_server(*server);
    if (outcome)
    {
        std::cout << "Server '" << *server << "' stopped successfully.\n";
        return 0;
    }
    std::cout << "Failed to stop server '" << *server << "': " << outcome.detail << "\n";
    return 1;
}

static int stop_all(multimcp::ServerManager& manager)
{
    std::cout << "Stopping all running servers...\n";
    auto results = manager.stop_all_servers();
    if (results.empty())
    {
        std::cout << "No servers were running.\n";
        return 0;
    }

    size_t stopped = 0;
    for (const auto& [name, ok] : results)
        if (ok)
            ++stopped;
    std::cout << "Stopped " << stopped << " of " << results.size() << " servers.\n";
    for (const auto& [name, ok] : results)
        std::cout << "  - '" << name << "': " << (ok ? "stopped successfully" : "failed to stop")
                  << "\n";
    return stopped == results.size() ? 0 : 1;
}

static int show_logs(multimcp::ServerManager& manager, std::vector<std::string>& args)
{
    auto server = require_server(args, "logs");
    if (!server)
        return 2;

    auto logs = manager.get_server_logs(*server);
    if (!logs.stdout_log && !logs.stderr_log)
    {
        std::cout << "No logs found for server '" << *server << "'.\n";
        return 1;
    }
    std::cout << "stdout: " << logs.stdout_log.value_or("-") << "\n";
    std::cout << "stderr: " << logs.stderr_log.value_or("-") << "\n";
    if (logs.stderr_log)
    {
        auto tail = multimcp::ProcessLauncher::tail_lines(*logs.stderr_log);
        if (!tail.empty())
            std::cout << "\nLast lines of stderr:\n" << tail;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (args.empty())
        return usage();
    if (consume_flag(args, "--help", "-h"))
        return usage(0);

    auto config_path = consume_flag_value(args, "--config", "-c");
    bool verbose = consume_flag(args, "--verbose", "-v");
    bool no_auto_launch = consume_flag(args, "--no-auto-launch");

    if (args.empty())
        return usage();
    std::string cmd = args.front();
    args.erase(args.begin());

    const bool known = cmd == "list" || cmd == "query" || cmd == "tools" || cmd == "launch" ||
                       cmd == "stop" || cmd == "stop-all" || cmd == "logs";
    if (!known)
    {
        std::cerr << "Unknown command: " << cmd << "\n";
        return usage();
    }

    auto settings = multimcp::Settings::from_env();
    if (verbose)
        settings.log_level = "DEBUG";
    if (no_auto_launch)
        settings.auto_launch = false;
    multimcp::log::configure(settings);

    multimcp::ConfigStore config;
    try
    {
        config = config_path ? multimcp::ConfigStore::load_file(*config_path)
                             : multimcp::ConfigStore::load_default();
    }
    catch (const multimcp::ConfigError& e)
    {
        std::cerr << "Failed to load config file: " << e.what() << "\n";
        return 1;
    }

    multimcp::ServerManager manager(std::move(config), settings);

    int rc = 1;
    try
    {
        if (cmd == "list")
            rc = list_servers(manager);
        else if (cmd == "query")
            rc = query_server(manager, args);
        else if (cmd == "tools")
            rc = list_tools(manager, args);
        else if (cmd == "launch")
            rc = launch_server(manager, args);
        else if (cmd == "stop")
            rc = stop_server(manager, args);
        else if (cmd == "stop-all")
            rc = stop_all(manager);
        else if (cmd == "logs")
            rc = show_logs(manager, args);
    }
    catch (const multimcp::Error& e)
    {
        std::cerr << "\nError: " << e.what() << "\n";
        rc = 1;
    }

    // Pipe-bound servers die with us unless the user manages them explicitly
    const bool keep_servers = cmd == "launch" || cmd == "stop" || cmd == "stop-all";
    if (!keep_servers)
    {
        auto stopped = manager.stop_local_pipe_servers();
        if (!stopped.empty())
        {
            std::cout << "Automatically stopped " << stopped.size() << " local stdio server(s):";
            for (const auto& [name, ok] : stopped)
                std::cout << " " << name << (ok ? "" : " (failed)");
            std::cout << "\n";
        }
    }
    manager.close(false);
    return rc;
}
