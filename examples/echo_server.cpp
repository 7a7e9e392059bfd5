// Minimal MCP stdio server used by the multimcp tests and as a config example.
//
// Tools:
//   ping             -> "pong"
//   process_message  -> "ECHO: <message>"
//   fail             -> JSON-RPC error carrying "reason"
//
// Flags (for lifecycle tests):
//   --exit-code <n>        write a line to stderr and exit immediately
//   --ready-after <ms>     print "echo server ready" to stderr after a delay
//   --ignore-sigterm       survive SIGTERM (POSIX)
//   --reply-delay <ms>     hold every tools/call answer back

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using Json = nlohmann::json;

namespace
{

Json text_result(const std::string& text)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                {"isError", false}};
}

Json tool_list()
{
    return Json::array(
        {Json{{"name", "ping"},
              {"description", "Check that the server answers"},
              {"inputSchema", Json{{"type", "object"}, {"properties", Json::object()}}}},
         Json{{"name", "process_message"},
              {"description", "Echo a message back"},
              {"inputSchema",
               Json{{"type", "object"},
                    {"properties", Json{{"message", Json{{"type", "string"}}}}},
                    {"required", Json::array({"message"})}}}},
         Json{{"name", "fail"},
              {"description", "Fail with the given reason"},
              {"inputSchema",
               Json{{"type", "object"},
                    {"properties", Json{{"reason", Json{{"type", "string"}}}}}}}}});
}

Json handle(const Json& request)
{
    const std::string method = request.value("method", std::string());
    const Json params = request.value("params", Json::object());
    Json response{{"jsonrpc", "2.0"}, {"id", request["id"]}};

    if (method == "initialize")
    {
        response["result"] = Json{{"protocolVersion", "2024-11-05"},
                                  {"capabilities", Json{{"tools", Json::object()}}},
                                  {"serverInfo", Json{{"name", "echo"}, {"version", "1.0.0"}}}};
    }
    else if (method == "ping")
    {
        response["result"] = Json::object();
    }
    else if (method == "tools/list")
    {
        response["result"] = Json{{"tools", tool_list()}};
    }
    else if (method == "tools/call")
    {
        const std::string name = params.value("name", std::string());
        const Json args = params.value("arguments", Json::object());
        if (name == "ping")
            response["result"] = text_result("pong");
        else if (name == "process_message")
            response["result"] = text_result("ECHO: " + args.value("message", std::string()));
        else if (name == "fail")
            response["error"] = Json{{"code", -32000},
                                     {"message", args.value("reason", std::string("failed"))}};
        else
            response["error"] = Json{{"code", -32602}, {"message", "Unknown tool: " + name}};
    }
    else
    {
        response["error"] = Json{{"code", -32601}, {"message", "Method not found: " + method}};
    }
    return response;
}

} // namespace

int main(int argc, char** argv)
{
    int reply_delay_ms = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--exit-code" && i + 1 < argc)
        {
            int code = std::atoi(argv[++i]);
            std::cerr << "echo server: exiting with code " << code << " on request" << std::endl;
            return code;
        }
        if (arg == "--ready-after" && i + 1 < argc)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::atoi(argv[++i])));
            std::cerr << "echo server ready" << std::endl;
        }
        if (arg == "--reply-delay" && i + 1 < argc)
            reply_delay_ms = std::atoi(argv[++i]);
#ifndef _WIN32
        if (arg == "--ignore-sigterm")
            std::signal(SIGTERM, SIG_IGN);
#endif
    }

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        Json request = Json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object())
            continue;
        // Notifications and replies to our (nonexistent) requests carry no method+id pair
        if (!request.contains("id") || !request.contains("method"))
            continue;
        if (reply_delay_ms > 0 && request.value("method", std::string()) == "tools/call")
            std::this_thread::sleep_for(std::chrono::milliseconds(reply_delay_ms));
        std::cout << handle(request).dump() << std::endl;
    }
    return 0;
}
