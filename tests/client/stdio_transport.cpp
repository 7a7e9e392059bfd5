/// @file tests/client/stdio_transport.cpp
/// @brief Protocol client over a real stdio server

#include "multimcp/client/client.hpp"
#include "multimcp/server_manager.hpp"
#include "multimcp/transport_selector.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace multimcp;
using multimcp_test::echo_config;
using multimcp_test::echo_server_path;
using multimcp_test::TempDir;
using multimcp_test::test_settings;

static void test_client_session()
{
    std::cout << "Test: handshake, list and call over stdio...\n";
    client::Client c(std::make_unique<client::StdioTransport>(echo_server_path()));
    {
        client::Session session(c);
        assert(c.is_initialized());
        assert(c.server_info()->serverInfo.name == "echo");
        assert(c.server_info()->capabilities.tools.has_value());

        auto tools = c.list_tools();
        assert(tools.size() == 3);
        assert(tools[1].name == "process_message");
        assert(tools[1].description && *tools[1].description == "Echo a message back");

        auto result = c.call_tool("process_message", Json{{"message", "hi"}});
        assert(!result.isError);
        assert(result.text() == "ECHO: hi");

        auto j = client::result_to_json(result);
        assert(j["content"][0]["text"] == "ECHO: hi");
        assert(c.call("ping", Json::object()).is_object());
    }
    assert(!c.is_initialized());
    std::cout << "  [PASS] session round trip\n";
}

static void test_reconnect_after_close()
{
    std::cout << "Test: a closed client starts a new session...\n";
    client::Client c(std::make_unique<client::StdioTransport>(echo_server_path()));
    for (int i = 0; i < 3; ++i)
    {
        client::Session session(c);
        assert(c.call_tool("ping", Json::object()).text() == "pong");
    }
    std::cout << "  [PASS] three sessions\n";
}

static void test_tool_error()
{
    std::cout << "Test: JSON-RPC error becomes TransportError...\n";
    client::Client c(std::make_unique<client::StdioTransport>(echo_server_path()));
    client::Session session(c);
    bool threw = false;
    try
    {
        c.call_tool("fail", Json{{"reason", "ENOENT: no such file or directory, open '/x'"}});
    }
    catch (const TransportError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("ENOENT") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] error surfaced\n";
}

static void test_missing_executable()
{
    std::cout << "Test: missing executable...\n";
    client::StdioTransport tx("/no/such/stdio-server");
    bool threw = false;
    try
    {
        tx.request("initialize", Json::object());
    }
    catch (const TransportError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("Failed to start stdio server") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] TransportError\n";
}

static void test_factory_session_log()
{
    std::cout << "Test: factory builds a stdio client with a session log...\n";
    TempDir dir("stdio_factory");
    auto descriptor = select_transport("echo", echo_config());
    descriptor.session_log = dir.path() / "echo_session.log";

    auto c = client::make_client(descriptor);
    assert(c);
    {
        client::Session session(*c);
        assert(c->call_tool("ping", Json::object()).text() == "pong");
    }
    assert(std::filesystem::exists(dir.path() / "echo_session.log"));
    std::cout << "  [PASS] session log created\n";
}

static void test_manager_query_end_to_end()
{
    std::cout << "Test: manager query against the echo server...\n";
    TempDir dir("stdio_manager");
    ConfigStore store;
    store.add_server("echo", echo_config());
    {
        ServerManager manager(store, test_settings(dir.path()));
        auto result = manager.query("echo", "process_message", Json::object(), "hello");
        assert(result.text() == "ECHO: hello");

        // The launched server stays up between queries
        auto state = manager.is_running("echo");
        assert(state.running);
        auto again = manager.query("echo", "ping");
        assert(again.text() == "pong");
        assert(manager.is_running("echo").pid == state.pid);

        auto tools = manager.list_server_tools("echo");
        assert(tools.size() == 3);

        bool threw = false;
        try
        {
            manager.query("echo", "fail", Json{{"reason", "Access denied - path outside allowed "
                                                          "directories: /etc"}});
        }
        catch (const QueryError& e)
        {
            threw = true;
            assert(std::string(e.what()).rfind("Access denied", 0) == 0);
            assert(e.raw_message.find("/etc") != std::string::npos);
        }
        assert(threw);

        manager.close(true);
        assert(!manager.is_running("echo").running);
    }
    std::cout << "  [PASS] query, tools, shutdown\n";
}

static long long elapsed_ms(std::chrono::steady_clock::time_point since)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

static void test_call_timeout_aborts()
{
    std::cout << "Test: a slow tool call is aborted at its deadline...\n";
    client::Client c(std::make_unique<client::StdioTransport>(
        echo_server_path(), std::vector<std::string>{"--reply-delay", "1500"}));
    {
        client::Session session(c);
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try
        {
            c.call_tool("ping", Json::object(), std::chrono::milliseconds(200));
        }
        catch (const TransportError& e)
        {
            threw = true;
            assert(std::string(e.what()).find("timed out") != std::string::npos);
        }
        assert(threw);
        assert(elapsed_ms(start) < 1200);
        assert(!c.is_initialized());
    }

    // The next session starts a fresh server process
    {
        client::Session session(c);
        auto result = c.call_tool("ping", Json::object(), std::chrono::milliseconds(5000));
        assert(result.text() == "pong");
    }
    std::cout << "  [PASS] aborted, then recovered\n";
}

static void test_manager_request_timeout()
{
    std::cout << "Test: request_timeout bounds manager queries...\n";
    TempDir dir("stdio_timeout");
    auto settings = test_settings(dir.path());
    settings.request_timeout = std::chrono::milliseconds(500);
    ConfigStore store;
    store.add_server("slow", echo_config({"--reply-delay", "5000"}));

    ServerManager manager(store, settings);
    auto start = std::chrono::steady_clock::now();
    bool threw = false;
    try
    {
        manager.query("slow", "process_message", Json::object(), "late");
    }
    catch (const QueryError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("timed out") != std::string::npos);
    }
    assert(threw);
    assert(elapsed_ms(start) < 3000);
    manager.close(true);
    std::cout << "  [PASS] QueryError within " << elapsed_ms(start) << " ms\n";
}

int main()
{
    test_client_session();
    test_reconnect_after_close();
    test_tool_error();
    test_missing_executable();
    test_factory_session_log();
    test_manager_query_end_to_end();
    test_call_timeout_aborts();
    test_manager_request_timeout();
    std::cout << "\nAll stdio transport tests passed!\n";
    return 0;
}
