/// @file tests/process/launcher.cpp
/// @brief ProcessLauncher against the echo server

#include "multimcp/exceptions.hpp"
#include "multimcp/process_launcher.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

using namespace multimcp;
using multimcp_test::echo_config;
using multimcp_test::TempDir;
using multimcp_test::test_settings;
using multimcp_test::wait_for;

static void stop(LaunchedServer& server)
{
    server.process->terminate();
    assert(wait_for([&] { return !server.process->is_alive(); }));
    server.process->close_logs();
}

static void test_launch_echo()
{
    std::cout << "Test: launch echo server...\n";
    TempDir dir("launcher_echo");
    ProcessLauncher launcher(test_settings(dir.path()));

    auto server = launcher.launch("echo", echo_config());
    assert(server.process);
    assert(server.process->pid() > 0);
    assert(server.process->is_alive());

    auto logs = dir.path() / "logs";
    assert(server.process->stdout_log().parent_path() == logs);
    const std::string out_name = server.process->stdout_log().filename().string();
    const std::string err_name = server.process->stderr_log().filename().string();
    assert(out_name.rfind("echo_", 0) == 0);
    assert(out_name.find("_stdout.log") != std::string::npos);
    assert(err_name.find("_stderr.log") != std::string::npos);
    assert(std::filesystem::exists(server.process->stdout_log()));
    assert(std::filesystem::exists(server.process->stderr_log()));

    stop(server);
    std::cout << "  [PASS] launched, logs created\n";
}

static void test_not_launchable()
{
    std::cout << "Test: non-stdio config is rejected...\n";
    TempDir dir("launcher_reject");
    ProcessLauncher launcher(test_settings(dir.path()));
    bool threw = false;
    try
    {
        launcher.launch("remote", ServerConfig::from_json(Json{{"url", "http://h/sse"}}));
    }
    catch (const LaunchFailedError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("not launchable") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] LaunchFailedError\n";
}

static void test_startup_exit()
{
    std::cout << "Test: non-zero exit during startup...\n";
    TempDir dir("launcher_exit");
    ProcessLauncher launcher(test_settings(dir.path()));
    bool threw = false;
    try
    {
        launcher.launch("broken", echo_config({"--exit-code", "3"}));
    }
    catch (const LaunchFailedError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("exited with code 3") != std::string::npos);
        assert(e.stderr_tail.find("exiting with code 3") != std::string::npos);
        assert(e.stderr_log.find("broken_") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] exit code and stderr tail reported\n";
}

static void test_clean_exit()
{
    std::cout << "Test: exit 0 during startup is treated as started...\n";
    TempDir dir("launcher_clean");
    ProcessLauncher launcher(test_settings(dir.path()));
    auto server = launcher.launch("daemonizing", echo_config({"--exit-code", "0"}));
    assert(server.process);
    assert(!server.process->is_alive());
    server.process->close_logs();
    std::cout << "  [PASS] no error\n";
}

static void test_missing_command()
{
    std::cout << "Test: missing executable...\n";
    TempDir dir("launcher_missing");
    ProcessLauncher launcher(test_settings(dir.path()));
    bool threw = false;
    try
    {
        launcher.launch("ghost", ServerConfig::from_json(Json{
                                     {"type", "stdio"}, {"command", "/no/such/mcp-server"}}));
    }
    catch (const LaunchFailedError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("Failed to launch server ghost") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] LaunchFailedError\n";
}

static void test_ready_marker()
{
    std::cout << "Test: readiness marker...\n";
    TempDir dir("launcher_ready");
    ProcessLauncher launcher(test_settings(dir.path()));

    auto start = std::chrono::steady_clock::now();
    auto server = launcher.launch(
        "slow", echo_config({"--ready-after", "400"}, Json{{"readyMarker", "echo server ready"}}));
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed >= std::chrono::milliseconds(400));
    assert(server.process->is_alive());
    assert(ProcessLauncher::tail_lines(server.process->stderr_log()).find("echo server ready") !=
           std::string::npos);
    stop(server);

    bool threw = false;
    try
    {
        launcher.launch("silent", echo_config({}, Json{{"readyMarker", "never printed"},
                                                       {"readyTimeoutMs", 300}}));
    }
    catch (const LaunchFailedError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("did not become ready") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS] marker awaited, timeout reported\n";
}

static void test_log_name_collision()
{
    std::cout << "Test: launches in the same second get distinct logs...\n";
    TempDir dir("launcher_collide");
    ProcessLauncher launcher(test_settings(dir.path()));
    auto first = launcher.launch("twin", echo_config());
    auto second = launcher.launch("twin", echo_config());
    assert(first.process->stdout_log() != second.process->stdout_log());
    assert(first.process->stderr_log() != second.process->stderr_log());
    stop(first);
    stop(second);
    std::cout << "  [PASS] unique log names\n";
}

static void test_helpers()
{
    std::cout << "Test: tail and timestamp helpers...\n";
    TempDir dir("launcher_tail");
    auto file = dir.path() / "t.log";
    {
        std::ofstream out(file);
        for (int i = 1; i <= 15; ++i)
            out << "line " << i << "\n";
    }
    auto tail = ProcessLauncher::tail_lines(file, 3);
    assert(tail == "line 13\nline 14\nline 15\n");
    assert(ProcessLauncher::tail_lines(dir.path() / "missing.log").empty());

    auto stamp = ProcessLauncher::timestamp(std::chrono::system_clock::now());
    assert(stamp.size() == 15); // YYYYMMDD-HHMMSS
    assert(stamp[8] == '-');
    std::cout << "  [PASS] helpers\n";
}

int main()
{
    test_launch_echo();
    test_not_launchable();
    test_startup_exit();
    test_clean_exit();
    test_missing_command();
    test_ready_marker();
    test_log_name_collision();
    test_helpers();
    std::cout << "\nAll launcher tests passed!\n";
    return 0;
}
