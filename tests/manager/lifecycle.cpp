/// @file tests/manager/lifecycle.cpp
/// @brief Launch, adopt, stop and relaunch through ServerManager

#include "internal/process.hpp"
#include "multimcp/server_manager.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace multimcp;
using multimcp_test::echo_config;
using multimcp_test::TempDir;
using multimcp_test::test_settings;
using multimcp_test::wait_for;

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

static ConfigStore echo_store(const ServerConfig& config = echo_config())
{
    ConfigStore store;
    store.add_server("echo", config);
    store.add_server("remote", ServerConfig::from_json(Json{{"url", "http://127.0.0.1:9/sse"}}));
    return store;
}

static void test_launch_and_stop()
{
    std::cout << "Test: launch, relaunch, stop...\n";
    TempDir dir("lifecycle_basic");
    auto settings = test_settings(dir.path());
    ServerManager manager(echo_store(), settings);

    auto first = manager.launch_server("echo");
    assert(first.ok);
    assert(contains(first.detail, "Launched server echo"));

    auto state = manager.is_running("echo");
    assert(state.running && state.pid);

    Registry registry(settings.registry_path());
    auto entry = registry.get("echo");
    assert(entry && entry->pid == *state.pid);
    assert(entry->config_hash == fingerprint(echo_config()));
    assert(!entry->start_time.empty());
    assert(contains(entry->stderr_log, "_stderr.log"));

    // Idempotent while alive
    auto second = manager.launch_server("echo");
    assert(second.ok);
    assert(contains(second.detail, "already running"));
    assert(manager.is_running("echo").pid == state.pid);

    auto stopped = manager.stop_server("echo");
    assert(stopped.ok);
    assert(!process::pid_alive(*state.pid));
    assert(!manager.is_running("echo").running);
    assert(!registry.get("echo"));

    auto again = manager.stop_server("echo");
    assert(!again.ok);
    assert(contains(again.detail, "is not running"));
    std::cout << "  [PASS] lifecycle\n";
}

static void test_launch_rejections()
{
    std::cout << "Test: launch of unknown, remote and crashing servers...\n";
    TempDir dir("lifecycle_reject");
    auto store = echo_store();
    store.add_server("broken", echo_config({"--exit-code", "3"}));
    ServerManager manager(store, test_settings(dir.path()));

    auto unknown = manager.launch_server("nobody");
    assert(!unknown.ok);
    assert(contains(unknown.detail, "No configuration found"));

    auto remote = manager.launch_server("remote");
    assert(!remote.ok);
    assert(contains(remote.detail, "not launchable"));

    auto broken = manager.launch_server("broken");
    assert(!broken.ok);
    assert(contains(broken.detail, "exited with code 3"));
    assert(contains(broken.detail, "Last lines of stderr"));
    assert(contains(broken.detail, "exiting with code 3"));
    assert(contains(broken.detail, "See log file"));
    assert(!manager.is_running("broken").running);
    std::cout << "  [PASS] failures reported as outcomes\n";
}

static void test_adopt_across_instances()
{
    std::cout << "Test: second instance adopts a running server...\n";
    TempDir dir("lifecycle_adopt");
    auto settings = test_settings(dir.path());
    ServerManager first(echo_store(), settings);
    auto launched = first.launch_server("echo");
    assert(launched.ok);
    int pid = *first.is_running("echo").pid;

    {
        ServerManager second(echo_store(), settings);
        auto state = second.is_running("echo");
        assert(state.running && *state.pid == pid);

        auto adopt = second.launch_server("echo");
        assert(adopt.ok);
        assert(contains(adopt.detail, "already running"));
        assert(contains(adopt.detail, std::to_string(pid)));
        assert(second.is_local_pipe_server("echo"));

        auto stopped = second.stop_server("echo");
        assert(stopped.ok);
    }

    assert(!process::pid_alive(pid));
    assert(!first.is_running("echo").running);
    std::cout << "  [PASS] adopted and stopped by pid\n";
}

static void test_config_drift_relaunches()
{
    std::cout << "Test: changed configuration replaces the running server...\n";
    TempDir dir("lifecycle_drift");
    auto settings = test_settings(dir.path());

    ServerManager old_manager(echo_store(), settings);
    assert(old_manager.launch_server("echo").ok);
    int old_pid = *old_manager.is_running("echo").pid;

    auto changed = echo_config({"--label", "v2"});
    ServerManager new_manager(echo_store(changed), settings);
    auto relaunched = new_manager.launch_server("echo");
    assert(relaunched.ok);
    assert(contains(relaunched.detail, "Launched server echo"));

    int new_pid = *new_manager.is_running("echo").pid;
    assert(new_pid != old_pid);
    assert(!process::pid_alive(old_pid));
    assert(Registry(settings.registry_path()).get("echo")->config_hash == fingerprint(changed));

    assert(new_manager.stop_server("echo").ok);
    std::cout << "  [PASS] drift detected\n";
}

static void test_dead_server_detected_on_connect()
{
    std::cout << "Test: connect notices a server that died...\n";
    TempDir dir("lifecycle_dead");
    auto settings = test_settings(dir.path());
    ServerManager manager(echo_store(), settings);
    assert(manager.launch_server("echo").ok);
    int pid = *manager.is_running("echo").pid;

    process::kill_pid(pid);
    assert(wait_for([&] { return !process::pid_alive(pid); }));

    bool threw = false;
    try
    {
        manager.connect("echo", false);
    }
    catch (const ConnectionError& e)
    {
        threw = true;
        assert(contains(e.what(), "no longer running"));
    }
    assert(threw);
    assert(!Registry(settings.registry_path()).get("echo"));

    // With launching allowed the server comes back
    auto client = manager.connect("echo", true);
    assert(client);
    auto state = manager.is_running("echo");
    assert(state.running && *state.pid != pid);
    manager.close(true);
    assert(!manager.is_running("echo").running);
    std::cout << "  [PASS] relaunch on demand\n";
}

static void test_server_logs()
{
    std::cout << "Test: log locations...\n";
    TempDir dir("lifecycle_logs");
    ServerManager manager(echo_store(), test_settings(dir.path()));

    auto none = manager.get_server_logs("echo");
    assert(!none.stdout_log && !none.stderr_log);

    assert(manager.launch_server("echo").ok);
    auto live = manager.get_server_logs("echo");
    assert(live.stdout_log && live.stderr_log);
    assert(std::filesystem::exists(*live.stderr_log));

    assert(manager.stop_server("echo").ok);
    // Still found on disk after the server is gone
    auto after = manager.get_server_logs("echo");
    assert(after.stdout_log && *after.stdout_log == *live.stdout_log);
    assert(after.stderr_log && *after.stderr_log == *live.stderr_log);

    Json j = after;
    assert(j["stderr"] == *live.stderr_log);
    std::cout << "  [PASS] logs located\n";
}

static void test_force_kill()
{
    std::cout << "Test: server ignoring SIGTERM is killed after the timeout...\n";
#ifdef _WIN32
    std::cout << "  [SKIP] POSIX signals only\n";
#else
    TempDir dir("lifecycle_kill");
    auto settings = test_settings(dir.path());
    settings.stop_timeout = std::chrono::milliseconds(500);
    ServerManager manager(echo_store(echo_config({"--ignore-sigterm"})), settings);
    assert(manager.launch_server("echo").ok);
    int pid = *manager.is_running("echo").pid;

    auto start = std::chrono::steady_clock::now();
    auto stopped = manager.stop_server("echo");
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(stopped.ok);
    assert(elapsed >= std::chrono::milliseconds(500));
    assert(!process::pid_alive(pid));
    std::cout << "  [PASS] escalated to kill\n";
#endif
}

int main()
{
    test_launch_and_stop();
    test_launch_rejections();
    test_adopt_across_instances();
    test_config_drift_relaunches();
    test_dead_server_detected_on_connect();
    test_server_logs();
    test_force_kill();
    std::cout << "\nAll lifecycle tests passed!\n";
    return 0;
}
