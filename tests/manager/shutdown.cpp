/// @file tests/manager/shutdown.cpp
/// @brief Shutdown stops pipe-bound servers and leaves the others running

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

int main()
{
    TempDir dir("shutdown");
    auto settings = test_settings(dir.path());

    ConfigStore store;
    store.add_server("pipe-a", echo_config());
    store.add_server("pipe-b", echo_config({"--label", "b"}));
    // Reachable over a socket; its process happens to be started by us
    store.add_server("socket", ServerConfig::from_json(Json{{"type", "websocket"},
                                                            {"url", "ws://127.0.0.1:9/"}}));

    std::cout << "Test: classification per server...\n";
    ServerManager manager(store, settings);
    assert(manager.is_local_pipe_server("pipe-a"));
    assert(!manager.is_local_pipe_server("socket"));
    assert(!manager.is_local_pipe_server("unknown"));
    std::cout << "  [PASS]\n";

    std::cout << "Test: stop_local_pipe_servers...\n";
    {
        assert(manager.launch_server("pipe-a").ok);
        assert(manager.launch_server("pipe-b").ok);

        // A socket server process tracked by this instance
        ProcessLauncher launcher(settings);
        auto socket_process = launcher.launch("socket-process", echo_config());
        const int socket_pid = socket_process.process->pid();
        manager.track_process("socket", std::move(socket_process));
        assert(manager.is_running("socket").running);

        int pid_a = *manager.is_running("pipe-a").pid;
        int pid_b = *manager.is_running("pipe-b").pid;

        auto results = manager.stop_local_pipe_servers();
        assert(results.size() == 2);
        assert(results.at("pipe-a"));
        assert(results.at("pipe-b"));
        assert(results.count("socket") == 0);

        assert(!process::pid_alive(pid_a));
        assert(!process::pid_alive(pid_b));
        assert(process::pid_alive(socket_pid));
        assert(manager.is_running("socket").running);
        std::cout << "  [PASS] pipe servers stopped, socket server left running\n";

        std::cout << "Test: stop_all_servers covers the rest...\n";
        auto all = manager.stop_all_servers();
        assert(all.at("socket"));
        assert(wait_for([&] { return !process::pid_alive(socket_pid); }));
        std::cout << "  [PASS] everything stopped\n";
    }

    std::cout << "Test: stop_all_servers includes registry-only entries...\n";
    {
        ServerManager launcher_instance(store, settings);
        assert(launcher_instance.launch_server("pipe-a").ok);
        int pid = *launcher_instance.is_running("pipe-a").pid;

        ServerManager other(store, settings);
        auto all = other.stop_all_servers();
        assert(all.size() == 1);
        assert(all.at("pipe-a"));
        assert(!process::pid_alive(pid));
        assert(Registry(settings.registry_path()).entries().empty());
        std::cout << "  [PASS] registry entry stopped\n";
    }

    std::cout << "Test: close(true) stops pipe servers...\n";
    {
        ServerManager closing(store, settings);
        assert(closing.launch_server("pipe-b").ok);
        int pid = *closing.is_running("pipe-b").pid;
        closing.close(true);
        assert(!process::pid_alive(pid));
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: adopted pipe servers are stopped too...\n";
    {
        ServerManager owner(store, settings);
        assert(owner.launch_server("pipe-b").ok);
        int pid = *owner.is_running("pipe-b").pid;

        ServerManager adopter(store, settings);
        auto outcome = adopter.launch_server("pipe-b");
        assert(outcome.ok);
        assert(outcome.detail.find("already running") != std::string::npos);
        assert(adopter.is_local_pipe_server("pipe-b"));

        auto results = adopter.stop_local_pipe_servers();
        assert(results.size() == 1);
        assert(results.at("pipe-b"));
        assert(!process::pid_alive(pid));
        assert(!Registry(settings.registry_path()).get("pipe-b"));
        std::cout << "  [PASS] adopted server stopped by pid\n";
    }

    std::cout << "Test: destruction without close does not kill...\n";
    {
        int pid = 0;
        {
            ServerManager transient(store, settings);
            assert(transient.launch_server("pipe-a").ok);
            pid = *transient.is_running("pipe-a").pid;
        }
        // Not killed, but the echo server exits on its own once stdin closes
        assert(wait_for([&] { return !process::pid_alive(pid); }));

        ServerManager next(store, settings);
        assert(!next.is_running("pipe-a").running);
        assert(!Registry(settings.registry_path()).get("pipe-a"));
        std::cout << "  [PASS] stale entry cleaned up\n";
    }

    std::cout << "\nAll shutdown tests passed!\n";
    return 0;
}
