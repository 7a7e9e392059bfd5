#include "internal/process.hpp"
#include "multimcp/registry.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

using namespace multimcp;
using multimcp_test::TempDir;

static RegistryEntry make_entry(const std::string& name, int pid)
{
    RegistryEntry e;
    e.server_name = name;
    e.pid = pid;
    e.start_time = "2024-01-01T00:00:00";
    e.config_hash = "abc";
    e.log_dir = "/tmp/logs";
    e.stdout_log = "/tmp/logs/" + name + "_stdout.log";
    e.stderr_log = "/tmp/logs/" + name + "_stderr.log";
    return e;
}

/// Pid of a child that has already exited and been reaped
static int finished_pid()
{
    process::Process p;
    process::ProcessOptions opts;
    opts.redirect_stdin = false;
    opts.redirect_stdout = false;
#ifdef _WIN32
    p.spawn("cmd.exe", {"/c", "exit 0"}, opts);
#else
    p.spawn("sh", {"-c", "exit 0"}, opts);
#endif
    int pid = p.pid();
    p.wait();
    return pid;
}

int main()
{
    TempDir dir("registry");
    auto file = dir.path() / "server_registry.json";

    std::cout << "Test: put/get/remove...\n";
    {
        Registry registry(file);
        assert(registry.entries().empty());
        assert(!registry.get("a"));

        registry.put(make_entry("a", 101));
        registry.put(make_entry("b", 202));
        auto a = registry.get("a");
        assert(a && a->pid == 101);
        assert(a->stderr_log == "/tmp/logs/a_stderr.log");
        assert(registry.entries().size() == 2);

        registry.put(make_entry("a", 303));
        assert(registry.get("a")->pid == 303);

        registry.remove("a");
        assert(!registry.get("a"));
        assert(registry.get("b"));
        registry.remove("not-there");
        assert(registry.entries().size() == 1);

        // No temp file left behind
        assert(!std::filesystem::exists(file.string() + ".tmp"));
        std::cout << "  [PASS] entries stored\n";
    }

    std::cout << "Test: file format is name -> entry...\n";
    {
        std::ifstream in(file);
        Json j;
        in >> j;
        assert(j.is_object());
        assert(j.contains("b"));
        assert(j["b"]["pid"] == 202);
        assert(j["b"]["server_name"] == "b");
        assert(j["b"].contains("config_hash"));
        std::cout << "  [PASS] JSON layout\n";
    }

    std::cout << "Test: probe keeps live entries and drops dead ones...\n";
    {
        Registry registry(file);
        registry.put(make_entry("self", static_cast<int>(getpid())));
        auto alive = registry.probe("self");
        assert(alive && *alive == static_cast<int>(getpid()));
        assert(registry.get("self"));

        registry.put(make_entry("ghost", finished_pid()));
        assert(!registry.probe("ghost"));
        assert(!registry.get("ghost")); // self-healed

        assert(!registry.probe("unknown"));
        std::cout << "  [PASS] probe\n";
    }

    std::cout << "Test: a reused pid is not the recorded server...\n";
    {
        Registry registry(file);
        const int self = static_cast<int>(getpid());
        const std::string token = process::start_token(self);
#if defined(__linux__) || defined(_WIN32)
        assert(!token.empty());
        assert(process::start_token(self) == token);
#endif
        assert(process::start_token(finished_pid()).empty());

        auto same = make_entry("same", self);
        same.process_token = token;
        registry.put(same);
        assert(registry.probe("same") == self);
        assert(registry.get("same")->process_token == token);

        auto legacy = make_entry("legacy", self);
        assert(legacy.process_token.empty());
        assert(Registry::is_alive(legacy));

        if (!token.empty())
        {
            auto reused = make_entry("reused", self);
            reused.process_token = token + "0";
            registry.put(reused);
            assert(!Registry::is_alive(reused));
            assert(!registry.probe("reused"));
            assert(!registry.get("reused"));
        }
        registry.remove("same");
        std::cout << "  [PASS] start token checked\n";
    }

    std::cout << "Test: corrupt file reads as empty and is replaced on write...\n";
    {
        TempDir other("registry_corrupt");
        auto bad = other.path() / "server_registry.json";
        {
            std::ofstream out(bad);
            out << "{ this is not json";
        }
        Registry registry(bad);
        assert(registry.entries().empty());
        registry.put(make_entry("x", 1));
        assert(registry.entries().size() == 1);
        std::cout << "  [PASS] corrupt registry tolerated\n";
    }

    std::cout << "Test: concurrent writers do not lose entries...\n";
    {
        TempDir other("registry_concurrent");
        auto shared = other.path() / "server_registry.json";
        Registry common(shared);
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back(
                [&, i]
                {
                    // Half share an object, half use their own
                    if (i % 2 == 0)
                    {
                        common.put(make_entry("s" + std::to_string(i), 1000 + i));
                    }
                    else
                    {
                        Registry own(shared);
                        own.put(make_entry("s" + std::to_string(i), 1000 + i));
                    }
                });
        }
        for (auto& t : threads)
            t.join();
        auto all = Registry(shared).entries();
        assert(all.size() == 8);
        for (int i = 0; i < 8; ++i)
            assert(all.at("s" + std::to_string(i)).pid == 1000 + i);
        std::cout << "  [PASS] 8 concurrent puts\n";
    }

    std::cout << "Test: config fingerprint...\n";
    {
        auto a = ServerConfig::from_json(
            Json::parse(R"({"type":"stdio","command":"srv","args":["x"]})"));
        auto reordered = ServerConfig::from_json(
            Json::parse(R"({"args":["x"],"command":"srv","type":"stdio"})"));
        auto changed = ServerConfig::from_json(
            Json::parse(R"({"type":"stdio","command":"srv","args":["y"]})"));

        auto fa = fingerprint(a);
        assert(fa.size() == 64);
        assert(fa == fingerprint(a));
        assert(fa == fingerprint(reordered));
        assert(fa != fingerprint(changed));
        std::cout << "  [PASS] fingerprint stable\n";
    }

    std::cout << "\nAll registry tests passed!\n";
    return 0;
}
