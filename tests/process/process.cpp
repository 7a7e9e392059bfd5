/// @file tests/process/process.cpp
/// @brief Process layer: pipes, log redirection, detached children, pid control

#include "internal/process.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace multimcp::process;
using multimcp_test::TempDir;
using multimcp_test::wait_for;

static std::string read_file(const std::filesystem::path& p)
{
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main()
{
#ifdef _WIN32
    std::cout << "POSIX shell based tests skipped on Windows\n";
    return 0;
#else
    std::cout << "Test: pipes round-trip a line...\n";
    {
        Process p;
        p.spawn("sh", {"-c", "read line; echo got:$line"});
        p.stdin_pipe().write("hello\n");
        p.stdin_pipe().flush();
        std::string line = p.stdout_pipe().read_line();
        assert(line.find("got:hello") != std::string::npos);
        assert(p.wait() == 0);
        assert(!p.is_running());
        std::cout << "  [PASS] stdin/stdout pipes\n";
    }

    std::cout << "Test: exit code reported...\n";
    {
        Process p;
        ProcessOptions opts;
        opts.redirect_stdin = false;
        opts.redirect_stdout = false;
        p.spawn("sh", {"-c", "exit 7"}, opts);
        assert(p.wait() == 7);
        auto code = p.try_wait();
        assert(code && *code == 7);
        std::cout << "  [PASS] exit code 7\n";
    }

    std::cout << "Test: missing executable throws...\n";
    {
        Process p;
        bool threw = false;
        try
        {
            p.spawn("/definitely/not/a/real/binary", {});
        }
        catch (const ProcessError& e)
        {
            threw = true;
            assert(std::string(e.what()).find("Failed to execute") != std::string::npos);
        }
        assert(threw);
        std::cout << "  [PASS] ProcessError on exec failure\n";
    }

    std::cout << "Test: output redirected to log files...\n";
    {
        TempDir dir("process_logs");
        OutputFile out;
        OutputFile err;
        out.open(dir.path() / "out.log");
        err.open(dir.path() / "err.log");
        assert(out.is_open() && err.is_open());

        Process p;
        ProcessOptions opts;
        opts.redirect_stdin = false;
        opts.stdout_file = &out;
        opts.stderr_file = &err;
        p.spawn("sh", {"-c", "echo to-out; echo to-err 1>&2"}, opts);
        assert(p.wait() == 0);
        out.close();
        err.close();
        assert(!out.is_open());

        assert(read_file(dir.path() / "out.log").find("to-out") != std::string::npos);
        assert(read_file(dir.path() / "err.log").find("to-err") != std::string::npos);
        std::cout << "  [PASS] stdout/stderr files\n";
    }

    std::cout << "Test: detached child outlives its handle...\n";
    {
        int pid = 0;
        {
            Process p;
            ProcessOptions opts;
            opts.redirect_stdin = false;
            opts.redirect_stdout = false;
            opts.detach = true;
            p.spawn("sleep", {"30"}, opts);
            pid = p.pid();
            assert(pid > 0);
        }
        assert(pid_alive(pid));

        terminate_pid(pid);
        assert(wait_for([&] { return !pid_alive(pid); }));
        std::cout << "  [PASS] detached child survives, terminate_pid stops it\n";
    }

    std::cout << "Test: attached child is stopped with its handle...\n";
    {
        int pid = 0;
        {
            Process p;
            ProcessOptions opts;
            opts.redirect_stdin = false;
            opts.redirect_stdout = false;
            p.spawn("sleep", {"30"}, opts);
            pid = p.pid();
        }
        assert(!pid_alive(pid));
        std::cout << "  [PASS] handle destructor stops child\n";
    }

    std::cout << "Test: kill_pid on a child ignoring SIGTERM...\n";
    {
        Process p;
        ProcessOptions opts;
        opts.redirect_stdin = false;
        opts.redirect_stdout = false;
        opts.detach = true;
        p.spawn("sh", {"-c", "trap '' TERM; exec sleep 30"}, opts);
        int pid = p.pid();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        terminate_pid(pid);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        assert(pid_alive(pid));

        kill_pid(pid);
        assert(wait_for([&] { return !pid_alive(pid); }));
        assert(!p.is_running());
        std::cout << "  [PASS] kill_pid\n";
    }

    std::cout << "Test: pid helpers on invalid pids...\n";
    {
        assert(!pid_alive(0));
        assert(!pid_alive(-5));
        terminate_pid(0);
        assert(std::string(DetachPolicy::describe()).size() > 0);
        std::cout << "  [PASS] helpers\n";
    }

    std::cout << "\nAll process tests passed!\n";
    return 0;
#endif
}
