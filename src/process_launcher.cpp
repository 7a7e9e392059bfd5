#include "multimcp/process_launcher.hpp"

#include "internal/process.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/transport_selector.hpp"

#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <tuple>

namespace multimcp
{

struct ServerProcess::Impl
{
    process::Process proc;
    process::OutputFile stdout_file;
    process::OutputFile stderr_file;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    int pid{0};
};

ServerProcess::ServerProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ServerProcess::~ServerProcess() = default;

int ServerProcess::pid() const
{
    return impl_->pid;
}

const std::filesystem::path& ServerProcess::stdout_log() const
{
    return impl_->stdout_path;
}

const std::filesystem::path& ServerProcess::stderr_log() const
{
    return impl_->stderr_path;
}

bool ServerProcess::is_alive()
{
    return impl_->proc.is_running();
}

std::optional<int> ServerProcess::exit_code()
{
    return impl_->proc.try_wait();
}

void ServerProcess::terminate()
{
    impl_->proc.terminate();
}

void ServerProcess::kill()
{
    impl_->proc.kill();
}

void ServerProcess::close_logs()
{
    impl_->stdout_file.close();
    impl_->stderr_file.close();
    try
    {
        impl_->proc.stdin_pipe().close();
    }
    catch (const process::ProcessError&)
    {
        // already closed
    }
}

namespace
{
bool file_contains(const std::filesystem::path& file, const std::string& needle)
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
        return false;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str().find(needle) != std::string::npos;
}

LaunchFailedError startup_failure(const std::string& message, const std::filesystem::path& log)
{
    return LaunchFailedError(message, ProcessLauncher::tail_lines(log), log.string());
}
} // namespace

ProcessLauncher::ProcessLauncher(Settings settings) : settings_(std::move(settings)) {}

std::string ProcessLauncher::timestamp(std::chrono::system_clock::time_point when,
                                       const char* format)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

std::string ProcessLauncher::tail_lines(const std::filesystem::path& file, size_t count)
{
    std::ifstream in(file);
    if (!in)
        return "";
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
        if (lines.size() > count)
            lines.pop_front();
    }
    std::string out;
    for (const auto& l : lines)
    {
        out += l;
        out += '\n';
    }
    return out;
}

std::pair<std::filesystem::path, std::filesystem::path>
ProcessLauncher::log_paths(const std::string& name,
                           std::chrono::system_clock::time_point when) const
{
    auto dir = settings_.logs_path();
    std::string stem = name + "_" + timestamp(when);
    std::string unique = stem;
    for (int n = 1;; ++n)
    {
        auto out = dir / (unique + "_stdout.log");
        auto err = dir / (unique + "_stderr.log");
        if (!std::filesystem::exists(out) && !std::filesystem::exists(err))
            return {out, err};
        unique = stem + "-" + std::to_string(n);
    }
}

LaunchedServer ProcessLauncher::launch(const std::string& name, const ServerConfig& config) const
{
    if (!config.is_launchable())
        throw LaunchFailedError("Server " + name +
                                " is not launchable (not a stdio server with a command)");

    std::vector<std::string> argv;
    try
    {
        argv = select_transport(name, config).argv();
    }
    catch (const UnsupportedConfigError& e)
    {
        throw LaunchFailedError(e.what());
    }

    std::error_code ec;
    std::filesystem::create_directories(settings_.logs_path(), ec);
    if (ec)
        throw LaunchFailedError("Cannot create log directory " + settings_.logs_path().string() +
                                ": " + ec.message());

    auto started = std::chrono::system_clock::now();
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    std::tie(stdout_path, stderr_path) = log_paths(name, started);

    auto impl = std::make_unique<ServerProcess::Impl>();
    impl->stdout_path = stdout_path;
    impl->stderr_path = stderr_path;

    process::ProcessOptions options;
    options.environment = config.env;
    options.redirect_stdin = true;
    options.stdout_file = &impl->stdout_file;
    options.stderr_file = &impl->stderr_file;
    options.detach = true;

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    log::logger()->info("Launching server {}: {} ({} args, {})", name, argv.front(), args.size(),
                        process::DetachPolicy::describe());
    try
    {
        impl->stdout_file.open(stdout_path);
        impl->stderr_file.open(stderr_path);
        impl->proc.spawn(argv.front(), args, options);
    }
    catch (const process::ProcessError& e)
    {
        // impl goes out of scope here and releases the log handles
        throw startup_failure("Failed to launch server " + name + ": " + e.what(), stderr_path);
    }
    impl->pid = impl->proc.pid();
    log::logger()->debug("Server {} started with pid {}, logs {} / {}", name, impl->pid,
                         stdout_path.string(), stderr_path.string());

    auto server = std::make_unique<ServerProcess>(std::move(impl));

    auto check_exit = [&](const char* phase) -> bool
    {
        auto code = server->exit_code();
        if (!code)
            return false;
        if (*code != 0)
        {
            server->close_logs();
            throw startup_failure("Server " + name + " exited with code " +
                                      std::to_string(*code) + " " + phase,
                                  stderr_path);
        }
        log::logger()->warn("Server {} exited with code 0 {}; possibly detached, treating as "
                            "started",
                            name, phase);
        return true;
    };

    const auto poll = std::chrono::milliseconds(100);
    const std::string marker = config.ready_marker.value_or("");

    if (!marker.empty())
    {
        const auto timeout = config.ready_timeout;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            if (file_contains(stdout_path, marker) || file_contains(stderr_path, marker))
            {
                log::logger()->debug("Server {} reported ready", name);
                break;
            }
            if (check_exit("before reporting ready"))
                break;
            if (std::chrono::steady_clock::now() >= deadline)
            {
                log::logger()->warn("Server {} did not print '{}' within {} ms, stopping it",
                                    name, marker, timeout.count());
                try
                {
                    server->kill();
                }
                catch (const process::ProcessError& e)
                {
                    log::logger()->warn("Failed to kill server {}: {}", name, e.what());
                }
                server->exit_code();
                server->close_logs();
                throw startup_failure("Server " + name + " did not become ready within " +
                                          std::to_string(timeout.count()) + " ms",
                                      stderr_path);
            }
            std::this_thread::sleep_for(poll);
        }
    }
    else
    {
        // Early exits are reported as soon as they happen, the last check
        // runs at the end of the grace period
        auto deadline = std::chrono::steady_clock::now() + settings_.launch_grace;
        bool exited = false;
        while (!exited && std::chrono::steady_clock::now() < deadline)
        {
            exited = check_exit("during startup");
            if (!exited)
                std::this_thread::sleep_for(poll);
        }
        if (!exited)
            check_exit("during startup");
    }

    log::logger()->info("Server {} launched (pid {})", name, server->pid());
    return LaunchedServer{std::move(server), started};
}

} // namespace multimcp
