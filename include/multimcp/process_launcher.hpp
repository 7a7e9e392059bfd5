#pragma once
#include "multimcp/config.hpp"
#include "multimcp/settings.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace multimcp
{

/// Handle to a server process started by this orchestrator instance.
///
/// Owns the process's stdin pipe and the parent's copies of the log files.
/// Destroying the handle does not kill a detached server; a server that
/// reads its stdin sees EOF instead.
class ServerProcess
{
  public:
    struct Impl;

    explicit ServerProcess(std::unique_ptr<Impl> impl);
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    int pid() const;
    const std::filesystem::path& stdout_log() const;
    const std::filesystem::path& stderr_log() const;

    bool is_alive();

    /// Exit code if the process has finished (reaps it)
    std::optional<int> exit_code();

    /// Graceful termination request (SIGTERM / TerminateProcess)
    void terminate();
    void kill();

    /// Release the parent's log handles and the stdin pipe
    void close_logs();

  private:
    std::unique_ptr<Impl> impl_;
};

/// A freshly started server
struct LaunchedServer
{
    std::unique_ptr<ServerProcess> process;
    std::chrono::system_clock::time_point start_time;
};

/// Starts stdio servers as detached background processes with their output
/// captured in timestamped log files
class ProcessLauncher
{
  public:
    explicit ProcessLauncher(Settings settings);

    /// @throws LaunchFailedError when the config is not launchable, the
    ///         process cannot be spawned, or it exits with an error during
    ///         startup
    LaunchedServer launch(const std::string& name, const ServerConfig& config) const;

    /// Last `count` lines of a text file ("" if it cannot be read)
    static std::string tail_lines(const std::filesystem::path& file, size_t count = 10);

    /// Local time, YYYYMMDD-HHMMSS unless another strftime format is given
    static std::string timestamp(std::chrono::system_clock::time_point when,
                                 const char* format = "%Y%m%d-%H%M%S");

  private:
    std::pair<std::filesystem::path, std::filesystem::path>
    log_paths(const std::string& name, std::chrono::system_clock::time_point when) const;

    Settings settings_;
};

} // namespace multimcp
