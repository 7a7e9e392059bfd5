// Cross-platform process management for multimcp launchers and the stdio transport

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace multimcp::process
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Read a line (up to newline or max_size)
    std::string read_line(size_t max_size = 1 << 20);

    /// Check if data is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    bool has_data(int timeout_ms = 0);

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void flush();

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Append-mode file handle a child's output stream can be redirected to.
/// The parent keeps its copy open until close() so the log outlives a crash
/// of the child and can be released explicitly on stop.
class OutputFile
{
  public:
    OutputFile();
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;
    OutputFile(OutputFile&&) noexcept;
    OutputFile& operator=(OutputFile&&) noexcept;

    /// Create (or append to) the file at path
    void open(const std::filesystem::path& path);

    void close();

    bool is_open() const;

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
    std::filesystem::path path_;
};

/// Platform rules for starting a child outside the caller's process group,
/// so that terminal signals aimed at the orchestrator do not reach it.
/// One implementation per platform, selected at build time:
///   POSIX   - setsid() in the child (new session and process group)
///   Windows - CREATE_NEW_PROCESS_GROUP | DETACHED_PROCESS, no kill-on-close job
struct DetachPolicy
{
    static const char* describe();
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Added to (or overriding) the inherited environment
    std::map<std::string, std::string> environment;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;

    /// Send the child's stdout/stderr to a file instead of a pipe
    OutputFile* stdout_file = nullptr;
    OutputFile* stderr_file = nullptr;

    /// Start the child under DetachPolicy; it is not killed when the Process
    /// object is destroyed
    bool detach = false;

    /// On Windows: create the process without a console window
    bool create_no_window = true;
};

/// Cross-platform subprocess management
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    /// Get stdin pipe (only valid if redirect_stdin was true)
    WritePipe& stdin_pipe();

    /// Get stdout pipe (only valid if redirect_stdout was true)
    ReadPipe& stdout_pipe();

    /// Get stderr pipe (only valid if redirect_stderr was true)
    ReadPipe& stderr_pipe();

    /// Check if process is still running
    bool is_running() const;

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    int wait();

    /// Request graceful termination
    void terminate();

    /// Forcefully kill the process
    void kill();

    /// Get process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
    bool kill_on_destroy_ = true;
};

#ifdef _WIN32
/// Find an executable in the system PATH (PATHEXT aware)
std::optional<std::string> find_executable(const std::string& name);
#endif

/// Zero-effect existence probe for a pid that may not be our child.
/// Reaps the pid first if it is an exited child of this process.
bool pid_alive(int pid);

/// Identifies one incarnation of a pid: its start time where the platform
/// exposes it (/proc on Linux, creation time on Windows). Empty when unknown,
/// so a recycled pid can be told apart from the process that first held it.
std::string start_token(int pid);

/// Graceful termination request by pid (SIGTERM on POSIX)
void terminate_pid(int pid);

/// Forceful kill by pid
void kill_pid(int pid);

} // namespace multimcp::process
