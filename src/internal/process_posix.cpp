// POSIX implementation of subprocess management

#ifndef _WIN32

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace multimcp::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Parent-side descriptors must not leak into later children: a leaked stdin
// write end would keep a sibling server from ever seeing EOF.
static void set_cloexec(int fd)
{
    if (fd >= 0)
        fcntl(fd, F_SETFD, FD_CLOEXEC);
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] static void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

// =============================================================================
// DetachPolicy (POSIX): new session, so the child has no controlling terminal
// and is not in the orchestrator's process group
// =============================================================================

const char* DetachPolicy::describe()
{
    return "setsid";
}

static void apply_detach_in_child(int error_fd)
{
    if (setsid() < 0)
        child_fail(error_fd);
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    line.reserve(256);

    char ch;
    while (line.size() < max_size)
    {
        size_t bytes_read = read(&ch, 1);
        if (bytes_read == 0)
            break;
        line.push_back(ch);
        if (ch == '\n')
            break;
    }

    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::flush()
{
    // On POSIX, write() is unbuffered for pipes
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// OutputFile implementation
// =============================================================================

OutputFile::OutputFile() : handle_(std::make_unique<PipeHandle>()) {}

OutputFile::~OutputFile()
{
    close();
}

OutputFile::OutputFile(OutputFile&&) noexcept = default;
OutputFile& OutputFile::operator=(OutputFile&&) noexcept = default;

void OutputFile::open(const std::filesystem::path& path)
{
    close();
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0)
        throw ProcessError("Failed to open log file '" + path.string() +
                           "': " + get_errno_message());
    handle_->fd = fd;
    path_ = path;
}

void OutputFile::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool OutputFile::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (kill_on_destroy_ && is_running())
    {
        terminate();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    // Writes to a child that died must surface as EPIPE, not kill the caller
    static const bool sigpipe_ignored = []
    {
        ::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)sigpipe_ignored;

    const bool stdout_to_file = options.stdout_file && options.stdout_file->is_open();
    const bool stderr_to_file = options.stderr_file && options.stderr_file->is_open();
    const bool pipe_stdout = options.redirect_stdout && !stdout_to_file;
    const bool pipe_stderr = options.redirect_stderr && !stderr_to_file;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
    };

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
    {
        auto msg = get_errno_message();
        cleanup();
        throw ProcessError("Failed to create stdin pipe: " + msg);
    }
    if (pipe_stdout && pipe(stdout_pipe) != 0)
    {
        auto msg = get_errno_message();
        cleanup();
        throw ProcessError("Failed to create stdout pipe: " + msg);
    }
    if (pipe_stderr && pipe(stderr_pipe) != 0)
    {
        auto msg = get_errno_message();
        cleanup();
        throw ProcessError("Failed to create stderr pipe: " + msg);
    }

    // Error pipe for detecting exec failures
    if (pipe(error_pipe) != 0)
    {
        auto msg = get_errno_message();
        cleanup();
        throw ProcessError("Failed to create error pipe: " + msg);
    }
    set_cloexec(error_pipe[1]);

    // Parent ends
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    set_cloexec(stderr_pipe[0]);

    const int stdout_file_fd = stdout_to_file ? options.stdout_file->handle_->fd : -1;
    const int stderr_file_fd = stderr_to_file ? options.stderr_file->handle_->fd : -1;

    pid_t pid = fork();
    if (pid < 0)
    {
        auto msg = get_errno_message();
        cleanup();
        throw ProcessError("Failed to fork process: " + msg);
    }

    if (pid == 0)
    {
        // Child process
        ::close(error_pipe[0]);

        if (options.detach)
            apply_detach_in_child(error_pipe[1]);

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(stdin_pipe[0]);
        }

        if (stdout_file_fd >= 0)
        {
            if (dup2(stdout_file_fd, STDOUT_FILENO) < 0)
                child_fail(error_pipe[1]);
        }
        else if (pipe_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(stdout_pipe[1]);
        }

        if (stderr_file_fd >= 0)
        {
            if (dup2(stderr_file_fd, STDERR_FILENO) < 0)
                child_fail(error_pipe[1]);
        }
        else if (pipe_stderr)
        {
            ::close(stderr_pipe[0]);
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(stderr_pipe[1]);
        }

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        child_fail(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);
    error_pipe[1] = -1;
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    ::close(error_pipe[0]);
    error_pipe[0] = -1;

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        cleanup();
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (pipe_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (pipe_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
    kill_on_destroy_ = !options.detach;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0)
        return false;

    if (!handle_->running)
        return false;

    // kill(pid, 0) succeeds on an unreaped zombie, so ask waitpid first
    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return false;
    }
    if (result < 0 && errno == ECHILD)
    {
        handle_->running = false;
        return false;
    }

    return true;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        return std::nullopt;
    }
    else if (errno == ECHILD)
    {
        // Reaped by someone else (pid_alive); exit status is lost
        handle_->running = false;
        return handle_->exit_code;
    }
    else
    {
        throw ProcessError("waitpid failed: " + get_errno_message());
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result < 0 && errno == ECHILD)
    {
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::string start_token(int pid)
{
#ifdef __linux__
    if (pid <= 0)
        return {};
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!in || !std::getline(in, stat))
        return {};

    // The command name may contain spaces; fields are counted after its ')'
    auto paren = stat.rfind(')');
    if (paren == std::string::npos)
        return {};
    std::istringstream fields(stat.substr(paren + 1));
    std::string field;
    // state is field 3, starttime is field 22
    for (int index = 3; index <= 22; ++index)
        if (!(fields >> field))
            return {};
    return field;
#else
    (void)pid;
    return {};
#endif
}

bool pid_alive(int pid)
{
    if (pid <= 0)
        return false;

    // Our own exited child stays a zombie until reaped; kill(pid, 0) would
    // report it alive
    int status;
    pid_t reaped = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (reaped == static_cast<pid_t>(pid))
        return false;

    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;

    // EPERM: exists but owned by another user
    return errno == EPERM;
}

void terminate_pid(int pid)
{
    if (pid > 0 && ::kill(static_cast<pid_t>(pid), SIGTERM) != 0 && errno != ESRCH)
        throw ProcessError("Failed to signal pid " + std::to_string(pid) + ": " +
                           get_errno_message());
}

void kill_pid(int pid)
{
    if (pid > 0 && ::kill(static_cast<pid_t>(pid), SIGKILL) != 0 && errno != ESRCH)
        throw ProcessError("Failed to kill pid " + std::to_string(pid) + ": " +
                           get_errno_message());
}

} // namespace multimcp::process

#endif // !_WIN32
