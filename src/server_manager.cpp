#include "multimcp/server_manager.hpp"

#include "internal/process.hpp"
#include "multimcp/argument_adapter.hpp"
#include "multimcp/classifier.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <thread>

namespace multimcp
{

namespace
{
using Clock = std::chrono::steady_clock;

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

std::exception_ptr nested_of(const std::exception& e)
{
    if (auto* nested = dynamic_cast<const std::nested_exception*>(&e))
        return nested->nested_ptr();
    return nullptr;
}

void sleep_until_or(Clock::time_point deadline, std::chrono::milliseconds step)
{
    auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero())
        return;
    std::this_thread::sleep_for(std::min<Clock::duration>(step, remaining));
}

/// Newest file in dir whose name is <name>_<digits...><suffix>
std::optional<std::string> newest_log(const std::filesystem::path& dir, const std::string& name,
                                      const std::string& suffix)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return std::nullopt;

    const std::string prefix = name + "_";
    std::optional<fs::path> best;
    fs::file_time_type best_time{};
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string file = it->path().filename().string();
        if (file.size() <= prefix.size() + suffix.size() ||
            file.compare(0, prefix.size(), prefix) != 0 ||
            !std::isdigit(static_cast<unsigned char>(file[prefix.size()])) ||
            file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0)
            continue;
        auto when = fs::last_write_time(it->path(), ec);
        if (ec)
        {
            ec.clear();
            continue;
        }
        if (!best || when > best_time)
        {
            best = it->path();
            best_time = when;
        }
    }
    if (!best)
        return std::nullopt;
    return best->string();
}
} // namespace

ServerManager::ServerManager(ConfigStore config, Settings settings, ClientFactory factory)
    : config_(std::move(config)), settings_(std::move(settings)), factory_(std::move(factory)),
      launcher_(settings_), registry_(settings_.registry_path())
{
    if (!factory_)
        factory_ = [](const TransportDescriptor& d) { return client::make_client(d); };

    std::error_code ec;
    std::filesystem::create_directories(settings_.logs_path(), ec);
    if (ec)
        log::logger()->warn("Cannot create log directory {}: {}", settings_.logs_path().string(),
                            ec.message());
}

ServerManager::~ServerManager()
{
    try
    {
        close(false);
    }
    catch (const std::exception& e)
    {
        log::logger()->warn("Error while closing server manager: {}", e.what());
    }
}

// =============================================================================
// Configuration
// =============================================================================

std::vector<std::string> ServerManager::list_servers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.list_servers();
}

std::optional<ServerConfig> ServerManager::get_server_config(const std::string& name) const
{
    return config_for(name);
}

std::optional<ServerConfig> ServerManager::config_for(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (const ServerConfig* c = config_.get(name))
        return *c;
    return std::nullopt;
}

void ServerManager::add_server(const std::string& name, ServerConfig config)
{
    std::shared_ptr<client::Client> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.add_server(name, std::move(config));
        auto it = clients_.find(name);
        if (it != clients_.end())
        {
            stale = std::move(it->second);
            clients_.erase(it);
        }
    }
    log::logger()->info("Added server configuration: {}", name);
}

std::shared_ptr<std::mutex>
ServerManager::lock_for(std::map<std::string, std::shared_ptr<std::mutex>>& locks,
                        const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks[name];
    if (!slot)
        slot = std::make_shared<std::mutex>();
    return slot;
}

// =============================================================================
// Connections and queries
// =============================================================================

std::shared_ptr<client::Client> ServerManager::connect(const std::string& name,
                                                       std::optional<bool> launch_if_needed)
{
    auto config = config_for(name);
    if (!config)
        throw ConfigNotFoundError(name);
    const bool auto_launch = launch_if_needed.value_or(settings_.auto_launch);

    bool died = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto proc = processes_.find(name);
        died = launched_.count(name) > 0 && proc != processes_.end() && !proc->second->is_alive();
        if (!died)
        {
            auto cached = clients_.find(name);
            if (cached != clients_.end())
                return cached->second;
        }
    }

    if (died)
    {
        const bool forgotten = forget_dead_server(name);
        if (!auto_launch)
            throw ConnectionError("Server " + name + " is no longer running");
        if (forgotten)
            log::logger()->info("Server {} died, relaunching", name);
    }

    bool was_launched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_launched = launched_.count(name) > 0;
    }
    if (config->is_launchable() && auto_launch && !was_launched)
    {
        log::logger()->info("Auto-launching server {}", name);
        ensure_launched(name, *config);
    }

    TransportDescriptor descriptor = select_transport(name, *config);
    if (descriptor.kind == TransportKind::Stdio)
        descriptor.session_log = settings_.logs_path() / (name + "_session.log");
    log::logger()->debug("Connecting to server {} over {}", name, to_string(descriptor.kind));

    std::shared_ptr<client::Client> created;
    try
    {
        created = factory_(descriptor);
    }
    catch (const UnsupportedConfigError&)
    {
        throw;
    }
    catch (const ConnectionError&)
    {
        throw;
    }
    catch (const Error& e)
    {
        throw ConnectionError("Failed to connect to server " + name + ": " + e.what());
    }
    if (!created)
        throw ConnectionError("No client could be created for server " + name);

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = clients_.emplace(name, std::move(created));
    return inserted.first->second;
}

client::CallToolResult ServerManager::query(const std::string& name, const std::string& tool,
                                            const Json& args,
                                            const std::optional<std::string>& message)
{
    auto client = connect(name);

    auto session_lock = lock_for(session_locks_, name);
    std::lock_guard<std::mutex> serialized(*session_lock);
    try
    {
        client::Session session(*client);

        std::vector<std::string> available;
        for (const auto& t : client->list_tools())
            available.push_back(t.name);
        if (std::find(available.begin(), available.end(), tool) == available.end())
        {
            log::logger()->error("Tool '{}' not found on server {}", tool, name);
            throw ToolNotFoundError(name, tool, available);
        }

        Json arguments = merge_arguments(name, tool, args, message);
        log::logger()->debug("Calling tool {} on {} with args: {}", tool, name, arguments.dump());
        return client->call_tool(tool, arguments, settings_.request_timeout);
    }
    catch (const TransportError& e)
    {
        auto readable = describe_failure(e);
        log::logger()->error("Error querying server {}: {}", name, readable);
        throw QueryError(readable, e.what());
    }
    catch (const Json::exception& e)
    {
        log::logger()->error("Malformed reply from server {}: {}", name, e.what());
        throw QueryError("Malformed reply from server " + name + ": " + e.what(), e.what());
    }
}

std::vector<client::ToolInfo> ServerManager::list_server_tools(const std::string& name)
{
    auto client = connect(name);

    auto session_lock = lock_for(session_locks_, name);
    std::lock_guard<std::mutex> serialized(*session_lock);
    try
    {
        client::Session session(*client);
        return client->list_tools();
    }
    catch (const TransportError& e)
    {
        throw QueryError(describe_failure(e), e.what());
    }
    catch (const Json::exception& e)
    {
        throw QueryError("Malformed reply from server " + name + ": " + e.what(), e.what());
    }
}

std::string ServerManager::describe_failure(const std::exception& error)
{
    std::string innermost = error.what();
    std::string combined = innermost;
    for (auto next = nested_of(error); next;)
    {
        try
        {
            std::rethrow_exception(next);
        }
        catch (const std::exception& inner)
        {
            innermost = inner.what();
            combined += "\n";
            combined += innermost;
            next = nested_of(inner);
        }
    }

    const std::string text = lower(combined);
    if (contains(text, "outside allowed directories") || contains(text, "access denied"))
        return "Access denied: path is outside the allowed directories (" + innermost + ")";
    if (contains(text, "enoent") || contains(text, "no such file or directory"))
        return "File or directory not found (" + innermost + ")";
    if (contains(text, "eacces") || contains(text, "permission denied"))
        return "Permission denied (" + innermost + ")";
    return innermost;
}

// =============================================================================
// Process lifecycle
// =============================================================================

LaunchOutcome ServerManager::launch_server(const std::string& name)
{
    auto config = config_for(name);
    if (!config)
    {
        log::logger()->error("No configuration found for server: {}", name);
        return {false, "No configuration found for server: " + name};
    }
    if (!config->is_launchable())
    {
        log::logger()->error("Server {} is not launchable (not a stdio server)", name);
        return {false, "Server " + name + " is not launchable (not a stdio server with a command)"};
    }

    try
    {
        return {true, ensure_launched(name, *config)};
    }
    catch (const LaunchFailedError& e)
    {
        std::string detail = e.what();
        if (!e.stderr_tail.empty())
            detail += "\nLast lines of stderr:\n" + e.stderr_tail;
        if (!e.stderr_log.empty())
            detail += "\nSee log file: " + e.stderr_log;
        log::logger()->error("{}", e.what());
        return {false, detail};
    }
    catch (const Error& e)
    {
        log::logger()->error("Failed to launch server {}: {}", name, e.what());
        return {false, e.what()};
    }
}

std::string ServerManager::ensure_launched(const std::string& name, const ServerConfig& config)
{
    auto launch_lock = lock_for(launch_locks_, name);
    std::lock_guard<std::mutex> serialized(*launch_lock);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(name);
        if (it != processes_.end())
        {
            if (it->second->is_alive())
            {
                int pid = it->second->pid();
                log::logger()->info("Server {} is already running (pid {})", name, pid);
                return "Server " + name + " is already running (pid " + std::to_string(pid) + ")";
            }
            it->second->close_logs();
            processes_.erase(it);
            launched_.erase(name);
        }
    }

    const std::string hash = fingerprint(config);
    if (auto entry = registry_.get(name))
    {
        if (Registry::is_alive(*entry))
        {
            if (entry->config_hash == hash)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    launched_.insert(name);
                }
                log::logger()->info("Server {} already running (pid {}, started {})", name,
                                    entry->pid, entry->start_time);
                return "Server " + name + " is already running (pid " +
                       std::to_string(entry->pid) + ")";
            }
            log::logger()->warn("Configuration of server {} changed since pid {} started, "
                                "restarting it",
                                name, entry->pid);
            stop_pid(name, entry->pid);
        }
        else
        {
            log::logger()->info("Dropping stale registry entry for {} (pid {})", name, entry->pid);
        }
        drop_registry_entry(name);
    }

    LaunchedServer launched = launcher_.launch(name, config);
    const int pid = launched.process->pid();

    RegistryEntry entry;
    entry.server_name = name;
    entry.pid = pid;
    entry.start_time = ProcessLauncher::timestamp(launched.start_time, "%Y-%m-%dT%H:%M:%S");
    entry.process_token = process::start_token(pid);
    entry.config_hash = hash;
    entry.log_dir = settings_.logs_path().string();
    entry.stdout_log = launched.process->stdout_log().string();
    entry.stderr_log = launched.process->stderr_log().string();
    try
    {
        registry_.put(entry);
    }
    catch (const Error& e)
    {
        log::logger()->error("Cannot record server {} in the registry: {}", name, e.what());
        stop_handle(name, *launched.process);
        throw LaunchFailedError("Server " + name + " started but could not be registered: " +
                                e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[name] = std::move(launched.process);
        launched_.insert(name);
    }
    return "Launched server " + name + " (pid " + std::to_string(pid) + ")";
}

void ServerManager::track_process(const std::string& name, LaunchedServer server)
{
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[name] = std::move(server.process);
    launched_.insert(name);
}

bool ServerManager::forget_dead_server(const std::string& name)
{
    auto launch_lock = lock_for(launch_locks_, name);
    std::lock_guard<std::mutex> serialized(*launch_lock);

    std::unique_ptr<ServerProcess> handle;
    std::shared_ptr<client::Client> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Another caller may have cleaned up and relaunched in the meantime
        auto it = processes_.find(name);
        if (it == processes_.end() || it->second->is_alive())
            return false;
        handle = std::move(it->second);
        processes_.erase(it);
        launched_.erase(name);
        auto cached = clients_.find(name);
        if (cached != clients_.end())
        {
            client = std::move(cached->second);
            clients_.erase(cached);
        }
    }

    auto code = handle->exit_code();
    log::logger()->warn("Server {} (pid {}) exited with code {}", name, handle->pid(),
                        code.value_or(-1));
    handle->close_logs();
    drop_registry_entry(name);
    return true;
}

void ServerManager::drop_registry_entry(const std::string& name)
{
    try
    {
        registry_.remove(name);
    }
    catch (const Error& e)
    {
        log::logger()->error("Cannot remove {} from the registry: {}", name, e.what());
    }
}

bool ServerManager::stop_handle(const std::string& name, ServerProcess& proc)
{
    bool stopped = false;
    try
    {
        if (proc.is_alive())
        {
            log::logger()->info("Stopping server {} (pid {})", name, proc.pid());
            proc.terminate();

            auto deadline = Clock::now() + settings_.stop_timeout;
            while (proc.is_alive() && Clock::now() < deadline)
                sleep_until_or(deadline, settings_.stop_poll_interval);

            if (proc.is_alive())
            {
                log::logger()->warn("Server {} did not exit within {} ms, killing it", name,
                                    settings_.stop_timeout.count());
                proc.kill();
                auto reap_deadline = Clock::now() + std::chrono::seconds(1);
                while (proc.is_alive() && Clock::now() < reap_deadline)
                    sleep_until_or(reap_deadline, std::chrono::milliseconds(50));
            }
        }
        stopped = !proc.is_alive();
    }
    catch (const std::exception& e)
    {
        log::logger()->error("Error stopping server {}: {}", name, e.what());
    }
    proc.close_logs();
    return stopped;
}

bool ServerManager::stop_pid(const std::string& name, int pid)
{
    try
    {
        if (!process::pid_alive(pid))
            return true;

        log::logger()->info("Stopping server {} by pid {}", name, pid);
        process::terminate_pid(pid);

        auto deadline = Clock::now() + settings_.stop_timeout;
        while (process::pid_alive(pid) && Clock::now() < deadline)
            sleep_until_or(deadline, settings_.stop_poll_interval);

        if (process::pid_alive(pid))
        {
            log::logger()->warn("Server {} (pid {}) did not exit within {} ms, killing it", name,
                                pid, settings_.stop_timeout.count());
            process::kill_pid(pid);
            auto reap_deadline = Clock::now() + std::chrono::seconds(1);
            while (process::pid_alive(pid) && Clock::now() < reap_deadline)
                sleep_until_or(reap_deadline, std::chrono::milliseconds(50));
        }
        return !process::pid_alive(pid);
    }
    catch (const process::ProcessError& e)
    {
        log::logger()->error("Error stopping server {} (pid {}): {}", name, pid, e.what());
        return false;
    }
}

StopOutcome ServerManager::stop_server(const std::string& name)
{
    auto launch_lock = lock_for(launch_locks_, name);
    std::lock_guard<std::mutex> serialized(*launch_lock);

    std::unique_ptr<ServerProcess> handle;
    std::shared_ptr<client::Client> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(name);
        if (it != processes_.end())
        {
            handle = std::move(it->second);
            processes_.erase(it);
        }
        launched_.erase(name);
        auto cached = clients_.find(name);
        if (cached != clients_.end())
        {
            client = std::move(cached->second);
            clients_.erase(cached);
        }
    }
    client.reset();

    if (handle)
    {
        const int pid = handle->pid();
        bool ok = stop_handle(name, *handle);
        drop_registry_entry(name);
        if (!ok)
            return {false, "Server " + name + " (pid " + std::to_string(pid) + ") did not exit"};
        log::logger()->info("Stopped server {}", name);
        return {true, "Stopped server " + name + " (pid " + std::to_string(pid) + ")"};
    }

    if (auto entry = registry_.get(name))
    {
        if (Registry::is_alive(*entry))
        {
            bool ok = stop_pid(name, entry->pid);
            drop_registry_entry(name);
            if (!ok)
                return {false, "Server " + name + " (pid " + std::to_string(entry->pid) +
                                   ") did not exit"};
            log::logger()->info("Stopped server {} (pid {}) from the registry", name, entry->pid);
            return {true, "Stopped server " + name + " (pid " + std::to_string(entry->pid) + ")"};
        }
        drop_registry_entry(name);
    }

    log::logger()->info("Server {} is not running", name);
    return {false, "Server " + name + " is not running"};
}

bool ServerManager::is_local_pipe_server(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const ServerConfig* config = config_.get(name);
    if (!config)
        return false;
    auto it = processes_.find(name);
    bool live = it != processes_.end() && it->second->is_alive();
    return multimcp::is_local_pipe_server(*config, live, launched_.count(name) > 0);
}

std::map<std::string, bool> ServerManager::stop_local_pipe_servers()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Handles we own plus servers adopted from the registry
        std::set<std::string> candidates(launched_.begin(), launched_.end());
        for (const auto& [name, proc] : processes_)
            candidates.insert(name);
        for (const auto& name : candidates)
        {
            const ServerConfig* config = config_.get(name);
            if (config && multimcp::is_local_pipe_server(*config, processes_.count(name) > 0,
                                                         launched_.count(name) > 0))
                names.push_back(name);
            else
                log::logger()->debug("Leaving server {} running", name);
        }
    }

    std::map<std::string, bool> results;
    for (const auto& name : names)
        results[name] = stop_server(name).ok;
    return results;
}

std::map<std::string, bool> ServerManager::stop_all_servers()
{
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, proc] : processes_)
            names.insert(name);
    }
    for (const auto& [name, entry] : registry_.entries())
        names.insert(name);

    std::map<std::string, bool> results;
    for (const auto& name : names)
        results[name] = stop_server(name).ok;
    return results;
}

RunState ServerManager::is_running(const std::string& name)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(name);
        if (it != processes_.end() && it->second->is_alive())
            return {true, it->second->pid()};
    }
    try
    {
        if (auto pid = registry_.probe(name))
            return {true, *pid};
    }
    catch (const Error& e)
    {
        log::logger()->warn("Cannot update registry for {}: {}", name, e.what());
    }
    return {false, std::nullopt};
}

ServerLogs ServerManager::get_server_logs(const std::string& name)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(name);
        if (it != processes_.end())
            return {it->second->stdout_log().string(), it->second->stderr_log().string()};
    }

    if (auto entry = registry_.get(name))
    {
        ServerLogs logs;
        if (!entry->stdout_log.empty())
            logs.stdout_log = entry->stdout_log;
        if (!entry->stderr_log.empty())
            logs.stderr_log = entry->stderr_log;
        if (logs.stdout_log || logs.stderr_log)
            return logs;
    }

    const auto dir = settings_.logs_path();
    return {newest_log(dir, name, "_stdout.log"), newest_log(dir, name, "_stderr.log")};
}

void ServerManager::close(bool stop_servers)
{
    std::map<std::string, std::shared_ptr<client::Client>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
    }
    for (auto& [name, client] : clients)
    {
        try
        {
            client->close();
        }
        catch (const Error& e)
        {
            log::logger()->debug("Closing session for {} failed: {}", name, e.what());
        }
    }
    clients.clear();

    if (stop_servers)
        stop_local_pipe_servers();
}

} // namespace multimcp
