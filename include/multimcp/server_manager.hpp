#pragma once
/// @file server_manager.hpp
/// @brief Facade that owns every server known to one orchestrator instance

#include "multimcp/client/client.hpp"
#include "multimcp/config.hpp"
#include "multimcp/process_launcher.hpp"
#include "multimcp/registry.hpp"
#include "multimcp/settings.hpp"
#include "multimcp/transport_selector.hpp"
#include "multimcp/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace multimcp
{

/// Builds a protocol client for a selected transport
using ClientFactory =
    std::function<std::unique_ptr<client::Client>(const TransportDescriptor& descriptor)>;

/// Connects to configured servers, launching local ones on demand and
/// tracking them across orchestrator restarts through the registry.
///
/// Example usage:
/// @code
/// ServerManager manager(ConfigStore::load_default(), Settings::from_env());
/// auto result = manager.query("echo", "process_message", Json::object(), "hello");
/// std::cout << result.text() << std::endl;
/// manager.close(true);
/// @endcode
///
/// All operations block and may be called from several threads.
class ServerManager
{
  public:
    ServerManager(ConfigStore config, Settings settings, ClientFactory factory = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // ==========================================================================
    // Configuration
    // ==========================================================================

    std::vector<std::string> list_servers() const;
    std::optional<ServerConfig> get_server_config(const std::string& name) const;
    void add_server(const std::string& name, ServerConfig config);

    const Settings& settings() const
    {
        return settings_;
    }

    // ==========================================================================
    // Connections and queries
    // ==========================================================================

    /// Cached or new client for a server.
    /// @param launch_if_needed Overrides Settings::auto_launch for this call
    /// @throws ConfigNotFoundError, LaunchFailedError, UnsupportedConfigError,
    ///         ConnectionError
    std::shared_ptr<client::Client> connect(const std::string& name,
                                            std::optional<bool> launch_if_needed = std::nullopt);

    /// Call one tool inside a fresh protocol session
    /// @throws ToolNotFoundError when the server does not advertise the tool
    /// @throws QueryError when the protocol layer fails
    client::CallToolResult query(const std::string& name, const std::string& tool,
                                 const Json& args = Json::object(),
                                 const std::optional<std::string>& message = std::nullopt);

    std::vector<client::ToolInfo> list_server_tools(const std::string& name);

    // ==========================================================================
    // Process lifecycle
    // ==========================================================================

    LaunchOutcome launch_server(const std::string& name);
    StopOutcome stop_server(const std::string& name);

    /// Stop every pipe-bound server this instance launched, tracked or adopted
    std::map<std::string, bool> stop_local_pipe_servers();

    /// Stop every tracked server plus every registry entry
    std::map<std::string, bool> stop_all_servers();

    RunState is_running(const std::string& name);
    ServerLogs get_server_logs(const std::string& name);

    bool is_local_pipe_server(const std::string& name) const;

    /// Track a process started outside launch_server under the given name
    void track_process(const std::string& name, LaunchedServer server);

    /// Close cached sessions; with stop_servers, stop local pipe servers too
    void close(bool stop_servers = false);

    /// Readable message for a protocol failure: the innermost nested cause,
    /// prefixed by a hint for access-denied, not-found and permission errors
    static std::string describe_failure(const std::exception& error);

  private:
    std::string ensure_launched(const std::string& name, const ServerConfig& config);
    /// Drops the handle of a server that exited; false if it is gone or alive again
    bool forget_dead_server(const std::string& name);
    bool stop_handle(const std::string& name, ServerProcess& process);
    bool stop_pid(const std::string& name, int pid);
    void drop_registry_entry(const std::string& name);
    std::shared_ptr<std::mutex> lock_for(std::map<std::string, std::shared_ptr<std::mutex>>& locks,
                                         const std::string& name);
    std::optional<ServerConfig> config_for(const std::string& name) const;

    ConfigStore config_;
    Settings settings_;
    ClientFactory factory_;
    ProcessLauncher launcher_;
    Registry registry_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ServerProcess>> processes_;
    std::set<std::string> launched_;
    std::map<std::string, std::shared_ptr<client::Client>> clients_;

    std::map<std::string, std::shared_ptr<std::mutex>> launch_locks_;
    std::map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace multimcp
