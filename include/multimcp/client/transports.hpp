#pragma once
#include "multimcp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace easywsclient
{
class WebSocket;
}

namespace httplib
{
class Client;
}

namespace multimcp::process
{
class Process;
class OutputFile;
} // namespace multimcp::process

namespace multimcp::client
{

// ============================================================================
// Transport Interface
// ============================================================================

/// Abstract transport for MCP JSON-RPC traffic
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Send a request and receive the unwrapped result
    /// @param route The MCP method (e.g., "tools/list", "tools/call")
    /// @param payload The request params
    /// @throws TransportError on I/O failure or a JSON-RPC error response
    virtual Json request(const std::string& route, const Json& payload) = 0;

    /// Send a notification (no id, no response expected)
    virtual void notify(const std::string& method, const Json& params) = 0;

    /// Release the connection; a later request reconnects
    virtual void close() {}

    /// Interrupt an in-flight request from another thread. The transport is
    /// unusable until close() is called.
    virtual void abort() {}
};

// ============================================================================
// StdioTransport
// ============================================================================

/// Runs an MCP stdio server as a subprocess and keeps it alive across
/// requests (line-delimited JSON-RPC on stdin/stdout). The process is spawned
/// lazily by the first request and terminated by close().
class StdioTransport : public ITransport
{
  public:
    /// @param log_file Optional path where subprocess stderr is appended.
    ///                 Without it stderr is inherited from the caller.
    explicit StdioTransport(std::string command, std::vector<std::string> args = {},
                            std::map<std::string, std::string> env = {},
                            std::optional<std::filesystem::path> log_file = std::nullopt);
    ~StdioTransport() override;

    Json request(const std::string& route, const Json& payload) override;
    void notify(const std::string& method, const Json& params) override;
    void close() override;
    void abort() override;

    bool is_running() const;

    /// Per-response read deadline (default 5 minutes)
    void set_read_timeout(std::chrono::milliseconds timeout)
    {
        read_timeout_ = timeout;
    }

  private:
    void ensure_started();
    void write_message(const Json& message);
    Json read_response(int64_t id);
    void reply_unsupported(const Json& message);

    std::string command_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> env_;
    std::optional<std::filesystem::path> log_file_;
    std::chrono::milliseconds read_timeout_{std::chrono::minutes(5)};

    mutable std::mutex mutex_;
    std::unique_ptr<process::Process> process_;
    std::unique_ptr<process::OutputFile> stderr_log_;
    std::atomic<int> active_pid_{0};
    int64_t next_id_{1};
};

// ============================================================================
// SseClientTransport
// ============================================================================

/// MCP over the legacy HTTP+SSE protocol: a long-lived GET stream delivers
/// responses, requests are POSTed to the endpoint the server announces.
class SseClientTransport : public ITransport
{
  public:
    SseClientTransport(std::string base_url, std::string sse_path = "/sse",
                       std::string messages_path = "/messages",
                       std::map<std::string, std::string> headers = {});
    ~SseClientTransport() override;

    Json request(const std::string& route, const Json& payload) override;
    void notify(const std::string& method, const Json& params) override;
    void close() override;
    void abort() override;

    bool is_connected() const;

  private:
    void ensure_listening();
    void start_sse_listener();
    void stop_sse_listener();
    void fail_pending(const std::string& reason);
    void process_sse_event(const Json& event);
    void handle_sse_chunk(const std::string& event_type, const std::string& data);
    std::string post_path() const;
    void post_message(const Json& message, const std::string& what);

    std::string base_url_;
    std::string sse_path_;
    std::string messages_path_;
    std::map<std::string, std::string> headers_;

    std::mutex listener_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::unique_ptr<std::thread> sse_thread_;
    std::shared_ptr<httplib::Client> stop_client_; ///< stream client, stopped on close

    mutable std::mutex endpoint_mutex_;
    std::string endpoint_path_;

    std::mutex pending_mutex_;
    std::unordered_map<int64_t, std::promise<Json>> pending_requests_;
    std::atomic<int64_t> next_id_{1};
};

// ============================================================================
// StreamableHttpTransport
// ============================================================================

/// MCP Streamable HTTP: every message is a POST to one endpoint; the reply is
/// either plain JSON or a short SSE stream. Tracks the Mcp-Session-Id header.
class StreamableHttpTransport : public ITransport
{
  public:
    StreamableHttpTransport(std::string base_url, std::string mcp_path = "/mcp",
                            std::map<std::string, std::string> headers = {});
    ~StreamableHttpTransport() override;

    Json request(const std::string& route, const Json& payload) override;
    void notify(const std::string& method, const Json& params) override;
    void close() override;
    void abort() override;

  private:
    struct Reply
    {
        int status{0};
        std::string body;
        std::string content_type;
    };

    Reply post(const Json& message);
    Json parse_response(const std::string& body, const std::string& content_type);

    std::string base_url_;
    std::string mcp_path_;
    std::map<std::string, std::string> headers_;

    mutable std::mutex session_mutex_;
    std::string session_id_;
    std::shared_ptr<httplib::Client> active_client_; ///< in-flight POST, stopped by abort()
    bool aborted_{false};
    std::atomic<int64_t> next_id_{1};
};

// ============================================================================
// WebSocketTransport
// ============================================================================

/// MCP over a WebSocket; one text frame per JSON-RPC message
class WebSocketTransport : public ITransport
{
  public:
    explicit WebSocketTransport(std::string url);
    ~WebSocketTransport() override;

    Json request(const std::string& route, const Json& payload) override;
    void notify(const std::string& method, const Json& params) override;
    void close() override;
    void abort() override;

  private:
    void ensure_connected();

    std::string url_;
    std::chrono::milliseconds timeout_{60000};
    std::atomic<bool> aborted_{false};
    std::mutex mutex_;
    std::unique_ptr<easywsclient::WebSocket> ws_;
    int64_t next_id_{1};
};

} // namespace multimcp::client
