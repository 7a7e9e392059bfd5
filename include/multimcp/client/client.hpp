#pragma once
/// @file client/client.hpp
/// @brief MCP client used by the orchestrator to talk to one server
/// @details Covers the session handshake and the tool operations; resources,
///          prompts and server-initiated sampling are not offered.

#include "multimcp/client/transports.hpp"
#include "multimcp/client/types.hpp"
#include "multimcp/exceptions.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/types.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace multimcp
{
struct TransportDescriptor;
}

namespace multimcp::client
{

/// MCP protocol revision sent in the initialize handshake
inline constexpr const char* kProtocolVersion = "2024-11-05";

/// MCP Client for one server connection
///
/// Example usage:
/// @code
/// Client client(std::make_unique<StdioTransport>("my-server"));
/// Session session(client);
/// for (const auto& tool : client.list_tools())
///     std::cout << "Tool: " << tool.name << std::endl;
/// auto result = client.call_tool("echo", {{"message", "hi"}});
/// @endcode
class Client
{
  public:
    Client() = default;
    explicit Client(std::unique_ptr<ITransport> t) : transport_(std::move(t)) {}
    virtual ~Client() = default;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    bool is_initialized() const
    {
        return initialized_.has_value();
    }

    /// Server identity from the last handshake
    const std::optional<InitializeResult>& server_info() const
    {
        return initialized_;
    }

    // ==========================================================================
    // Low-level API (raw JSON)
    // ==========================================================================

    /// Send a raw request
    /// @param route The MCP method (e.g., "tools/list")
    /// @param payload The request params
    /// @return Unwrapped result
    virtual Json call(const std::string& route, const Json& payload)
    {
        if (!transport_)
            throw ConnectionError("Client has no transport");
        return transport_->request(route, payload);
    }

    // ==========================================================================
    // Session Operations
    // ==========================================================================

    /// Perform the initialize handshake and announce readiness
    virtual InitializeResult initialize()
    {
        Json payload = {{"protocolVersion", kProtocolVersion},
                        {"capabilities", Json::object()},
                        {"clientInfo", {{"name", "multimcp"}, {"version", "1.0.0"}}}};

        auto response = call("initialize", payload);
        auto result = parse_initialize_result(response);
        transport_->notify("notifications/initialized", Json::object());
        initialized_ = result;
        return result;
    }

    /// End the session; the transport reconnects on next use
    virtual void close()
    {
        initialized_.reset();
        if (transport_)
            transport_->close();
    }

    // ==========================================================================
    // Tool Operations
    // ==========================================================================

    /// List all available tools, following pagination cursors
    virtual std::vector<ToolInfo> list_tools()
    {
        std::vector<ToolInfo> tools;
        Json params = Json::object();
        while (true)
        {
            auto response = call("tools/list", params);
            if (response.contains("tools"))
                for (const auto& t : response["tools"])
                    tools.push_back(t.get<ToolInfo>());
            if (!response.contains("nextCursor") || !response["nextCursor"].is_string())
                break;
            params["cursor"] = response["nextCursor"];
        }
        return tools;
    }

    /// Call a tool and return the full MCP result
    /// @param timeout Deadline for the call (0 = no timeout). On expiry the
    ///                transport is aborted and TransportError is thrown.
    virtual CallToolResult call_tool(const std::string& name, const Json& arguments,
                                     std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
    {
        Json payload = {{"name", name}, {"arguments", arguments}};
        auto invoke_request = [this, payload]() { return call("tools/call", payload); };

        Json response;
        if (timeout.count() > 0)
        {
            auto fut = std::async(std::launch::async, invoke_request);
            if (fut.wait_for(timeout) == std::future_status::ready)
            {
                response = fut.get();
            }
            else
            {
                // The future's destructor joins the worker; unblock it first
                transport_->abort();
                fut.wait();
                initialized_.reset();
                transport_->close();
                throw TransportError("tools/call timed out after " +
                                     std::to_string(timeout.count()) + " ms");
            }
        }
        else
        {
            response = invoke_request();
        }

        return parse_call_tool_result(response);
    }

  protected:
    std::unique_ptr<ITransport> transport_;
    std::optional<InitializeResult> initialized_;

    static CallToolResult parse_call_tool_result(const Json& response)
    {
        CallToolResult result;
        result.isError = response.value("isError", false);

        if (!response.contains("content") || !response["content"].is_array())
            throw TransportError("tools/call response missing content");

        for (const auto& c : response["content"])
            result.content.push_back(parse_content_block(c));

        if (response.contains("structuredContent"))
            result.structuredContent = response["structuredContent"];
        if (response.contains("_meta"))
            result.meta = response["_meta"];

        return result;
    }

    static InitializeResult parse_initialize_result(const Json& response)
    {
        InitializeResult result;
        result.protocolVersion = response.value("protocolVersion", kProtocolVersion);

        if (response.contains("capabilities"))
        {
            const auto& caps = response["capabilities"];
            if (caps.contains("experimental"))
                result.capabilities.experimental = caps["experimental"];
            if (caps.contains("logging"))
                result.capabilities.logging = caps["logging"];
            if (caps.contains("prompts"))
                result.capabilities.prompts = caps["prompts"];
            if (caps.contains("resources"))
                result.capabilities.resources = caps["resources"];
            if (caps.contains("tools"))
                result.capabilities.tools = caps["tools"];
        }

        if (response.contains("serverInfo"))
        {
            result.serverInfo.name = response["serverInfo"].value("name", "unknown");
            result.serverInfo.version = response["serverInfo"].value("version", "unknown");
        }

        if (response.contains("instructions") && response["instructions"].is_string())
            result.instructions = response["instructions"].get<std::string>();

        return result;
    }
};

/// Scoped protocol session: handshake on entry, release on every exit path
class Session
{
  public:
    explicit Session(Client& client) : client_(client)
    {
        if (!client_.is_initialized())
            client_.initialize();
    }

    ~Session()
    {
        try
        {
            client_.close();
        }
        catch (const std::exception& e)
        {
            log::logger()->debug("session close failed: {}", e.what());
        }
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Client& client()
    {
        return client_;
    }

  private:
    Client& client_;
};

/// Build the protocol transport described by a selector result
std::unique_ptr<ITransport> make_transport(const TransportDescriptor& descriptor);

/// make_transport wrapped in a Client
std::unique_ptr<Client> make_client(const TransportDescriptor& descriptor);

} // namespace multimcp::client
