#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace multimcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Malformed configuration input
struct ConfigError : public Error
{
    using Error::Error;
};

/// Unknown server name
struct ConfigNotFoundError : public Error
{
    explicit ConfigNotFoundError(const std::string& server)
        : Error("No configuration found for server: " + server), server_name(server)
    {
    }

    std::string server_name;
};

/// No transport rule matches the server configuration
struct UnsupportedConfigError : public Error
{
    UnsupportedConfigError(const std::string& server, const std::string& reason)
        : Error("Unsupported server configuration for " + server + ": " + reason),
          server_name(server)
    {
    }

    std::string server_name;
};

/// The server process could not be started or exited during startup
struct LaunchFailedError : public Error
{
    LaunchFailedError(const std::string& message, std::string tail = {}, std::string log = {})
        : Error(message), stderr_tail(std::move(tail)), stderr_log(std::move(log))
    {
    }

    std::string stderr_tail;
    std::string stderr_log;
};

/// Requested tool is not advertised by the server
struct ToolNotFoundError : public Error
{
    ToolNotFoundError(const std::string& server, const std::string& tool,
                      std::vector<std::string> tools)
        : Error(make_message(server, tool, tools)), available(std::move(tools))
    {
    }

    std::vector<std::string> available;

  private:
    static std::string make_message(const std::string& server, const std::string& tool,
                                    const std::vector<std::string>& tools)
    {
        std::string msg = "Tool '" + tool + "' not found on server " + server +
                          ". Available tools: [";
        for (size_t i = 0; i < tools.size(); ++i)
        {
            if (i > 0)
                msg += ", ";
            msg += tools[i];
        }
        return msg + "]";
    }
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Could not build or reach a client for a server
struct ConnectionError : public Error
{
    using Error::Error;
};

/// A query failed inside the protocol layer; what() carries the unwrapped cause
struct QueryError : public Error
{
    QueryError(const std::string& message, std::string raw)
        : Error(message), raw_message(std::move(raw))
    {
    }

    std::string raw_message;
};

} // namespace multimcp
