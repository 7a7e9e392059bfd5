#pragma once
#include "multimcp/config.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace multimcp
{

enum class TransportKind
{
    Stdio,
    WebSocket,
    Sse,
    StreamableHttp
};

std::string to_string(TransportKind kind);

/// Transport choice plus everything needed to open it
struct TransportDescriptor
{
    TransportKind kind{TransportKind::Stdio};

    // network transports
    std::string url;
    std::map<std::string, std::string> headers;

    // stdio
    std::string command;
    /// Arguments after the script / package (all arguments for Generic)
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    LauncherKind launcher{LauncherKind::Generic};
    /// DirectInterpreter: the script the interpreter runs
    std::optional<std::string> script;
    /// PackageRunner: package to fetch, runner options that preceded it and
    /// the runner's own confirm flag
    std::optional<std::string> package;
    std::vector<std::string> runner_flags;
    std::string confirm_flag;
    /// Where a stdio session's stderr is appended (inherited when unset)
    std::optional<std::filesystem::path> session_log;

    /// Executable followed by its arguments, as handed to the OS
    std::vector<std::string> argv() const;
};

/// Pure decision over a declared config.
/// @throws UnsupportedConfigError naming the server when no rule applies
TransportDescriptor select_transport(const std::string& name, const ServerConfig& config);

} // namespace multimcp
