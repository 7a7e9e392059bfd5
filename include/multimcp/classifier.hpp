#pragma once
#include "multimcp/config.hpp"

namespace multimcp
{

/// True for a stdio server without a url that this instance runs, launched,
/// or could launch. Such a server talks over its own stdin/stdout and cannot
/// outlive the orchestrator, so it is stopped on shutdown. Servers with a
/// url or any other transport may keep running for other consumers.
inline bool is_local_pipe_server(const ServerConfig& config, bool has_live_handle,
                                 bool was_launched)
{
    if (!config.is_stdio() || config.url.has_value())
        return false;
    return has_live_handle || was_launched || config.is_launchable();
}

} // namespace multimcp
