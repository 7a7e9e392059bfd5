#pragma once
#include "multimcp/types.hpp"

#include <optional>
#include <string>

namespace multimcp
{

/// Combine explicit tool arguments with a free-form message.
///
/// - a message parsing as a JSON object is merged key by key (explicit
///   arguments win); any other message fills "message" unless present
/// - server "fetch", tool "fetch": the message is the "url"
/// - server "filesystem": a "directory" argument is renamed to "path"
Json merge_arguments(const std::string& server, const std::string& tool, const Json& args,
                     const std::optional<std::string>& message);

/// Default tool for a server when the caller did not name one
std::string default_tool(const std::string& server);

} // namespace multimcp
