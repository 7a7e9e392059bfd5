#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace multimcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}

/// nullopt instead of a parse_error for input that is not JSON
inline std::optional<json> try_parse(const std::string& s)
{
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

} // namespace multimcp::util::json
