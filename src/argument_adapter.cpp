#include "multimcp/argument_adapter.hpp"

#include "multimcp/logging.hpp"
#include "multimcp/util/json.hpp"

namespace multimcp
{

Json merge_arguments(const std::string& server, const std::string& tool, const Json& args,
                     const std::optional<std::string>& message)
{
    Json merged = args.is_object() ? args : Json::object();

    if (message)
    {
        if (server == "fetch" && tool == "fetch")
        {
            merged["url"] = *message;
            log::logger()->debug("Using message as url for fetch: {}", *message);
        }
        else
        {
            std::optional<Json> parsed;
            auto first = message->find_first_not_of(" \t\r\n");
            if (first != std::string::npos && (*message)[first] == '{')
                parsed = util::json::try_parse(*message);

            if (parsed && parsed->is_object())
            {
                for (auto& [key, value] : parsed->items())
                    if (!merged.contains(key))
                        merged[key] = value;
            }
            else if (!merged.contains("message"))
            {
                merged["message"] = *message;
            }
        }
    }

    if (server == "filesystem" && merged.contains("directory") && !merged.contains("path"))
    {
        merged["path"] = merged["directory"];
        merged.erase("directory");
    }
    return merged;
}

std::string default_tool(const std::string& server)
{
    return server == "fetch" ? "fetch" : "process_message";
}

} // namespace multimcp
