#pragma once
/// @file client/types.hpp
/// @brief MCP protocol result types used by the orchestrator's client

#include "multimcp/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace multimcp::client
{

// ============================================================================
// Content Types (for tool results)
// ============================================================================

/// Text content block
struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Image content block
struct ImageContent
{
    std::string type{"image"};
    std::string data;     ///< Base64-encoded image bytes
    std::string mimeType; ///< e.g., "image/png"
};

/// Embedded resource content
struct EmbeddedResourceContent
{
    std::string type{"resource"};
    std::string uri;
    std::string text;
    std::optional<std::string> blob;
    std::optional<std::string> mimeType;
};

using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResourceContent>;

// ============================================================================
// Tool Types
// ============================================================================

/// Tool information as returned by tools/list
struct ToolInfo
{
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    Json inputSchema; ///< JSON Schema for tool input
};

/// Result of tools/call request
struct CallToolResult
{
    std::vector<ContentBlock> content;
    bool isError{false};
    std::optional<Json> structuredContent;
    std::optional<Json> meta;

    /// Text of the first TextContent block
    std::string text() const
    {
        for (const auto& block : content)
            if (auto* tc = std::get_if<TextContent>(&block))
                return tc->text;
        return "";
    }
};

// ============================================================================
// Session Types
// ============================================================================

struct ServerCapabilities
{
    std::optional<Json> experimental;
    std::optional<Json> logging;
    std::optional<Json> prompts;
    std::optional<Json> resources;
    std::optional<Json> tools;
};

struct ServerInfo
{
    std::string name;
    std::string version;
};

/// Result of initialize request
struct InitializeResult
{
    std::string protocolVersion;
    ServerCapabilities capabilities;
    ServerInfo serverInfo;
    std::optional<std::string> instructions;
};

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", "text");
    c.text = j.at("text").get<std::string>();
}

inline void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void from_json(const Json& j, ImageContent& c)
{
    c.type = j.value("type", "image");
    c.data = j.at("data").get<std::string>();
    c.mimeType = j.at("mimeType").get<std::string>();
}

inline void to_json(Json& j, const EmbeddedResourceContent& c)
{
    j = Json{{"type", c.type}, {"uri", c.uri}, {"text", c.text}};
    if (c.blob)
        j["blob"] = *c.blob;
    if (c.mimeType)
        j["mimeType"] = *c.mimeType;
}

inline void to_json(Json& j, const ToolInfo& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
    if (t.title)
        j["title"] = *t.title;
    if (t.description)
        j["description"] = *t.description;
}

inline void from_json(const Json& j, ToolInfo& t)
{
    t.name = j.at("name").get<std::string>();
    if (j.contains("title") && j["title"].is_string())
        t.title = j["title"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        t.description = j["description"].get<std::string>();
    t.inputSchema = j.value("inputSchema", Json::object());
}

/// Parse a content block from JSON
inline ContentBlock parse_content_block(const Json& j)
{
    std::string type = j.value("type", "text");
    if (type == "text")
    {
        return j.get<TextContent>();
    }
    else if (type == "image")
    {
        return j.get<ImageContent>();
    }
    else if (type == "resource")
    {
        // MCP nests the payload under "resource"; older servers inline it
        const Json& r = j.contains("resource") ? j["resource"] : j;
        EmbeddedResourceContent c;
        c.uri = r.value("uri", "");
        c.text = r.value("text", "");
        if (r.contains("blob"))
            c.blob = r["blob"].get<std::string>();
        if (r.contains("mimeType"))
            c.mimeType = r["mimeType"].get<std::string>();
        return c;
    }
    // Default to text
    TextContent tc;
    tc.text = j.dump();
    return tc;
}

/// Serialize a whole tool result, as printed by the CLI
inline Json result_to_json(const CallToolResult& r)
{
    Json content = Json::array();
    for (const auto& block : r.content)
        std::visit([&](const auto& c) { content.push_back(Json(c)); }, block);
    Json j = {{"content", content}, {"isError", r.isError}};
    if (r.structuredContent)
        j["structuredContent"] = *r.structuredContent;
    return j;
}

} // namespace multimcp::client
