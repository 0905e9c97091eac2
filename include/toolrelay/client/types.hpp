#pragma once
/// @file client/types.hpp
/// @brief Protocol types exchanged with a tool provider
/// @details Tool catalog entries, tool call content blocks and the outcome of a
///          single tool invocation as seen by the orchestration loop.

#include "toolrelay/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace toolrelay::client
{

// ============================================================================
// Content Types (tool call results)
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
    std::string text;                ///< For text resources
    std::optional<std::string> blob; ///< For binary resources (base64)
    std::optional<std::string> mimeType;
};

using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResourceContent>;

// ============================================================================
// Tool catalog
// ============================================================================

/// Parameter schema of a tool: property map plus required parameter names
struct InputSchema
{
    toolrelay::Json properties = toolrelay::Json::object();
    std::vector<std::string> required;
};

/// One callable tool as advertised by tools/list
struct ToolDescriptor
{
    std::string name;
    std::string description;
    std::optional<std::string> title;
    InputSchema input_schema;
};

/// Identity reported by the provider during the initialize handshake
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocol_version;
    toolrelay::Json capabilities = toolrelay::Json::object();
    std::optional<std::string> instructions;
};

// ============================================================================
// Tool outcome
// ============================================================================

/// Result of one tool invocation: a success payload or a failure description.
/// Failures are values here, never exceptions.
struct ToolOutcome
{
    bool is_error{false};
    std::vector<ContentBlock> content;
    std::optional<toolrelay::Json> structured_content;
    std::string error;

    static ToolOutcome success(std::vector<ContentBlock> content,
                               std::optional<toolrelay::Json> structured = std::nullopt)
    {
        ToolOutcome o;
        o.content = std::move(content);
        o.structured_content = std::move(structured);
        return o;
    }

    static ToolOutcome failure(std::string error)
    {
        ToolOutcome o;
        o.is_error = true;
        o.error = std::move(error);
        return o;
    }

    bool ok() const
    {
        return !is_error;
    }

    /// Single textual rendering folded into the conversation
    std::string text() const;
};

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

inline void to_json(toolrelay::Json& j, const TextContent& c)
{
    j = toolrelay::Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const toolrelay::Json& j, TextContent& c)
{
    c.type = j.value("type", "text");
    c.text = j.at("text").get<std::string>();
}

inline void to_json(toolrelay::Json& j, const ImageContent& c)
{
    j = toolrelay::Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void from_json(const toolrelay::Json& j, ImageContent& c)
{
    c.type = j.value("type", "image");
    c.data = j.at("data").get<std::string>();
    c.mimeType = j.value("mimeType", "");
}

inline void to_json(toolrelay::Json& j, const EmbeddedResourceContent& c)
{
    toolrelay::Json resource = {{"uri", c.uri}};
    if (c.blob)
        resource["blob"] = *c.blob;
    else
        resource["text"] = c.text;
    if (c.mimeType)
        resource["mimeType"] = *c.mimeType;
    j = toolrelay::Json{{"type", c.type}, {"resource", resource}};
}

inline void to_json(toolrelay::Json& j, const ContentBlock& block)
{
    std::visit([&j](const auto& c) { to_json(j, c); }, block);
}

inline void to_json(toolrelay::Json& j, const ToolDescriptor& t)
{
    j = toolrelay::Json{
        {"name", t.name},
        {"description", t.description},
        {"inputSchema",
         {{"type", "object"},
          {"properties", t.input_schema.properties},
          {"required", t.input_schema.required}}},
    };
    if (t.title)
        j["title"] = *t.title;
}

/// Missing description, properties or required list default to empty.
inline void from_json(const toolrelay::Json& j, ToolDescriptor& t)
{
    t.name = j.at("name").get<std::string>();
    t.description = j.contains("description") && j["description"].is_string()
                        ? j["description"].get<std::string>()
                        : "";
    if (j.contains("title") && j["title"].is_string())
        t.title = j["title"].get<std::string>();

    t.input_schema = InputSchema{};
    if (j.contains("inputSchema") && j["inputSchema"].is_object())
    {
        const auto& schema = j["inputSchema"];
        if (schema.contains("properties") && schema["properties"].is_object())
            t.input_schema.properties = schema["properties"];
        if (schema.contains("required") && schema["required"].is_array())
            for (const auto& r : schema["required"])
                if (r.is_string())
                    t.input_schema.required.push_back(r.get<std::string>());
    }
}

/// Parse a content block from JSON
inline ContentBlock parse_content_block(const toolrelay::Json& j)
{
    std::string type = j.value("type", "text");
    if (type == "text" && j.contains("text"))
        return j.get<TextContent>();
    if (type == "image")
        return j.get<ImageContent>();
    if (type == "resource")
    {
        // Nested {"resource": {...}} per the protocol; flat form tolerated
        const auto& r = j.contains("resource") && j["resource"].is_object() ? j["resource"] : j;
        EmbeddedResourceContent c;
        c.uri = r.value("uri", "");
        c.text = r.value("text", "");
        if (r.contains("blob"))
            c.blob = r["blob"].get<std::string>();
        if (r.contains("mimeType"))
            c.mimeType = r["mimeType"].get<std::string>();
        return c;
    }
    TextContent tc;
    tc.text = j.dump();
    return tc;
}

inline std::string ToolOutcome::text() const
{
    if (is_error)
        return error;

    bool all_text = !content.empty();
    for (const auto& block : content)
        if (!std::holds_alternative<TextContent>(block))
            all_text = false;

    if (all_text)
    {
        std::string out;
        for (const auto& block : content)
        {
            if (!out.empty())
                out.append("\n");
            out.append(std::get<TextContent>(block).text);
        }
        return out;
    }

    if (content.empty())
        return structured_content ? structured_content->dump() : "";

    toolrelay::Json blocks = toolrelay::Json::array();
    for (const auto& block : content)
    {
        toolrelay::Json b;
        to_json(b, block);
        blocks.push_back(std::move(b));
    }
    return blocks.dump();
}

} // namespace toolrelay::client
