#include "toolrelay/llm/catalog.hpp"

#include "toolrelay/exceptions.hpp"

namespace toolrelay::llm
{

toolrelay::Json adapt_tool(const client::ToolDescriptor& descriptor)
{
    const auto& schema = descriptor.input_schema;
    toolrelay::Json parameters = {
        {"type", "object"},
        {"properties",
         schema.properties.is_object() ? schema.properties : toolrelay::Json::object()},
        {"required", schema.required},
    };

    return toolrelay::Json{
        {"type", "function"},
        {"function",
         {{"name", descriptor.name},
          {"description", descriptor.description},
          {"parameters", std::move(parameters)}}},
    };
}

toolrelay::Json adapt_tools(const std::vector<client::ToolDescriptor>& descriptors)
{
    toolrelay::Json out = toolrelay::Json::array();
    for (const auto& d : descriptors)
        out.push_back(adapt_tool(d));
    return out;
}

client::ToolDescriptor parse_tool_descriptor(const toolrelay::Json& entry)
{
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string())
        throw ValidationError("tool descriptor requires a string 'name'");
    return entry.get<client::ToolDescriptor>();
}

} // namespace toolrelay::llm
