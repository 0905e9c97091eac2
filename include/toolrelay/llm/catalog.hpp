#pragma once

#include "toolrelay/client/types.hpp"
#include "toolrelay/types.hpp"

#include <vector>

namespace toolrelay::llm
{

/// Convert provider tool descriptors into the function-calling schema chat
/// backends expect:
///   [{"type": "function",
///     "function": {"name", "description",
///                  "parameters": {"type": "object", "properties", "required"}}}]
/// Catalog order is preserved.
toolrelay::Json adapt_tools(const std::vector<client::ToolDescriptor>& descriptors);

/// Single-entry form of adapt_tools()
toolrelay::Json adapt_tool(const client::ToolDescriptor& descriptor);

/// Build a descriptor from one tools/list entry
/// @throws ValidationError when the entry has no string name
client::ToolDescriptor parse_tool_descriptor(const toolrelay::Json& entry);

} // namespace toolrelay::llm
