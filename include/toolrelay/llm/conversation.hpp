#pragma once
/// @file llm/conversation.hpp
/// @brief Ordered chat history for one query

#include "toolrelay/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolrelay::llm
{

/// A tool call requested by the model
struct ToolInvocation
{
    std::string id; ///< Correlates the tool turn that answers this call
    std::string name;
    toolrelay::Json arguments = toolrelay::Json::object();
};

/// One conversational turn
struct Message
{
    Role role{Role::User};
    std::string content;
    std::vector<ToolInvocation> tool_calls; ///< Assistant turns only
    std::optional<std::string> tool_name;    ///< Tool turns: which tool answered
    std::optional<std::string> tool_call_id; ///< Tool turns: which invocation

    static Message user(std::string text)
    {
        Message m;
        m.role = Role::User;
        m.content = std::move(text);
        return m;
    }

    static Message assistant(std::string text, std::vector<ToolInvocation> calls = {})
    {
        Message m;
        m.role = Role::Assistant;
        m.content = std::move(text);
        m.tool_calls = std::move(calls);
        return m;
    }

    static Message tool(std::string text, std::string name, std::string call_id)
    {
        Message m;
        m.role = Role::Tool;
        m.content = std::move(text);
        m.tool_name = std::move(name);
        m.tool_call_id = std::move(call_id);
        return m;
    }
};

/// Append-only message history. The snapshot is passed verbatim to the model
/// on every call, so order is significant.
class Conversation
{
  public:
    void append(Message message)
    {
        messages_.push_back(std::move(message));
    }

    const std::vector<Message>& snapshot() const
    {
        return messages_;
    }

    size_t size() const
    {
        return messages_.size();
    }

    bool empty() const
    {
        return messages_.empty();
    }

  private:
    std::vector<Message> messages_;
};

// Ollama chat wire shape; arguments stay JSON objects

inline void to_json(toolrelay::Json& j, const ToolInvocation& call)
{
    j = toolrelay::Json{{"function", {{"name", call.name}, {"arguments", call.arguments}}}};
    if (!call.id.empty())
        j["id"] = call.id;
}

inline void to_json(toolrelay::Json& j, const Message& m)
{
    j = toolrelay::Json{{"role", to_string(m.role)}, {"content", m.content}};
    if (!m.tool_calls.empty())
        j["tool_calls"] = m.tool_calls;
    if (m.tool_name)
        j["tool_name"] = *m.tool_name;
}

} // namespace toolrelay::llm
