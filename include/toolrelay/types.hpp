#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace toolrelay
{

using Json = nlohmann::json;

/// Conversational role of a chat message
enum class Role
{
    User,
    Assistant,
    Tool
};

inline std::string to_string(Role role)
{
    switch (role)
    {
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    case Role::Tool:
        return "tool";
    }
    return "user";
}

inline Role role_from_string(const std::string& s)
{
    if (s == "assistant")
        return Role::Assistant;
    if (s == "tool")
        return Role::Tool;
    return Role::User;
}

} // namespace toolrelay
