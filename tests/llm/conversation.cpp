#include "toolrelay/llm/conversation.hpp"

#include <cassert>
#include <iostream>

using namespace toolrelay;

int main()
{
    std::cout << "Running conversation tests...\n\n";

    std::cout << "Test 1: append order and snapshot...\n";
    llm::Conversation conv;
    assert(conv.empty());

    llm::ToolInvocation call;
    call.id = "call_1";
    call.name = "add";
    call.arguments = {{"a", 2}, {"b", 2}};

    conv.append(llm::Message::user("what is 2+2"));
    conv.append(llm::Message::assistant("", {call}));
    conv.append(llm::Message::tool("4", "add", "call_1"));
    assert(conv.size() == 3);

    const auto& snap = conv.snapshot();
    assert(snap[0].role == Role::User);
    assert(snap[1].role == Role::Assistant);
    assert(snap[1].tool_calls.size() == 1);
    assert(snap[2].role == Role::Tool);
    assert(snap[2].tool_name.value_or("") == "add");

    // A copy taken earlier does not see later turns
    std::vector<llm::Message> before = conv.snapshot();
    conv.append(llm::Message::assistant("The answer is 4."));
    assert(before.size() == 3);
    assert(conv.size() == 4);
    std::cout << "  [PASS] append-only history\n";

    std::cout << "Test 2: chat wire shape...\n";
    Json user = snap[0];
    assert(user == Json({{"role", "user"}, {"content", "what is 2+2"}}));

    Json assistant = snap[1];
    assert(assistant["role"] == "assistant");
    assert(assistant["tool_calls"][0]["function"]["name"] == "add");
    assert(assistant["tool_calls"][0]["function"]["arguments"]["b"] == 2);
    assert(assistant["tool_calls"][0]["id"] == "call_1");

    Json tool = snap[2];
    assert(tool == Json({{"role", "tool"}, {"content", "4"}, {"tool_name", "add"}}));
    std::cout << "  [PASS] role, content, tool_calls, tool_name\n";

    std::cout << "Test 3: role names...\n";
    assert(to_string(Role::Tool) == "tool");
    assert(role_from_string("assistant") == Role::Assistant);
    assert(role_from_string("tool") == Role::Tool);
    assert(role_from_string("user") == Role::User);
    std::cout << "  [PASS] round trip\n";

    std::cout << "\nAll conversation tests passed\n";
    return 0;
}
