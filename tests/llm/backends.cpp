#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/settings.hpp"

#include <httplib.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace toolrelay;

// Local HTTP server standing in for Ollama and OpenAI-compatible endpoints
class MockChatServer
{
  public:
    Json last_body;
    std::string last_authorization;
    std::string last_path;

    MockChatServer()
    {
        server_.Post("/api/chat",
                     [this](const httplib::Request& req, httplib::Response& res)
                     { respond(req, res, ollama_reply_); });
        server_.Post("/v1/chat/completions",
                     [this](const httplib::Request& req, httplib::Response& res)
                     { respond(req, res, openai_reply_); });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ~MockChatServer()
    {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    std::string url() const
    {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    void set_ollama_reply(int status, std::string body)
    {
        ollama_reply_ = {status, std::move(body)};
    }

    void set_openai_reply(int status, std::string body)
    {
        openai_reply_ = {status, std::move(body)};
    }

  private:
    using Reply = std::pair<int, std::string>;

    void respond(const httplib::Request& req, httplib::Response& res, const Reply& reply)
    {
        last_path = req.path;
        last_body = Json::parse(req.body, nullptr, false);
        last_authorization = req.get_header_value("Authorization");
        res.status = reply.first;
        res.set_content(reply.second, "application/json");
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    Reply ollama_reply_{200, "{}"};
    Reply openai_reply_{200, "{}"};
};

static std::vector<llm::Message> tool_round_messages()
{
    llm::ToolInvocation call;
    call.id = "call_1";
    call.name = "add";
    call.arguments = {{"a", 2}, {"b", 2}};
    return {llm::Message::user("what is 2+2"), llm::Message::assistant("", {call}),
            llm::Message::tool("4", "add", "call_1")};
}

static Json add_schema()
{
    return Json::array({{{"type", "function"},
                         {"function",
                          {{"name", "add"},
                           {"description", "Add two numbers"},
                           {"parameters", {{"type", "object"}, {"properties", Json::object()}}}}}}});
}

void test_ollama_request_and_tool_calls(MockChatServer& mock)
{
    std::cout << "Test 1: Ollama decision call with tool schema...\n";
    mock.set_ollama_reply(200, R"({
        "model": "gpt-oss:20b",
        "message": {"role": "assistant", "content": "",
                    "tool_calls": [{"function": {"name": "add", "arguments": {"a": 2, "b": 2}}},
                                   {"function": {"name": "greet", "arguments": "{\"name\":\"Ada\"}"}}]},
        "done": true})");

    llm::OllamaOptions opts;
    opts.host = mock.url() + "/";
    opts.model_options = Json{{"temperature", 0}};
    llm::OllamaBackend backend(opts);

    auto reply = backend.chat("gpt-oss:20b", {llm::Message::user("what is 2+2")}, add_schema());
    assert(mock.last_path == "/api/chat");
    assert(mock.last_body["model"] == "gpt-oss:20b");
    assert(mock.last_body["stream"] == false);
    assert(mock.last_body["tools"] == add_schema());
    assert(mock.last_body["options"]["temperature"] == 0);
    assert(mock.last_body["messages"][0] == Json({{"role", "user"}, {"content", "what is 2+2"}}));

    assert(reply.has_tool_calls());
    assert(reply.tool_calls.size() == 2);
    assert(reply.tool_calls[0].name == "add");
    assert(reply.tool_calls[0].id == "call_1");
    assert(reply.tool_calls[0].arguments == Json({{"a", 2}, {"b", 2}}));
    assert(reply.tool_calls[1].id == "call_2");
    assert(reply.tool_calls[1].arguments["name"] == "Ada");
    assert(reply.content.value_or("x").empty());
    std::cout << "  [PASS] tool calls parsed, ids synthesized\n";
}

void test_ollama_summary_call(MockChatServer& mock)
{
    std::cout << "Test 2: Ollama summary call without tools...\n";
    mock.set_ollama_reply(
        200, R"({"model": "gpt-oss:20b", "message": {"role": "assistant", "content": "The answer is 4."}})");
    llm::OllamaOptions opts;
    opts.host = mock.url();
    llm::OllamaBackend backend(opts);

    auto reply = backend.chat("gpt-oss:20b", tool_round_messages(), std::nullopt);
    assert(!mock.last_body.contains("tools"));
    const Json& sent = mock.last_body["messages"];
    assert(sent.size() == 3);
    assert(sent[1]["tool_calls"][0]["function"]["arguments"]["a"] == 2);
    assert(sent[2]["role"] == "tool");
    assert(sent[2]["tool_name"] == "add");
    assert(!reply.has_tool_calls());
    assert(reply.content.value_or("") == "The answer is 4.");
    std::cout << "  [PASS] summary parsed\n";
}

void test_ollama_errors(MockChatServer& mock)
{
    std::cout << "Test 3: Ollama failures raise ModelError...\n";
    llm::OllamaOptions opts;
    opts.host = mock.url();
    llm::OllamaBackend backend(opts);

    for (const auto& reply : std::vector<std::pair<int, std::string>>{
             {404, R"({"error": "model 'nope' not found"})"},
             {200, R"({"error": "out of memory"})"},
             {200, "not json"},
             {200, R"({"model": "x"})"}})
    {
        mock.set_ollama_reply(reply.first, reply.second);
        bool threw = false;
        try
        {
            backend.chat("nope", {llm::Message::user("hi")}, std::nullopt);
        }
        catch (const ModelError&)
        {
            threw = true;
        }
        assert(threw);
    }

    llm::OllamaOptions dead;
    dead.host = "http://127.0.0.1:1";
    dead.timeout_ms = 2000;
    bool threw = false;
    try
    {
        llm::OllamaBackend(dead).chat("m", {llm::Message::user("hi")}, std::nullopt);
    }
    catch (const ModelError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS] HTTP, body and connection errors\n";
}

void test_openai_round_trip(MockChatServer& mock)
{
    std::cout << "Test 4: OpenAI-compatible request and reply shapes...\n";
    mock.set_openai_reply(200, R"({
        "model": "gpt-4o-mini",
        "choices": [{"index": 0, "message": {"role": "assistant", "content": null,
            "tool_calls": [{"id": "call_abc", "type": "function",
                            "function": {"name": "add", "arguments": "{\"a\": 3, \"b\": 4}"}}]}}]})");

    setenv("TOOLRELAY_TEST_OPENAI_KEY", "sk-test", 1);
    llm::OpenAICompatibleOptions opts;
    opts.base_url = mock.url();
    opts.api_key_env = "TOOLRELAY_TEST_OPENAI_KEY";
    llm::OpenAICompatibleBackend backend(opts);

    auto reply = backend.chat("gpt-4o-mini", tool_round_messages(), add_schema());
    assert(mock.last_path == "/v1/chat/completions");
    assert(mock.last_authorization == "Bearer sk-test");
    assert(mock.last_body["tools"] == add_schema());

    const Json& sent = mock.last_body["messages"];
    assert(sent[1]["content"].is_null());
    assert(sent[1]["tool_calls"][0]["type"] == "function");
    assert(sent[1]["tool_calls"][0]["id"] == "call_1");
    assert(Json::parse(sent[1]["tool_calls"][0]["function"]["arguments"].get<std::string>()) ==
           Json({{"a", 2}, {"b", 2}}));
    assert(sent[2] == Json({{"role", "tool"}, {"tool_call_id", "call_1"}, {"content", "4"}}));

    assert(!reply.content);
    assert(reply.tool_calls.size() == 1);
    assert(reply.tool_calls[0].id == "call_abc");
    assert(reply.tool_calls[0].arguments == Json({{"a", 3}, {"b", 4}}));
    assert(reply.model == "gpt-4o-mini");

    mock.set_openai_reply(500, R"({"error": {"message": "upstream"}})");
    bool threw = false;
    try
    {
        backend.chat("gpt-4o-mini", {llm::Message::user("hi")}, std::nullopt);
    }
    catch (const ModelError& e)
    {
        threw = true;
        assert(std::string(e.what()).find("500") != std::string::npos);
    }
    assert(threw);
    unsetenv("TOOLRELAY_TEST_OPENAI_KEY");
    std::cout << "  [PASS] arguments as JSON strings, bearer key sent\n";
}

void test_parse_response_edges()
{
    std::cout << "Test 5: response parsing edge cases...\n";
    auto no_content = llm::OllamaBackend::parse_response(
        {{"message", {{"role", "assistant"}}}}, "requested");
    assert(!no_content.content);
    assert(no_content.model == "requested");

    bool threw = false;
    try
    {
        llm::OpenAICompatibleBackend::parse_response({{"choices", Json::array()}}, "m");
    }
    catch (const ModelError&)
    {
        threw = true;
    }
    assert(threw);

    Json request = llm::OpenAICompatibleBackend::build_request(
        "m", {llm::Message::user("hi")}, Json::array());
    assert(!request.contains("tools"));
    std::cout << "  [PASS] edges handled\n";
}

void test_make_backend()
{
    std::cout << "Test 6: backend factory...\n";
    Settings s;
    assert(llm::make_backend(s)->name() == "ollama");
    s.backend = "openai";
    assert(llm::make_backend(s)->name() == "openai");
    s.backend = "mystery";
    bool threw = false;
    try
    {
        llm::make_backend(s);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    llm::CallbackBackend cb([](const std::string& model, const std::vector<llm::Message>&,
                               const std::optional<Json>& tools)
                            {
                                llm::ChatResponse r;
                                r.content = model + (tools ? " with tools" : " plain");
                                return r;
                            });
    assert(cb.name() == "callback");
    assert(cb.chat("m", {}, std::nullopt).content.value_or("") == "m plain");
    std::cout << "  [PASS] ollama, openai, callback\n";
}

int main()
{
    std::cout << "Running chat backend tests...\n\n";
    MockChatServer mock;

    test_ollama_request_and_tool_calls(mock);
    test_ollama_summary_call(mock);
    test_ollama_errors(mock);
    test_openai_round_trip(mock);
    test_parse_response_edges();
    test_make_backend();

    std::cout << "\nAll chat backend tests passed\n";
    return 0;
}
