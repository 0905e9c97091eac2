#include "../internal/http_client.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/util/json.hpp"

#include <cstdlib>

namespace toolrelay::llm
{

namespace
{

std::optional<std::string> get_env(const std::string& name)
{
    if (name.empty())
        return std::nullopt;
    if (const char* v = std::getenv(name.c_str()); v != nullptr && v[0] != '\0')
        return std::string(v);
    return std::nullopt;
}

toolrelay::Json to_openai_message(const Message& m)
{
    if (m.role == Role::Tool)
    {
        return toolrelay::Json{
            {"role", "tool"},
            {"tool_call_id", m.tool_call_id.value_or("")},
            {"content", m.content},
        };
    }

    toolrelay::Json out = {{"role", to_string(m.role)}, {"content", m.content}};
    if (m.role == Role::Assistant && !m.tool_calls.empty())
    {
        toolrelay::Json calls = toolrelay::Json::array();
        for (const auto& tc : m.tool_calls)
        {
            calls.push_back(toolrelay::Json{
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments.dump()}}},
            });
        }
        out["tool_calls"] = std::move(calls);
        if (m.content.empty())
            out["content"] = nullptr;
    }
    return out;
}

} // namespace

toolrelay::Json OpenAICompatibleBackend::build_request(const std::string& model,
                                                       const std::vector<Message>& messages,
                                                       const std::optional<toolrelay::Json>& tools)
{
    toolrelay::Json wire = toolrelay::Json::array();
    for (const auto& m : messages)
        wire.push_back(to_openai_message(m));

    toolrelay::Json request = {{"model", model}, {"messages", std::move(wire)}};
    if (tools && tools->is_array() && !tools->empty())
        request["tools"] = *tools;
    return request;
}

ChatResponse OpenAICompatibleBackend::parse_response(const toolrelay::Json& body,
                                                     const std::string& requested_model)
{
    if (!body.is_object() || !body.contains("choices") || !body["choices"].is_array() ||
        body["choices"].empty())
        throw ModelError("OpenAI response missing choices");

    const auto& choice = body["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        throw ModelError("OpenAI response missing message");

    const auto& msg = choice["message"];
    ChatResponse out;
    out.model = body.value("model", requested_model);
    if (msg.contains("content") && msg["content"].is_string())
        out.content = msg["content"].get<std::string>();

    if (msg.contains("tool_calls") && msg["tool_calls"].is_array())
    {
        for (const auto& tc : msg["tool_calls"])
        {
            if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object())
                continue;
            ToolInvocation call;
            call.name = tc["function"].value("name", "");
            if (call.name.empty())
                continue;
            call.id = tc.contains("id") && tc["id"].is_string()
                          ? tc["id"].get<std::string>()
                          : "call_" + std::to_string(out.tool_calls.size() + 1);
            call.arguments = util::json::arguments_object(
                tc["function"].contains("arguments") ? tc["function"]["arguments"]
                                                     : toolrelay::Json::object());
            out.tool_calls.push_back(std::move(call));
        }
    }
    return out;
}

ChatResponse OpenAICompatibleBackend::chat(const std::string& model,
                                           const std::vector<Message>& messages,
                                           const std::optional<toolrelay::Json>& tools)
{
    OpenAICompatibleOptions opts = options_;
    if (!opts.api_key)
        opts.api_key = get_env(opts.api_key_env);

    std::vector<std::string> headers;
    headers.push_back("Content-Type: application/json");
    if (opts.api_key && !opts.api_key->empty())
        headers.push_back("Authorization: Bearer " + *opts.api_key);
    if (opts.organization)
        headers.push_back("OpenAI-Organization: " + *opts.organization);
    if (opts.project)
        headers.push_back("OpenAI-Project: " + *opts.project);

    const std::string url = http::join_url(opts.base_url, opts.endpoint_path);
    log_debug("POST " + url + " (" + std::to_string(messages.size()) + " messages" +
              (tools ? ", with tools)" : ")"));

    http::Response r = http::post_json(url, headers, build_request(model, messages, tools).dump(),
                                       opts.timeout_ms);
    if (r.status_code >= 400)
        throw ModelError("OpenAI request failed HTTP " + std::to_string(r.status_code) + ": " +
                         r.body);

    toolrelay::Json body = util::json::try_parse(r.body);
    if (body.is_discarded())
        throw ModelError("OpenAI endpoint returned a non-JSON body");
    return parse_response(body, model);
}

} // namespace toolrelay::llm
