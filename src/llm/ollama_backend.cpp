#include "../internal/http_client.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/util/json.hpp"

namespace toolrelay::llm
{

toolrelay::Json OllamaBackend::build_request(const std::string& model,
                                             const std::vector<Message>& messages,
                                             const std::optional<toolrelay::Json>& tools)
{
    toolrelay::Json request = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
    };
    if (tools && tools->is_array())
        request["tools"] = *tools;
    return request;
}

ChatResponse OllamaBackend::parse_response(const toolrelay::Json& body,
                                           const std::string& requested_model)
{
    if (!body.is_object())
        throw ModelError("Ollama response is not an object");
    if (body.contains("error"))
        throw ModelError("Ollama error: " + util::json::to_text(body["error"]));
    if (!body.contains("message") || !body["message"].is_object())
        throw ModelError("Ollama response missing message");

    const auto& msg = body["message"];
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
            const auto& fn = tc["function"];
            ToolInvocation call;
            call.name = fn.value("name", "");
            if (call.name.empty())
                continue;
            call.arguments = util::json::arguments_object(
                fn.contains("arguments") ? fn["arguments"] : toolrelay::Json::object());
            call.id = tc.contains("id") && tc["id"].is_string()
                          ? tc["id"].get<std::string>()
                          : "call_" + std::to_string(out.tool_calls.size() + 1);
            out.tool_calls.push_back(std::move(call));
        }
    }
    return out;
}

ChatResponse OllamaBackend::chat(const std::string& model, const std::vector<Message>& messages,
                                 const std::optional<toolrelay::Json>& tools)
{
    toolrelay::Json request = build_request(model, messages, tools);
    if (options_.model_options)
        request["options"] = *options_.model_options;
    if (options_.keep_alive)
        request["keep_alive"] = *options_.keep_alive;

    const std::string url = http::join_url(options_.host, options_.endpoint_path);
    log_debug("POST " + url + " (" + std::to_string(messages.size()) + " messages" +
              (tools ? ", with tools)" : ")"));

    http::Response r =
        http::post_json(url, {"Content-Type: application/json"}, request.dump(), options_.timeout_ms);
    if (r.status_code >= 400)
        throw ModelError("Ollama request failed HTTP " + std::to_string(r.status_code) + ": " +
                         r.body);

    toolrelay::Json body = util::json::try_parse(r.body);
    if (body.is_discarded())
        throw ModelError("Ollama returned a non-JSON body");
    return parse_response(body, model);
}

} // namespace toolrelay::llm
