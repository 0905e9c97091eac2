#include "toolrelay/orchestrator.hpp"

#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/catalog.hpp"
#include "toolrelay/logging.hpp"

namespace toolrelay
{

Orchestrator::Orchestrator(client::Session& session, llm::ChatBackend& backend,
                           OrchestratorOptions options)
    : session_(session), backend_(backend), options_(std::move(options))
{
}

llm::ChatResponse Orchestrator::call_model(const llm::Conversation& conversation,
                                           const std::optional<toolrelay::Json>& tools,
                                           const char* stage)
{
    try
    {
        return backend_.chat(options_.model, conversation.snapshot(), tools);
    }
    catch (const ModelError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ModelError(std::string(stage) + " call to " + backend_.name() + " failed: " +
                         e.what());
    }
}

QueryResult Orchestrator::run(const std::string& query)
{
    if (query.empty())
        throw ValidationError("query must not be empty");

    QueryResult result;
    result.conversation.append(llm::Message::user(query));

    toolrelay::Json tools;
    try
    {
        tools = llm::adapt_tools(session_.list_tools());
    }
    catch (const Error& e)
    {
        throw ToolListingError(std::string("failed to list tools: ") + e.what());
    }

    log_info("Sending initial query to " + backend_.name() + ": '" + query + "'");
    llm::ChatResponse decision = call_model(result.conversation, tools, "decision");
    ++result.model_calls;

    // Tool calls win over direct content when a reply carries both
    result.conversation.append(
        llm::Message::assistant(decision.content.value_or(""), decision.tool_calls));

    if (!decision.has_tool_calls())
    {
        log_info("Model provided a direct text response.");
        result.output = decision.content ? *decision.content : options_.empty_reply_placeholder;
        return result;
    }

    log_info("Model requested " + std::to_string(decision.tool_calls.size()) +
             " tool call(s). Executing now.");
    for (const auto& call : decision.tool_calls)
    {
        log_info("Calling tool '" + call.name + "' with args: " + call.arguments.dump());
        client::ToolOutcome outcome = session_.call_tool(call.name, call.arguments);

        if (outcome.ok())
        {
            std::string text = outcome.text();
            result.reports.push_back("[Tool '" + call.name + "' returned: " + text + "]");
            result.conversation.append(llm::Message::tool(std::move(text), call.name, call.id));
        }
        else
        {
            std::string message = "Error calling tool '" + call.name + "': " + outcome.error;
            log_error(message);
            result.reports.push_back("[" + message + "]");
            result.conversation.append(llm::Message::tool(std::move(message), call.name, call.id));
        }
    }

    log_info("Tools executed. Sending tool results back for a final response.");
    llm::ChatResponse summary = call_model(result.conversation, std::nullopt, "summary");
    ++result.model_calls;

    const std::string summary_text = summary.content.value_or("");
    log_debug("Final model response: " + summary_text);
    result.conversation.append(llm::Message::assistant(summary_text));

    std::string reports;
    for (const auto& line : result.reports)
    {
        if (!reports.empty())
            reports += "\n";
        reports += line;
    }
    result.output = reports + "\n\n" + summary_text;
    return result;
}

} // namespace toolrelay
