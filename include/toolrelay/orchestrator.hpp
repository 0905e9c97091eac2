#pragma once
/// @file orchestrator.hpp
/// @brief Query loop delegating work from a chat model to provider tools

#include "toolrelay/client/session.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/llm/conversation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolrelay
{

struct OrchestratorOptions
{
    std::string model{"gpt-oss:20b"};

    /// Returned when the decision call answers directly with no text
    std::string empty_reply_placeholder{"Sorry, I received no content."};
};

/// Everything one query produced
struct QueryResult
{
    std::string output;
    llm::Conversation conversation;
    int model_calls = 0;
    /// One line per tool invocation, in invocation order
    std::vector<std::string> reports;
};

/// Runs one query at a time against a connected session.
///
/// Each query lists the provider's tools, asks the model whether to call any,
/// runs the requested calls in order and asks the model once more for a
/// summary. A failing tool becomes part of the conversation instead of
/// aborting the query.
///
/// Example usage:
/// @code
/// auto session = client::Session::connect("calculator.py");
/// llm::OllamaBackend backend;
/// Orchestrator orchestrator(*session, backend);
/// std::cout << orchestrator.process_query("what is 2+2") << "\n";
/// @endcode
class Orchestrator
{
  public:
    Orchestrator(client::Session& session, llm::ChatBackend& backend,
                 OrchestratorOptions options = {});

    /// @throws ValidationError for an empty query
    /// @throws ToolListingError when the catalog cannot be fetched
    /// @throws ModelError when the decision or summary call fails
    QueryResult run(const std::string& query);

    /// Combined user-facing text of run()
    std::string process_query(const std::string& query)
    {
        return run(query).output;
    }

    const OrchestratorOptions& options() const
    {
        return options_;
    }

  private:
    llm::ChatResponse call_model(const llm::Conversation& conversation,
                                 const std::optional<toolrelay::Json>& tools, const char* stage);

    client::Session& session_;
    llm::ChatBackend& backend_;
    OrchestratorOptions options_;
};

} // namespace toolrelay
