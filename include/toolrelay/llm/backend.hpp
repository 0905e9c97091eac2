#pragma once
/// @file llm/backend.hpp
/// @brief Chat model backends used by the orchestration loop

#include "toolrelay/llm/conversation.hpp"
#include "toolrelay/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay
{
struct Settings;
}

namespace toolrelay::llm
{

/// Reply of one chat call: direct text, requested tool calls, or both
struct ChatResponse
{
    std::optional<std::string> content;
    std::vector<ToolInvocation> tool_calls;
    std::string model;

    bool has_tool_calls() const
    {
        return !tool_calls.empty();
    }
};

/// Black-box chat function.
///
/// Called with a tool schema for the decision call and without one for the
/// summary call. Implementations throw ModelError when the backend cannot
/// produce a reply.
class ChatBackend
{
  public:
    virtual ~ChatBackend() = default;

    virtual ChatResponse chat(const std::string& model, const std::vector<Message>& messages,
                              const std::optional<toolrelay::Json>& tools) = 0;

    /// Short backend identifier for logs ("ollama", "openai", ...)
    virtual std::string name() const = 0;
};

// ============================================================================
// Ollama
// ============================================================================

struct OllamaOptions
{
    std::string host = "http://localhost:11434";
    std::string endpoint_path = "/api/chat";

    /// Model parameters forwarded verbatim (temperature, num_ctx, ...)
    std::optional<toolrelay::Json> model_options;
    std::optional<std::string> keep_alive;

    int timeout_ms = 300000;
};

/// Non-streaming client for Ollama's /api/chat endpoint
class OllamaBackend : public ChatBackend
{
  public:
    explicit OllamaBackend(OllamaOptions options = {}) : options_(std::move(options)) {}

    ChatResponse chat(const std::string& model, const std::vector<Message>& messages,
                      const std::optional<toolrelay::Json>& tools) override;

    std::string name() const override
    {
        return "ollama";
    }

    /// Request body for /api/chat
    static toolrelay::Json build_request(const std::string& model,
                                         const std::vector<Message>& messages,
                                         const std::optional<toolrelay::Json>& tools);

    /// @throws ModelError when the body is not a chat reply
    static ChatResponse parse_response(const toolrelay::Json& body,
                                       const std::string& requested_model);

  private:
    OllamaOptions options_;
};

// ============================================================================
// OpenAI-compatible chat completions
// ============================================================================

struct OpenAICompatibleOptions
{
    std::string base_url = "https://api.openai.com";
    std::string endpoint_path = "/v1/chat/completions";

    std::optional<std::string> api_key;
    std::string api_key_env = "OPENAI_API_KEY";

    std::optional<std::string> organization;
    std::optional<std::string> project;

    int timeout_ms = 300000;
};

class OpenAICompatibleBackend : public ChatBackend
{
  public:
    explicit OpenAICompatibleBackend(OpenAICompatibleOptions options = {})
        : options_(std::move(options))
    {
    }

    ChatResponse chat(const std::string& model, const std::vector<Message>& messages,
                      const std::optional<toolrelay::Json>& tools) override;

    std::string name() const override
    {
        return "openai";
    }

    static toolrelay::Json build_request(const std::string& model,
                                         const std::vector<Message>& messages,
                                         const std::optional<toolrelay::Json>& tools);

    static ChatResponse parse_response(const toolrelay::Json& body,
                                       const std::string& requested_model);

  private:
    OpenAICompatibleOptions options_;
};

// ============================================================================
// Callback
// ============================================================================

/// Adapts a plain function to the ChatBackend interface
class CallbackBackend : public ChatBackend
{
  public:
    using ChatFn = std::function<ChatResponse(const std::string&, const std::vector<Message>&,
                                              const std::optional<toolrelay::Json>&)>;

    explicit CallbackBackend(ChatFn fn, std::string name = "callback")
        : fn_(std::move(fn)), name_(std::move(name))
    {
    }

    ChatResponse chat(const std::string& model, const std::vector<Message>& messages,
                      const std::optional<toolrelay::Json>& tools) override
    {
        return fn_(model, messages, tools);
    }

    std::string name() const override
    {
        return name_;
    }

  private:
    ChatFn fn_;
    std::string name_;
};

/// Build the backend named by settings.backend ("ollama" or "openai")
/// @throws ValidationError for unknown backend names
std::unique_ptr<ChatBackend> make_backend(const Settings& settings);

} // namespace toolrelay::llm
