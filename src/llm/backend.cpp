#include "toolrelay/llm/backend.hpp"

#include "toolrelay/exceptions.hpp"
#include "toolrelay/settings.hpp"

namespace toolrelay::llm
{

std::unique_ptr<ChatBackend> make_backend(const Settings& settings)
{
    if (settings.backend == "ollama")
    {
        OllamaOptions opts;
        opts.host = settings.ollama_host;
        opts.timeout_ms = settings.model_timeout_ms;
        return std::make_unique<OllamaBackend>(std::move(opts));
    }
    if (settings.backend == "openai")
    {
        OpenAICompatibleOptions opts;
        opts.base_url = settings.openai_base_url;
        opts.api_key_env = settings.api_key_env;
        opts.timeout_ms = settings.model_timeout_ms;
        return std::make_unique<OpenAICompatibleBackend>(std::move(opts));
    }
    throw ValidationError("Unknown model backend '" + settings.backend +
                          "' (expected 'ollama' or 'openai')");
}

} // namespace toolrelay::llm
