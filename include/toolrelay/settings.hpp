#pragma once
#include "toolrelay/types.hpp"

#include <map>
#include <optional>
#include <string>

namespace toolrelay
{

struct Settings
{
    std::string log_level{"INFO"};

    // Model backend
    std::string backend{"ollama"};
    std::string model{"gpt-oss:20b"};
    std::string ollama_host{"http://localhost:11434"};
    std::string openai_base_url{"https://api.openai.com"};
    std::string api_key_env{"OPENAI_API_KEY"};
    int model_timeout_ms{300000};

    // Tool-provider session
    int request_timeout_ms{60000};
    int handshake_timeout_ms{30000};
    std::optional<std::string> stderr_log;
    /// Script suffix -> runner command used to launch the provider
    std::map<std::string, std::string> runners{{".py", "python"}, {".js", "node"}};

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);

    /// Overlay TOOLRELAY_* (and OLLAMA_HOST) environment variables onto this instance
    void merge_env();
};

/// Load KEY=VALUE pairs from a dotenv file into the process environment.
/// Variables that are already set are left untouched.
/// @return number of variables set, or -1 when the file cannot be opened
int load_dotenv(const std::string& path = ".env");

} // namespace toolrelay
