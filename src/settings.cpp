#include "toolrelay/settings.hpp"

#include "toolrelay/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace toolrelay
{

static std::optional<std::string> getenv_opt(const char* key)
{
    if (const char* v = std::getenv(key); v != nullptr && v[0] != '\0')
        return std::string(v);
    return std::nullopt;
}

static int parse_int_or(const std::string& s, int defv)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        return pos == s.size() ? v : defv;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

static int require_timeout(const std::string& key, int value)
{
    if (value < 0)
        throw ValidationError("settings: '" + key + "' must be a non-negative number of ms, got " +
                              std::to_string(value));
    return value;
}

static int env_timeout(const char* key, int defv)
{
    if (auto v = getenv_opt(key))
        return require_timeout(key, parse_int_or(*v, defv));
    return defv;
}

static int json_timeout(const Json& j, const std::string& key, int defv)
{
    if (!j.contains(key))
        return defv;
    if (!j.at(key).is_number_integer())
        throw ValidationError("settings: '" + key + "' must be an integer");
    return require_timeout(key, j.at(key).get<int>());
}

static std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void Settings::merge_env()
{
    if (auto lvl = getenv_opt("TOOLRELAY_LOG_LEVEL"))
    {
        std::string upper = *lvl;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        log_level = upper;
    }
    if (auto v = getenv_opt("TOOLRELAY_BACKEND"))
        backend = *v;
    if (auto v = getenv_opt("TOOLRELAY_MODEL"))
        model = *v;

    // OLLAMA_HOST is honoured the same way the ollama client libraries do
    if (auto v = getenv_opt("OLLAMA_HOST"))
        ollama_host = *v;
    if (auto v = getenv_opt("TOOLRELAY_OLLAMA_HOST"))
        ollama_host = *v;
    if (ollama_host.find("://") == std::string::npos)
        ollama_host = "http://" + ollama_host;

    if (auto v = getenv_opt("TOOLRELAY_OPENAI_BASE_URL"))
        openai_base_url = *v;
    if (auto v = getenv_opt("TOOLRELAY_API_KEY_ENV"))
        api_key_env = *v;
    model_timeout_ms = env_timeout("TOOLRELAY_MODEL_TIMEOUT_MS", model_timeout_ms);
    request_timeout_ms = env_timeout("TOOLRELAY_REQUEST_TIMEOUT_MS", request_timeout_ms);
    handshake_timeout_ms = env_timeout("TOOLRELAY_HANDSHAKE_TIMEOUT_MS", handshake_timeout_ms);
    if (auto v = getenv_opt("TOOLRELAY_STDERR_LOG"))
        stderr_log = *v;
}

Settings Settings::from_env()
{
    Settings s;
    s.merge_env();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("backend"))
        s.backend = j.at("backend").get<std::string>();
    if (j.contains("model"))
        s.model = j.at("model").get<std::string>();
    if (j.contains("ollama_host"))
        s.ollama_host = j.at("ollama_host").get<std::string>();
    if (j.contains("openai_base_url"))
        s.openai_base_url = j.at("openai_base_url").get<std::string>();
    if (j.contains("api_key_env"))
        s.api_key_env = j.at("api_key_env").get<std::string>();
    s.model_timeout_ms = json_timeout(j, "model_timeout_ms", s.model_timeout_ms);
    s.request_timeout_ms = json_timeout(j, "request_timeout_ms", s.request_timeout_ms);
    s.handshake_timeout_ms = json_timeout(j, "handshake_timeout_ms", s.handshake_timeout_ms);
    if (j.contains("stderr_log"))
        s.stderr_log = j.at("stderr_log").get<std::string>();
    if (j.contains("runners"))
    {
        if (!j["runners"].is_object())
            throw ValidationError("settings: 'runners' must be an object of suffix -> command");
        for (auto& [suffix, command] : j["runners"].items())
            s.runners[suffix] = command.get<std::string>();
    }
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw NotFoundError("settings file not found: " + path);
    try
    {
        return from_json(Json::parse(in));
    }
    catch (const Json::exception& e)
    {
        throw ValidationError("invalid settings file '" + path + "': " + e.what());
    }
}

int load_dotenv(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        return -1;

    int count = 0;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front())
            value = value.substr(1, value.size() - 2);

        if (std::getenv(key.c_str()) != nullptr)
            continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0)
            ++count;
    }
    return count;
}

} // namespace toolrelay
