#include "toolrelay/exceptions.hpp"
#include "toolrelay/settings.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace toolrelay;
namespace fs = std::filesystem;

static fs::path temp_file(const std::string& name, const std::string& contents)
{
    fs::path p = fs::temp_directory_path() /
                 ("toolrelay_settings_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream out(p);
    out << contents;
    return p;
}

static void clear_env()
{
    for (const char* key :
         {"TOOLRELAY_LOG_LEVEL", "TOOLRELAY_BACKEND", "TOOLRELAY_MODEL", "OLLAMA_HOST",
          "TOOLRELAY_OLLAMA_HOST", "TOOLRELAY_OPENAI_BASE_URL", "TOOLRELAY_API_KEY_ENV",
          "TOOLRELAY_MODEL_TIMEOUT_MS", "TOOLRELAY_REQUEST_TIMEOUT_MS",
          "TOOLRELAY_HANDSHAKE_TIMEOUT_MS", "TOOLRELAY_STDERR_LOG"})
        unsetenv(key);
}

void test_defaults()
{
    std::cout << "Test 1: defaults...\n";
    clear_env();
    Settings s = Settings::from_env();
    assert(s.log_level == "INFO");
    assert(s.backend == "ollama");
    assert(s.model == "gpt-oss:20b");
    assert(s.ollama_host == "http://localhost:11434");
    assert(s.request_timeout_ms == 60000);
    assert(s.handshake_timeout_ms == 30000);
    assert(s.model_timeout_ms == 300000);
    assert(!s.stderr_log);
    assert(s.runners.at(".py") == "python");
    assert(s.runners.at(".js") == "node");
    std::cout << "  [PASS] defaults\n";
}

void test_env_overrides()
{
    std::cout << "Test 2: environment overrides...\n";
    clear_env();
    setenv("TOOLRELAY_LOG_LEVEL", "debug", 1);
    setenv("TOOLRELAY_MODEL", "qwen3:1.7b", 1);
    setenv("OLLAMA_HOST", "gpu-box:11434", 1);
    setenv("TOOLRELAY_REQUEST_TIMEOUT_MS", "1500", 1);
    setenv("TOOLRELAY_HANDSHAKE_TIMEOUT_MS", "not-a-number", 1);
    setenv("TOOLRELAY_STDERR_LOG", "/tmp/provider.log", 1);

    Settings s = Settings::from_env();
    assert(s.log_level == "DEBUG");
    assert(s.model == "qwen3:1.7b");
    assert(s.ollama_host == "http://gpu-box:11434");
    assert(s.request_timeout_ms == 1500);
    assert(s.handshake_timeout_ms == 30000);
    assert(s.stderr_log.value_or("") == "/tmp/provider.log");

    // Tool-specific host wins over OLLAMA_HOST
    setenv("TOOLRELAY_OLLAMA_HOST", "https://ollama.internal", 1);
    assert(Settings::from_env().ollama_host == "https://ollama.internal");
    clear_env();
    std::cout << "  [PASS] env applied\n";
}

void test_from_json_and_file()
{
    std::cout << "Test 3: JSON settings and files...\n";
    Json j = {{"backend", "openai"},
              {"model", "gpt-4o-mini"},
              {"request_timeout_ms", 0},
              {"runners", {{".ts", "deno"}}}};
    Settings s = Settings::from_json(j);
    assert(s.backend == "openai");
    assert(s.model == "gpt-4o-mini");
    assert(s.request_timeout_ms == 0);
    assert(s.runners.at(".ts") == "deno");
    assert(s.runners.at(".py") == "python");

    bool threw = false;
    try
    {
        Settings::from_json({{"runners", "python"}});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    fs::path good = temp_file("good.json", R"({"model": "llama3.2", "log_level": "WARNING"})");
    Settings from_file = Settings::from_file(good.string());
    assert(from_file.model == "llama3.2");
    assert(from_file.log_level == "WARNING");

    fs::path bad = temp_file("bad.json", "{not json");
    threw = false;
    try
    {
        Settings::from_file(bad.string());
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        Settings::from_file("/nonexistent/toolrelay.json");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);

    fs::remove(good);
    fs::remove(bad);
    std::cout << "  [PASS] JSON parsed, errors typed\n";
}

void test_load_dotenv()
{
    std::cout << "Test 4: dotenv loading...\n";
    unsetenv("TOOLRELAY_DOTENV_A");
    unsetenv("TOOLRELAY_DOTENV_B");
    unsetenv("TOOLRELAY_DOTENV_C");
    setenv("TOOLRELAY_DOTENV_KEEP", "original", 1);

    fs::path env = temp_file(".env", "# comment\n"
                                      "\n"
                                      "TOOLRELAY_DOTENV_A=plain\n"
                                      "export TOOLRELAY_DOTENV_B = \"quoted value\"\n"
                                      "TOOLRELAY_DOTENV_C='single'\n"
                                      "TOOLRELAY_DOTENV_KEEP=replaced\n"
                                      "no equals sign\n");
    int count = load_dotenv(env.string());
    assert(count == 3);
    assert(std::string(std::getenv("TOOLRELAY_DOTENV_A")) == "plain");
    assert(std::string(std::getenv("TOOLRELAY_DOTENV_B")) == "quoted value");
    assert(std::string(std::getenv("TOOLRELAY_DOTENV_C")) == "single");
    assert(std::string(std::getenv("TOOLRELAY_DOTENV_KEEP")) == "original");

    assert(load_dotenv("/nonexistent/.env") == -1);
    fs::remove(env);
    std::cout << "  [PASS] dotenv never overrides existing variables\n";
}

void test_negative_timeouts_rejected()
{
    std::cout << "Test 5: negative timeouts are rejected...\n";
    for (const char* key : {"TOOLRELAY_MODEL_TIMEOUT_MS", "TOOLRELAY_REQUEST_TIMEOUT_MS",
                            "TOOLRELAY_HANDSHAKE_TIMEOUT_MS"})
    {
        clear_env();
        setenv(key, "-1", 1);
        bool threw = false;
        try
        {
            Settings::from_env();
        }
        catch (const ValidationError& e)
        {
            threw = true;
            assert(std::string(e.what()).find(key) != std::string::npos);
        }
        assert(threw);
    }
    clear_env();

    for (const char* key : {"model_timeout_ms", "request_timeout_ms", "handshake_timeout_ms"})
    {
        for (const Json& value : {Json(-250), Json("100"), Json(1.5)})
        {
            bool threw = false;
            try
            {
                Settings::from_json({{key, value}});
            }
            catch (const ValidationError&)
            {
                threw = true;
            }
            assert(threw);
        }
    }

    // Zero still means no deadline
    setenv("TOOLRELAY_REQUEST_TIMEOUT_MS", "0", 1);
    assert(Settings::from_env().request_timeout_ms == 0);
    clear_env();

    // Non-ASCII bytes in the level survive upper-casing
    setenv("TOOLRELAY_LOG_LEVEL", "inf\xc3\xb6", 1);
    assert(Settings::from_env().log_level == "INF\xc3\xb6");
    clear_env();
    std::cout << "  [PASS] ValidationError for negative or non-integer values\n";
}

int main()
{
    std::cout << "Running settings tests...\n\n";
    test_defaults();
    test_env_overrides();
    test_from_json_and_file();
    test_load_dotenv();
    test_negative_timeouts_rejected();
    std::cout << "\nAll settings tests passed\n";
    return 0;
}
