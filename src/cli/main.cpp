#include "toolrelay/client/session.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/orchestrator.hpp"
#include "toolrelay/settings.hpp"
#include "toolrelay/shell.hpp"
#include "toolrelay/version.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>
#include <vector>

namespace
{

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_signal(int)
{
    g_interrupted = 1;
}

// No SA_RESTART: a blocked read on stdin returns so the shell can exit
void install_signal_handlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int usage(int exit_code = 1)
{
    std::ostream& out = exit_code == 0 ? std::cout : std::cerr;
    out << "toolrelay " << toolrelay::VERSION_STRING << "\n";
    out << "Usage:\n";
    out << "  toolrelay [options] <path_to_server_script.py|js>\n";
    out << "\n";
    out << "Options:\n";
    out << "  --model <name>             Chat model (default gpt-oss:20b)\n";
    out << "  --backend <ollama|openai>  Model backend (default ollama)\n";
    out << "  --host <url>               Ollama host or OpenAI-compatible base URL\n";
    out << "  --config <file.json>       Load settings from a JSON file\n";
    out << "  --env-file <path>          Load variables from a dotenv file (default .env)\n";
    out << "  --tool-timeout-ms <n>      Deadline for each tool call (0 = none)\n";
    out << "  --model-timeout-ms <n>     Deadline for each model call (0 = none)\n";
    out << "  --stderr-log <path>        Append the provider's stderr to this file\n";
    out << "  --log-level <level>        DEBUG, INFO, WARNING or ERROR\n";
    out << "  --help                     Show this message\n";
    return exit_code;
}

std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                              const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

int parse_timeout(const std::string& flag, const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos == s.size() && v >= 0)
            return v;
    }
    catch (const std::logic_error&)
    {
        // reported below
    }
    throw toolrelay::ValidationError(flag + " expects a non-negative integer, got '" + s + "'");
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    toolrelay::Settings settings;
    try
    {
        std::string env_file = consume_flag_value(args, "--env-file").value_or(".env");
        toolrelay::load_dotenv(env_file);

        if (auto config = consume_flag_value(args, "--config"))
            settings = toolrelay::Settings::from_file(*config);
        settings.merge_env();

        if (auto v = consume_flag_value(args, "--model"))
            settings.model = *v;
        if (auto v = consume_flag_value(args, "--backend"))
            settings.backend = *v;
        if (auto v = consume_flag_value(args, "--host"))
        {
            if (settings.backend == "openai")
                settings.openai_base_url = *v;
            else
                settings.ollama_host = *v;
        }
        if (auto v = consume_flag_value(args, "--tool-timeout-ms"))
            settings.request_timeout_ms = parse_timeout("--tool-timeout-ms", *v);
        if (auto v = consume_flag_value(args, "--model-timeout-ms"))
            settings.model_timeout_ms = parse_timeout("--model-timeout-ms", *v);
        if (auto v = consume_flag_value(args, "--stderr-log"))
            settings.stderr_log = *v;
        if (auto v = consume_flag_value(args, "--log-level"))
            settings.log_level = *v;
    }
    catch (const toolrelay::Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return usage();
    }

    toolrelay::set_log_level(toolrelay::parse_log_level(settings.log_level));

    if (args.size() != 1 || args[0].empty() || args[0][0] == '-')
        return usage();
    const std::string script = args[0];

    auto session_options = toolrelay::client::SessionOptions::from_settings(settings);
    try
    {
        toolrelay::client::Session::resolve_runner(script, session_options.runners);
    }
    catch (const toolrelay::UnsupportedScriptKind& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return usage();
    }

    install_signal_handlers();

    std::unique_ptr<toolrelay::llm::ChatBackend> backend;
    std::unique_ptr<toolrelay::client::Session> session;
    try
    {
        backend = toolrelay::llm::make_backend(settings);
        toolrelay::log_info("Client initialized to use " + backend->name() + " model: '" +
                            settings.model + "'");
        session = toolrelay::client::Session::connect(script, session_options);
    }
    catch (const toolrelay::Error& e)
    {
        toolrelay::log_error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    toolrelay::OrchestratorOptions orchestrator_options;
    orchestrator_options.model = settings.model;
    toolrelay::Orchestrator orchestrator(*session, *backend, orchestrator_options);

    toolrelay::ChatShell shell(orchestrator, *session, std::cin, std::cout);
    shell.set_interrupt_flag(&g_interrupted);
    shell.run();

    toolrelay::log_info("Cleaning up resources and shutting down.");
    session->close();
    return 0;
}
