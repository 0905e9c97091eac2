#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace
{

struct CommandResult
{
    int exit_code = -1;
    std::string output;
};

static CommandResult run_capture(const std::string& command)
{
    CommandResult result;

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        result.exit_code = -1;
        result.output = "failed to spawn command";
        return result;
    }

    std::ostringstream oss;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
        oss << buffer;

    int rc = pclose(pipe);
    if (WIFEXITED(rc))
        result.exit_code = WEXITSTATUS(rc);
    else
        result.exit_code = rc;

    result.output = oss.str();
    return result;
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

static int expect(const std::string& name, const CommandResult& r, int expected_exit,
                  const std::string& expected_substr)
{
    if (r.exit_code != expected_exit)
    {
        std::cerr << "[FAIL] " << name << ": exit_code=" << r.exit_code
                  << " expected=" << expected_exit << "\n"
                  << r.output << "\n";
        return 1;
    }
    if (!contains(r.output, expected_substr))
    {
        std::cerr << "[FAIL] " << name << ": expected output to contain: " << expected_substr
                  << "\n"
                  << r.output << "\n";
        return 1;
    }
    std::cout << "  [PASS] " << name << "\n";
    return 0;
}

} // namespace

int main()
{
    std::cout << "Running CLI tests...\n\n";

    const std::filesystem::path exe = TOOLRELAY_CLI_PATH;
    if (!std::filesystem::exists(exe))
    {
        std::cerr << "[FAIL] toolrelay executable not found: " << exe.string() << "\n";
        return 1;
    }

    // No dotenv lookup in the working directory; stderr captured for usage text
    const std::string base = "\"" + exe.string() + "\" --env-file /nonexistent/.env";
    const std::string redir = " 2>&1";

    int failures = 0;

    std::cout << "Test 1: missing script path prints usage...\n";
    failures += expect("no arguments", run_capture(base + redir), 1, "Usage:");

    std::cout << "Test 2: unsupported script suffix prints usage...\n";
    {
        auto r = run_capture(base + " foo.txt" + redir);
        failures += expect("foo.txt rejected", r, 1, "Usage:");
        failures += expect("suffix named in error", r, 1, "Server script must be one of");
    }

    std::cout << "Test 3: --help exits cleanly...\n";
    failures += expect("--help", run_capture(base + " --help" + redir), 0, "Usage:");
    failures += expect("-h", run_capture(base + " -h" + redir), 0, "--tool-timeout-ms");

    std::cout << "Test 4: too many arguments prints usage...\n";
    failures += expect("two scripts", run_capture(base + " a.py b.py" + redir), 1, "Usage:");

    std::cout << "Test 5: negative timeouts are rejected...\n";
    failures += expect("negative flag", run_capture(base + " --tool-timeout-ms -5 calc.py" + redir),
                       1, "non-negative");
    failures += expect(
        "negative environment value",
        run_capture("TOOLRELAY_REQUEST_TIMEOUT_MS=-1 " + base + " calc.py" + redir), 1,
        "non-negative");

    if (failures != 0)
    {
        std::cerr << "\n" << failures << " CLI check(s) failed\n";
        return 1;
    }
    std::cout << "\nAll CLI tests passed\n";
    return 0;
}
