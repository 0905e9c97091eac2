#include "test_helpers.hpp"
#include "toolrelay/shell.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

static size_t count_of(const std::string& haystack, const std::string& needle)
{
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++n;
    return n;
}

void test_queries_until_quit()
{
    std::cout << "Test 1: answers queries and stops at quit...\n";
    FakeProvider provider;
    auto session = provider.make_session();
    ScriptedBackend backend;
    backend.reply_text("Hi there!");
    backend.reply_tools({invocation("add", {{"a", 2}, {"b", 2}})});
    backend.reply_text("The answer is 4.");

    Orchestrator orchestrator(*session, backend);
    std::istringstream in("  hello  \n\n   \nwhat is 2+2\nQuit\nnever asked\n");
    std::ostringstream out;
    ChatShell shell(orchestrator, *session, in, out);

    assert(shell.run() == 2);
    const std::string text = out.str();
    assert(text.find("Hi there!") != std::string::npos);
    assert(text.find("[Tool 'add' returned: 4]\n\nThe answer is 4.") != std::string::npos);
    assert(backend.calls.size() == 3);
    assert(backend.calls[0].messages[0].content == "hello");
    // prompt per line read, up to and including quit
    assert(count_of(text, "\n> ") == 5);
    std::cout << "  [PASS] blank lines skipped, quit is case-insensitive\n";
}

void test_errors_do_not_end_the_loop()
{
    std::cout << "Test 2: a failing query prints an error and continues...\n";
    FakeProvider provider;
    auto session = provider.make_session();
    ScriptedBackend backend;
    backend.fail_with("model offline");
    backend.reply_text("Back online.");

    Orchestrator orchestrator(*session, backend);
    std::istringstream in("first\nsecond\n");
    std::ostringstream out;
    ChatShell shell(orchestrator, *session, in, out);

    assert(shell.run() == 1);
    assert(out.str().find("Error: model offline") != std::string::npos);
    assert(out.str().find("Back online.") != std::string::npos);
    std::cout << "  [PASS] error reported, loop continued until EOF\n";
}

void test_tools_command()
{
    std::cout << "Test 3: /tools prints the catalog without a model call...\n";
    FakeProvider provider;
    auto session = provider.make_session();
    ScriptedBackend backend;

    Orchestrator orchestrator(*session, backend);
    std::istringstream in("/tools\n");
    std::ostringstream out;
    ChatShell shell(orchestrator, *session, in, out);

    assert(shell.run() == 0);
    assert(out.str().find("  add - Add two numbers") != std::string::npos);
    assert(out.str().find("  stats\n") != std::string::npos);
    assert(backend.calls.empty());
    std::cout << "  [PASS] catalog listed\n";
}

void test_interrupt_flag_and_stop()
{
    std::cout << "Test 4: interrupt flag and stop() end the loop...\n";
    FakeProvider provider;
    auto session = provider.make_session();
    ScriptedBackend backend;
    Orchestrator orchestrator(*session, backend);

    volatile std::sig_atomic_t interrupted = 1;
    std::istringstream in("hello\n");
    std::ostringstream out;
    ChatShell shell(orchestrator, *session, in, out);
    shell.set_interrupt_flag(&interrupted);
    assert(shell.run() == 0);
    assert(backend.calls.empty());

    std::istringstream in2("hello\n");
    ChatShell stopped(orchestrator, *session, in2, out);
    stopped.stop();
    assert(stopped.run() == 0);
    assert(backend.calls.empty());
    std::cout << "  [PASS] no query issued\n";
}

void test_trim()
{
    std::cout << "Test 5: trim...\n";
    assert(ChatShell::trim("  a b \t\r") == "a b");
    assert(ChatShell::trim("   ").empty());
    assert(ChatShell::trim("").empty());
    std::cout << "  [PASS] whitespace stripped\n";
}

int main()
{
    std::cout << "Running shell tests...\n\n";
    set_log_level(LogLevel::Error);

    test_queries_until_quit();
    test_errors_do_not_end_the_loop();
    test_tools_command();
    test_interrupt_flag_and_stop();
    test_trim();

    std::cout << "\nAll shell tests passed\n";
    return 0;
}
