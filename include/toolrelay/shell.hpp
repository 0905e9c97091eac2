#pragma once
/// @file shell.hpp
/// @brief Line-oriented chat front end for the orchestrator

#include "toolrelay/client/session.hpp"
#include "toolrelay/orchestrator.hpp"

#include <atomic>
#include <csignal>
#include <iosfwd>
#include <string>

namespace toolrelay
{

/// Reads one query per line and prints the orchestrator's answer.
///
/// "quit" (any case) or end of input ends the loop, blank lines are ignored
/// and "/tools" prints the provider's current catalog. Errors from a single
/// query are printed and the loop continues.
class ChatShell
{
  public:
    ChatShell(Orchestrator& orchestrator, client::Session& session, std::istream& in,
              std::ostream& out);

    /// Run until quit, end of input or stop()
    /// @return number of queries answered
    int run();

    /// Ask the loop to end before the next prompt
    void stop()
    {
        stop_ = true;
    }

    /// Flag set from a signal handler; checked between prompts
    void set_interrupt_flag(const volatile std::sig_atomic_t* flag)
    {
        interrupted_ = flag;
    }

    /// Strip leading and trailing whitespace
    static std::string trim(const std::string& text);

  private:
    bool should_stop() const;
    void print_tools();

    Orchestrator& orchestrator_;
    client::Session& session_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> stop_{false};
    const volatile std::sig_atomic_t* interrupted_ = nullptr;
};

} // namespace toolrelay
