#include "toolrelay/shell.hpp"

#include "toolrelay/exceptions.hpp"
#include "toolrelay/logging.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace toolrelay
{

ChatShell::ChatShell(Orchestrator& orchestrator, client::Session& session, std::istream& in,
                     std::ostream& out)
    : orchestrator_(orchestrator), session_(session), in_(in), out_(out)
{
}

std::string ChatShell::trim(const std::string& text)
{
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool ChatShell::should_stop() const
{
    return stop_ || (interrupted_ != nullptr && *interrupted_ != 0);
}

void ChatShell::print_tools()
{
    auto tools = session_.list_tools();
    if (tools.empty())
    {
        out_ << "No tools available.\n";
        return;
    }
    for (const auto& t : tools)
    {
        out_ << "  " << t.name;
        if (!t.description.empty())
            out_ << " - " << t.description;
        out_ << "\n";
    }
}

int ChatShell::run()
{
    log_info("Type your queries below or enter 'quit' to exit.");

    int answered = 0;
    std::string line;
    while (!should_stop())
    {
        out_ << "\n> " << std::flush;
        if (!std::getline(in_, line) || should_stop())
        {
            out_ << "\n";
            break;
        }

        std::string query = trim(line);
        std::string lowered = query;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "quit")
            break;
        if (query.empty())
            continue;

        try
        {
            if (query == "/tools")
            {
                print_tools();
                continue;
            }
            out_ << "\n" << orchestrator_.process_query(query) << "\n" << std::flush;
            ++answered;
        }
        catch (const Error& e)
        {
            log_error(std::string("Query failed: ") + e.what());
            out_ << "Error: " << e.what() << "\n" << std::flush;
        }
    }

    log_info("Exiting client. Goodbye!");
    return answered;
}

} // namespace toolrelay
