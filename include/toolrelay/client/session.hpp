#pragma once
/// @file client/session.hpp
/// @brief Initialized channel to a single tool-provider process

#include "toolrelay/client/transports.hpp"
#include "toolrelay/client/types.hpp"
#include "toolrelay/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay
{
struct Settings;
}

namespace toolrelay::client
{

struct SessionOptions
{
    /// Deadline for tools/list and tools/call replies (0 = wait forever)
    std::chrono::milliseconds request_timeout{60000};
    /// Deadline for the initialize reply
    std::chrono::milliseconds handshake_timeout{30000};

    /// Script suffix -> runner command
    std::map<std::string, std::string> runners{{".py", "python"}, {".js", "node"}};

    /// Append provider stderr to this file instead of the terminal
    std::optional<std::string> stderr_log;

    std::string client_name{"toolrelay"};

    static SessionOptions from_settings(const Settings& settings);
};

/// Session with one tool provider.
///
/// The session exclusively owns its transport. It must be initialized before
/// any catalog listing or tool call, and close() (also run by the destructor)
/// terminates the provider.
///
/// Example usage:
/// @code
/// auto session = Session::connect("servers/calculator.py");
/// for (const auto& tool : session->list_tools())
///     std::cout << tool.name << "\n";
/// auto outcome = session->call_tool("add", {{"a", 2}, {"b", 2}});
/// std::cout << outcome.text() << "\n";
/// @endcode
class Session
{
  public:
    explicit Session(std::unique_ptr<ITransport> transport, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Launch the provider script with the runner mapped from its suffix,
    /// perform the handshake and fetch the initial catalog.
    /// @throws UnsupportedScriptKind if the suffix has no runner
    /// @throws ProcessLaunchError if the subprocess cannot be started
    /// @throws HandshakeError if initialization does not complete
    static std::unique_ptr<Session> connect(const std::string& script_path,
                                            const SessionOptions& options = {});

    /// Runner command for a provider script
    /// @throws UnsupportedScriptKind if the suffix has no runner
    static std::string resolve_runner(const std::string& script_path,
                                      const std::map<std::string, std::string>& runners);

    /// One-time initialize handshake. Subsequent calls return the cached info.
    /// @throws HandshakeError
    const ServerInfo& initialize();

    /// Fetch the current catalog (one or more tools/list round trips)
    /// @throws SessionClosed when the session is closed or not initialized
    /// @throws TransportError, ValidationError when listing fails
    std::vector<ToolDescriptor> list_tools();

    /// Invoke one tool. Never throws for tool-level problems: unknown names,
    /// provider errors, timeouts and broken channels become failure outcomes.
    ToolOutcome call_tool(const std::string& name, const toolrelay::Json& arguments);

    bool ping();

    /// Terminate the provider and release the transport. Idempotent.
    void close();

    bool is_open() const;
    bool is_initialized() const
    {
        return initialized_;
    }
    const ServerInfo& server_info() const
    {
        return server_info_;
    }

  private:
    void require_ready(const char* operation) const;

    std::unique_ptr<ITransport> transport_;
    SessionOptions options_;
    ServerInfo server_info_;
    bool initialized_ = false;
    bool closed_ = false;

    // Catalog from the most recent listing, used to validate call names
    std::map<std::string, ToolDescriptor> catalog_;
    bool catalog_known_ = false;
};

} // namespace toolrelay::client
