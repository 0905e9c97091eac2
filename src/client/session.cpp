#include "toolrelay/client/session.hpp"

#include "../internal/process.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/settings.hpp"
#include "toolrelay/util/json.hpp"
#include "toolrelay/version.hpp"

#include <filesystem>
#include <set>

namespace toolrelay::client
{

namespace
{

// Null means "no arguments"; JSON text holding an object is accepted as well
std::optional<toolrelay::Json> normalize_arguments(const toolrelay::Json& arguments)
{
    if (arguments.is_null())
        return toolrelay::Json::object();
    if (arguments.is_object())
        return arguments;
    if (arguments.is_string())
    {
        toolrelay::Json parsed = util::json::try_parse(arguments.get<std::string>());
        if (parsed.is_object())
            return parsed;
    }
    return std::nullopt;
}

} // namespace

SessionOptions SessionOptions::from_settings(const Settings& settings)
{
    SessionOptions o;
    o.request_timeout = std::chrono::milliseconds{settings.request_timeout_ms};
    o.handshake_timeout = std::chrono::milliseconds{settings.handshake_timeout_ms};
    o.runners = settings.runners;
    o.stderr_log = settings.stderr_log;
    return o;
}

Session::Session(std::unique_ptr<ITransport> transport, SessionOptions options)
    : transport_(std::move(transport)), options_(std::move(options))
{
    if (!transport_)
        throw ValidationError("Session requires a transport");
}

Session::~Session()
{
    close();
}

std::string Session::resolve_runner(const std::string& script_path,
                                    const std::map<std::string, std::string>& runners)
{
    std::string suffix = std::filesystem::path(script_path).extension().string();
    auto it = runners.find(suffix);
    if (suffix.empty() || it == runners.end())
    {
        std::string known;
        for (const auto& [ext, runner] : runners)
            known += (known.empty() ? "" : ", ") + ext;
        throw UnsupportedScriptKind("Server script must be one of [" + known + "]: '" +
                                    script_path + "'");
    }
    return it->second;
}

std::unique_ptr<Session> Session::connect(const std::string& script_path,
                                          const SessionOptions& options)
{
    const std::string runner = resolve_runner(script_path, options.runners);

    if (!std::filesystem::exists(script_path))
        throw ProcessLaunchError("Server script not found: '" + script_path + "'");
    if (!process::find_executable(runner))
        throw ProcessLaunchError("Runner '" + runner + "' not found in PATH");

    StdioTransportOptions topts;
    topts.stderr_path = options.stderr_log;
    auto transport = std::make_unique<StdioTransport>(runner, std::vector<std::string>{script_path},
                                                      std::move(topts));

    log_info("Starting server: '" + transport->command_line() + "'");
    try
    {
        transport->start();
    }
    catch (const TransportError& e)
    {
        throw ProcessLaunchError(e.what());
    }

    auto session = std::make_unique<Session>(std::move(transport), options);
    session->initialize();

    std::vector<ToolDescriptor> tools;
    try
    {
        tools = session->list_tools();
    }
    catch (const Error& e)
    {
        throw HandshakeError(std::string("initial tools/list failed: ") + e.what());
    }

    std::string names;
    for (const auto& t : tools)
        names += (names.empty() ? "" : ", ") + t.name;
    log_info("Connected to server '" + session->server_info().name + "' with tools: [" + names +
             "]");
    return session;
}

const ServerInfo& Session::initialize()
{
    if (initialized_)
        return server_info_;
    if (closed_ || !transport_->is_open())
        throw HandshakeError("cannot initialize a closed session");

    toolrelay::Json payload = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", toolrelay::Json::object()},
        {"clientInfo", {{"name", options_.client_name}, {"version", VERSION_STRING}}},
    };

    toolrelay::Json result;
    try
    {
        result = transport_->request("initialize", payload, options_.handshake_timeout);
    }
    catch (const TransportError& e)
    {
        throw HandshakeError(std::string("initialize failed: ") + e.what());
    }

    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result["protocolVersion"].is_string())
        throw HandshakeError("initialize reply is missing protocolVersion");

    ServerInfo info;
    info.protocol_version = result["protocolVersion"].get<std::string>();
    if (result.contains("serverInfo") && result["serverInfo"].is_object())
    {
        info.name = result["serverInfo"].value("name", "");
        info.version = result["serverInfo"].value("version", "");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object())
        info.capabilities = result["capabilities"];
    if (result.contains("instructions") && result["instructions"].is_string())
        info.instructions = result["instructions"].get<std::string>();

    if (info.protocol_version != PROTOCOL_VERSION)
        log_warning("Provider negotiated protocol " + info.protocol_version + " (requested " +
                    PROTOCOL_VERSION + ")");

    try
    {
        transport_->notify("notifications/initialized", toolrelay::Json::object());
    }
    catch (const TransportError& e)
    {
        throw HandshakeError(std::string("initialized notification failed: ") + e.what());
    }

    server_info_ = std::move(info);
    initialized_ = true;
    return server_info_;
}

bool Session::is_open() const
{
    return !closed_ && transport_ && transport_->is_open();
}

void Session::require_ready(const char* operation) const
{
    if (!is_open())
        throw SessionClosed(std::string(operation) + " called on a closed session");
    if (!initialized_)
        throw SessionClosed(std::string(operation) + " called before initialize");
}

std::vector<ToolDescriptor> Session::list_tools()
{
    require_ready("list_tools");

    std::vector<ToolDescriptor> tools;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;
    do
    {
        toolrelay::Json payload = toolrelay::Json::object();
        if (cursor)
            payload["cursor"] = *cursor;

        toolrelay::Json response = transport_->request("tools/list", payload,
                                                       options_.request_timeout);
        if (!response.contains("tools") || !response["tools"].is_array())
            throw ValidationError("tools/list response missing 'tools' array");

        try
        {
            for (const auto& t : response["tools"])
                tools.push_back(t.get<ToolDescriptor>());
        }
        catch (const toolrelay::Json::exception& e)
        {
            throw ValidationError(std::string("malformed tool descriptor: ") + e.what());
        }

        cursor.reset();
        if (response.contains("nextCursor") && response["nextCursor"].is_string())
        {
            std::string next = response["nextCursor"].get<std::string>();
            if (!next.empty() && seen_cursors.insert(next).second)
                cursor = next;
        }
    } while (cursor);

    catalog_.clear();
    for (const auto& t : tools)
        catalog_[t.name] = t;
    catalog_known_ = true;

    return tools;
}

ToolOutcome Session::call_tool(const std::string& name, const toolrelay::Json& arguments)
{
    if (!is_open())
        return ToolOutcome::failure("session is closed");
    if (!initialized_)
        return ToolOutcome::failure("session is not initialized");
    if (catalog_known_ && catalog_.find(name) == catalog_.end())
        return ToolOutcome::failure("Unknown tool: '" + name + "'");

    auto args = normalize_arguments(arguments);
    if (!args)
        return ToolOutcome::failure("arguments for '" + name + "' must be an object");

    toolrelay::Json response;
    try
    {
        response = transport_->request("tools/call", {{"name", name}, {"arguments", *args}},
                                       options_.request_timeout);
    }
    catch (const RequestTimeoutError& e)
    {
        return ToolOutcome::failure(e.what());
    }
    catch (const RpcError& e)
    {
        return ToolOutcome::failure(e.what());
    }
    catch (const TransportError& e)
    {
        return ToolOutcome::failure(std::string("transport error: ") + e.what());
    }
    catch (const toolrelay::Json::exception& e)
    {
        return ToolOutcome::failure(std::string("malformed tools/call response: ") + e.what());
    }

    try
    {
        std::vector<ContentBlock> content;
        if (response.contains("content") && response["content"].is_array())
            for (const auto& c : response["content"])
                content.push_back(parse_content_block(c));

        std::optional<toolrelay::Json> structured;
        if (response.contains("structuredContent") && !response["structuredContent"].is_null())
            structured = response["structuredContent"];

        if (response.value("isError", false))
        {
            std::string message = ToolOutcome::success(content).text();
            return ToolOutcome::failure(message.empty() ? "Tool call failed" : message);
        }
        if (content.empty() && !structured)
            return ToolOutcome::failure("tools/call response missing content");

        return ToolOutcome::success(std::move(content), std::move(structured));
    }
    catch (const toolrelay::Json::exception& e)
    {
        return ToolOutcome::failure(std::string("malformed tools/call response: ") + e.what());
    }
}

bool Session::ping()
{
    if (!is_open())
        return false;
    try
    {
        transport_->request("ping", toolrelay::Json::object(), options_.request_timeout);
        return true;
    }
    catch (const TransportError&)
    {
        return false;
    }
}

void Session::close()
{
    if (closed_)
        return;
    closed_ = true;
    if (transport_)
        transport_->close();
    log_debug("Session closed");
}

} // namespace toolrelay::client
