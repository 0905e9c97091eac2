#include "toolrelay/client/transports.hpp"

#include "../internal/process.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/util/json.hpp"

#include <sstream>

namespace toolrelay::client
{

namespace
{

toolrelay::Json make_request(int64_t id, const std::string& route, const toolrelay::Json& payload)
{
    return toolrelay::Json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", route},
        {"params", payload},
    };
}

// Extract "result" or raise the reply's error object
toolrelay::Json unwrap_response(const toolrelay::Json& response, const std::string& route)
{
    if (!response.is_object())
        throw toolrelay::TransportError(route + ": reply is not a JSON object");

    if (response.contains("error") && !response["error"].is_null())
    {
        const auto& err = response["error"];
        int code = -32603;
        std::string message = "Unknown error";
        if (err.is_object())
        {
            if (err.contains("code") && err["code"].is_number_integer())
                code = err["code"].get<int>();
            if (err.contains("message") && err["message"].is_string())
                message = err["message"].get<std::string>();
        }
        else
        {
            message = util::json::to_text(err);
        }
        throw toolrelay::RpcError(code, route + ": " + message);
    }

    if (!response.contains("result") || response["result"].is_null())
        return toolrelay::Json::object();
    if (!response["result"].is_object())
        throw toolrelay::TransportError(route + ": reply result is not an object");
    return response["result"];
}

} // namespace

// =============================================================================
// InProcessTransport
// =============================================================================

toolrelay::Json InProcessTransport::request(const std::string& route,
                                            const toolrelay::Json& payload,
                                            std::chrono::milliseconds /*timeout*/)
{
    if (!open_)
        throw toolrelay::TransportError("in-process transport is closed");

    try
    {
        toolrelay::Json response = handler_(make_request(++next_id_, route, payload));
        return unwrap_response(response, route);
    }
    catch (const toolrelay::Json::exception& e)
    {
        throw toolrelay::TransportError("malformed reply to '" + route + "': " + e.what());
    }
}

void InProcessTransport::notify(const std::string& route, const toolrelay::Json& payload)
{
    if (!open_)
        throw toolrelay::TransportError("in-process transport is closed");
    handler_(toolrelay::Json{{"jsonrpc", "2.0"}, {"method", route}, {"params", payload}});
}

// =============================================================================
// StdioTransport
// =============================================================================

struct StdioTransport::Impl
{
    process::Process process;
};

StdioTransport::StdioTransport(std::string command, std::vector<std::string> args,
                               StdioTransportOptions options)
    : command_(std::move(command)), args_(std::move(args)), options_(std::move(options))
{
    std::ostringstream cmd;
    cmd << command_;
    for (const auto& a : args_)
        cmd << " " << a;
    command_line_ = cmd.str();
}

StdioTransport::~StdioTransport()
{
    close();
}

void StdioTransport::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (impl_)
        return;

    process::ProcessOptions popts;
    popts.working_directory = options_.working_directory;
    popts.environment = options_.environment;
    popts.stderr_path = options_.stderr_path;

    auto impl = std::make_unique<Impl>();
    impl->process.spawn(command_, args_, popts);
    log_debug("Spawned provider '" + command_line_ + "' (pid " +
              std::to_string(impl->process.pid()) + ")");

    impl_ = std::move(impl);
    broken_ = false;
}

bool StdioTransport::is_open() const
{
    return impl_ != nullptr && !broken_;
}

int StdioTransport::pid() const
{
    return impl_ ? impl_->process.pid() : 0;
}

void StdioTransport::write_message(const toolrelay::Json& message)
{
    try
    {
        impl_->process.stdin_pipe().write(message.dump() + "\n");
    }
    catch (const process::ProcessError& e)
    {
        broken_ = true;
        throw toolrelay::TransportError(std::string("failed to write to provider: ") + e.what());
    }
}

void StdioTransport::handle_server_message(const toolrelay::Json& message)
{
    std::string method;
    if (message.contains("method") && message["method"].is_string())
        method = message["method"].get<std::string>();

    if (!message.contains("id"))
    {
        // Notification from the provider
        if (method == "notifications/message" && message.contains("params") &&
            message["params"].is_object())
        {
            const auto& params = message["params"];
            std::string level = "info";
            if (params.contains("level") && params["level"].is_string())
                level = params["level"].get<std::string>();
            toolrelay::Json data = params.contains("data") ? params["data"] : toolrelay::Json();
            log(parse_log_level(level), "[provider] " + util::json::to_text(data));
        }
        else
        {
            log_debug("Ignoring provider notification '" + method + "'");
        }
        return;
    }

    // Server-to-client request: answer ping, refuse everything else
    if (method == "ping")
    {
        write_message(toolrelay::Json{
            {"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", toolrelay::Json::object()}});
        return;
    }

    log_debug("Refusing provider request '" + method + "'");
    write_message(toolrelay::Json{
        {"jsonrpc", "2.0"},
        {"id", message["id"]},
        {"error", {{"code", -32601}, {"message", "Method not found: " + method}}},
    });
}

toolrelay::Json StdioTransport::request(const std::string& route, const toolrelay::Json& payload,
                                        std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_ || broken_)
        throw toolrelay::TransportError("stdio transport is not running");

    const int64_t id = ++next_id_;
    write_message(make_request(id, route, payload));

    using clock = std::chrono::steady_clock;
    const bool bounded = timeout.count() > 0;
    const auto deadline = clock::now() + timeout;

    auto& out = impl_->process.stdout_pipe();
    while (true)
    {
        std::chrono::milliseconds remaining{0};
        if (bounded)
        {
            remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() <= 0)
                remaining = std::chrono::milliseconds{1};
        }

        std::optional<std::string> line;
        try
        {
            line = out.read_line(remaining);
        }
        catch (const process::ProcessError& e)
        {
            broken_ = true;
            std::string status;
            if (auto code = impl_->process.try_wait())
                status = " (exit code " + std::to_string(*code) + ")";
            throw toolrelay::TransportError("provider connection lost during '" + route +
                                            "': " + e.what() + status);
        }

        if (!line && !bounded)
            throw toolrelay::TransportError(route + " interrupted while waiting for the provider");
        if (!line)
            throw toolrelay::RequestTimeoutError(route + " timed out after " +
                                                 std::to_string(timeout.count()) + " ms");
        if (line->empty())
            continue;

        toolrelay::Json message = util::json::try_parse(*line);
        if (message.is_discarded() || !message.is_object())
        {
            log_debug("Ignoring non-JSON provider output: " + *line);
            continue;
        }

        try
        {
            if (message.contains("method"))
            {
                handle_server_message(message);
                continue;
            }

            if (!message.contains("id") || message["id"] != id)
            {
                // Reply to a request that already timed out
                log_debug("Discarding stale provider reply: " + *line);
                continue;
            }

            return unwrap_response(message, route);
        }
        catch (const toolrelay::Json::exception& e)
        {
            throw toolrelay::TransportError("malformed reply to '" + route + "': " + e.what());
        }
    }
}

void StdioTransport::notify(const std::string& route, const toolrelay::Json& payload)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_ || broken_)
        throw toolrelay::TransportError("stdio transport is not running");

    toolrelay::Json message = {{"jsonrpc", "2.0"}, {"method", route}};
    if (!payload.is_null() && !payload.empty())
        message["params"] = payload;
    write_message(message);
}

void StdioTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_)
        return;

    try
    {
        int code = impl_->process.shutdown(options_.shutdown_grace);
        log_debug("Provider '" + command_line_ + "' exited with code " + std::to_string(code));
    }
    catch (const process::ProcessError& e)
    {
        log_warning(std::string("Error while stopping provider: ") + e.what());
    }
    impl_.reset();
}

} // namespace toolrelay::client
