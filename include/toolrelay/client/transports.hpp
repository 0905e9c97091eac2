#pragma once
#include "toolrelay/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay::client {

/// Request/response channel to a tool provider.
/// Implementations frame each call as a JSON-RPC 2.0 request and return the
/// "result" member of the matching reply.
class ITransport {
 public:
  virtual ~ITransport() = default;

  /// Send a request and wait for its reply
  /// @param route The method (e.g., "tools/list", "tools/call")
  /// @param timeout Deadline for the reply; zero waits indefinitely
  /// @throws RpcError when the peer replies with an error object
  /// @throws RequestTimeoutError when the deadline passes
  /// @throws TransportError when the channel fails
  virtual toolrelay::Json request(const std::string& route, const toolrelay::Json& payload,
                                  std::chrono::milliseconds timeout) = 0;

  toolrelay::Json request(const std::string& route, const toolrelay::Json& payload) {
    return request(route, payload, std::chrono::milliseconds{0});
  }

  /// Send a notification; no reply is expected
  virtual void notify(const std::string& route, const toolrelay::Json& payload) = 0;

  /// Release the channel. Idempotent.
  virtual void close() {}

  virtual bool is_open() const { return true; }
};

/// Routes JSON-RPC messages to an in-process handler.
/// Useful for embedding a provider and for tests. Timeouts are not enforced.
class InProcessTransport : public ITransport {
 public:
  using HandlerFn = std::function<toolrelay::Json(const toolrelay::Json&)>;

  explicit InProcessTransport(HandlerFn handler) : handler_(std::move(handler)) {}

  using ITransport::request;
  toolrelay::Json request(const std::string& route, const toolrelay::Json& payload,
                          std::chrono::milliseconds timeout) override;
  void notify(const std::string& route, const toolrelay::Json& payload) override;
  void close() override { open_ = false; }
  bool is_open() const override { return open_; }

 private:
  HandlerFn handler_;
  int64_t next_id_ = 0;
  bool open_ = true;
};

struct StdioTransportOptions {
  std::string working_directory;
  std::map<std::string, std::string> environment;
  /// Append the provider's stderr to this file instead of inheriting ours
  std::optional<std::string> stderr_path;
  /// Grace period between closing stdin, SIGTERM and SIGKILL on close()
  std::chrono::milliseconds shutdown_grace{2000};
};

/// Keeps one tool-provider subprocess alive and exchanges line-delimited
/// JSON-RPC messages over its stdin/stdout.
class StdioTransport : public ITransport {
 public:
  /// @param command The runner to execute (e.g., "python", "node")
  /// @param args Command-line arguments (typically the provider script)
  StdioTransport(std::string command, std::vector<std::string> args,
                 StdioTransportOptions options = {});
  ~StdioTransport() override;

  StdioTransport(const StdioTransport&) = delete;
  StdioTransport& operator=(const StdioTransport&) = delete;

  /// Spawn the subprocess
  /// @throws TransportError if the process cannot be started
  void start();

  using ITransport::request;
  toolrelay::Json request(const std::string& route, const toolrelay::Json& payload,
                          std::chrono::milliseconds timeout) override;
  void notify(const std::string& route, const toolrelay::Json& payload) override;
  void close() override;
  bool is_open() const override;

  int pid() const;
  const std::string& command_line() const { return command_line_; }

 private:
  struct Impl;

  void write_message(const toolrelay::Json& message);
  void handle_server_message(const toolrelay::Json& message);

  std::string command_;
  std::vector<std::string> args_;
  StdioTransportOptions options_;
  std::string command_line_;
  std::unique_ptr<Impl> impl_;
  std::mutex mutex_;
  int64_t next_id_ = 0;
  bool broken_ = false;
};

}  // namespace toolrelay::client
