// Subprocess management for the stdio transport (POSIX)

#pragma once

#include "toolrelay/exceptions.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolrelay::process
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process or pipe operations fail
class ProcessError : public TransportError
{
  public:
    explicit ProcessError(const std::string& message) : TransportError(message) {}
};

/// Read end of a pipe connected to a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read one newline-terminated line (newline stripped).
    /// @param timeout Maximum wait; zero or negative waits indefinitely
    /// @return The line, or std::nullopt if the deadline passed first or a signal
    ///         interrupted an indefinite wait
    /// @throws ProcessError on EOF before a complete line, or when the line exceeds max_size
    std::optional<std::string> read_line(std::chrono::milliseconds timeout,
                                         size_t max_size = 16 * 1024 * 1024);

    /// Check if data is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    size_t fill(int timeout_ms);
    std::unique_ptr<PipeHandle> handle_;
};

/// Write end of a pipe connected to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool redirect_stdin = true;
    bool redirect_stdout = true;

    /// When set, the child's stderr is appended to this file instead of
    /// being inherited from the parent
    std::optional<std::string> stderr_path;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process; executable is resolved through PATH
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    bool is_running() const;

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    int wait();

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    /// Close stdin, send SIGTERM and escalate to SIGKILL after grace.
    /// Safe to call more than once.
    /// @return exit code, or -1 if the process was never started
    int shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds{2000});

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace toolrelay::process
