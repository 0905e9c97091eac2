// POSIX implementation of subprocess management

#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolrelay::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;
    std::string buffer;
    bool eof = false;
    bool interrupted = false; // last wait ended with EINTR

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// A child that dies while we write to its stdin must surface as EPIPE,
// not terminate the parent.
static void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] static void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::fill(int timeout_ms)
{
    if (!has_data(timeout_ms))
        return 0;

    char chunk[4096];
    ssize_t n = ::read(handle_->fd, chunk, sizeof(chunk));
    if (n < 0)
    {
        if (errno == EINTR)
            handle_->interrupted = true;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
    }
    if (n == 0)
    {
        handle_->eof = true;
        return 0;
    }
    handle_->buffer.append(chunk, static_cast<size_t>(n));
    return static_cast<size_t>(n);
}

std::optional<std::string> ReadPipe::read_line(std::chrono::milliseconds timeout, size_t max_size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    using clock = std::chrono::steady_clock;
    const bool bounded = timeout.count() > 0;
    const auto deadline = clock::now() + timeout;

    while (true)
    {
        auto& buf = handle_->buffer;
        auto pos = buf.find('\n');
        if (pos != std::string::npos)
        {
            std::string line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
        if (buf.size() > max_size)
            throw ProcessError("Line exceeds " + std::to_string(max_size) + " bytes");

        if (handle_->eof)
        {
            if (!buf.empty())
            {
                std::string rest = std::move(buf);
                buf.clear();
                return rest;
            }
            throw ProcessError("Pipe closed by peer");
        }

        int wait_ms = -1;
        if (bounded)
        {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() <= 0)
                return std::nullopt;
            wait_ms = static_cast<int>(remaining.count());
        }
        handle_->interrupted = false;
        fill(wait_ms);

        // A signal ends an unbounded wait; bounded waits resume until the deadline
        if (!bounded && handle_->interrupted)
        {
            handle_->interrupted = false;
            return std::nullopt;
        }
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;
    if (!handle_->buffer.empty())
        return true;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
        {
            handle_->interrupted = true;
            return false;
        }
        throw ProcessError("poll failed: " + get_errno_message());
    }

    // POLLHUP without POLLIN still means read() will report EOF
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (!handle_ || !handle_->running)
        return;
    try
    {
        shutdown(std::chrono::milliseconds{500});
    }
    catch (const ProcessError&)
    {
        // Child already reaped elsewhere; nothing left to release
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw ProcessError("Process already spawned (pid " + std::to_string(handle_->pid) + ")");

    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
        throw ProcessError("Failed to create stdin pipe: " + get_errno_message());

    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
    {
        std::string msg = get_errno_message();
        close_pair(stdin_pipe);
        throw ProcessError("Failed to create stdout pipe: " + msg);
    }

    // Error pipe for detecting exec failures
    if (pipe(error_pipe) != 0)
    {
        std::string msg = get_errno_message();
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        throw ProcessError("Failed to create error pipe: " + msg);
    }
    set_cloexec(error_pipe[1]);

    pid_t pid = fork();
    if (pid < 0)
    {
        std::string msg = get_errno_message();
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(error_pipe);
        throw ProcessError("Failed to fork process: " + msg);
    }

    if (pid == 0)
    {
        // Child process
        ::close(error_pipe[0]);

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]);
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(stdin_pipe[0]);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]);
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(stdout_pipe[1]);
        }

        if (options.stderr_path)
        {
            int fd = ::open(options.stderr_path->c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd < 0 || dup2(fd, STDERR_FILENO) < 0)
                child_fail(error_pipe[1]);
            ::close(fd);
        }

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(error_pipe[1]);

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        std::signal(SIGPIPE, SIG_DFL);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        child_fail(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);
    int child_errno = 0;
    ssize_t error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    ::close(error_pipe[0]);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        set_cloexec(stdin_pipe[1]);
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        set_cloexec(stdout_pipe[0]);
        stdout_->handle_->fd = stdout_pipe[0];
        stdout_->handle_->buffer.clear();
        stdout_->handle_->eof = false;
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // A zombie still accepts signal 0; reap state is tracked by try_wait()
    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return false;
    }
    return result == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::shutdown(std::chrono::milliseconds grace)
{
    if (!handle_ || handle_->pid == 0)
        return -1;

    // Closing stdin is the polite stop request for stdio servers
    if (stdin_)
        stdin_->close();

    auto wait_for_exit = [this](std::chrono::milliseconds limit)
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (true)
        {
            if (try_wait())
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    if (handle_->running && !wait_for_exit(grace))
    {
        terminate();
        if (!wait_for_exit(grace))
        {
            kill();
            wait();
        }
    }

    if (stdout_)
        stdout_->close();

    return handle_->exit_code;
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace toolrelay::process
