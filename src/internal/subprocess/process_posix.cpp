// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace mcpbridge
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

namespace
{

std::system_error errno_error(const std::string& what)
{
    return std::system_error(errno, std::generic_category(), what);
}

// Both ends of a pipe, closed on scope exit unless released.
// Close-on-exec is set so that sibling children never inherit each other's pipes.
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        if (::pipe(fds) != 0)
            throw errno_error(std::string("Failed to create ") + what + " pipe");
        for (int fd : fds)
        {
            if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
                throw errno_error(std::string("fcntl FD_CLOEXEC failed on ") + what + " pipe");
        }
    }

    int release_read()
    {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }

    int release_write()
    {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
    }

    void close_read()
    {
        if (fds[0] >= 0)
            ::close(fds[0]);
        fds[0] = -1;
    }

    void close_write()
    {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
};

void set_nonblocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1)
        throw errno_error("fcntl F_GETFL failed");
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw errno_error("fcntl F_SETFL failed");
}

// Child side only: async-signal-safe calls from here on
void report_and_exit(int status_fd, int err)
{
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

void redirect(int fd, int target, int status_fd)
{
    if (fd == target)
    {
        // dup2 onto itself keeps FD_CLOEXEC; clear it by hand
        int flags = ::fcntl(fd, F_GETFD);
        if (flags == -1 || ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1)
            report_and_exit(status_fd, errno);
        return;
    }
    if (::dup2(fd, target) < 0)
        report_and_exit(status_fd, errno);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw errno_error("Read failed");
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw errno_error("poll failed");
    }

    // POLLHUP without POLLIN means EOF; the next read() returns 0
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

// ============================================================================
// WritePipe implementation
// ============================================================================

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
        throw std::runtime_error("Pipe is not open");

    // SIGPIPE is blocked on this thread for the duration of the write so a
    // dead reader surfaces as EPIPE instead of killing the host process.
    sigset_t pipe_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    const bool was_pending = sigismember(&pending, SIGPIPE) == 1;

    sigset_t old_mask;
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_mask);

    int error = 0;
    ssize_t bytes_written;
    while (true)
    {
        bytes_written = ::write(handle_->fd, data, size);
        if (bytes_written >= 0)
            break;
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            bytes_written = 0;
        else
            error = errno;
        break;
    }

    if (error == EPIPE && !was_pending)
    {
        // Consume the SIGPIPE we generated before unblocking
        struct timespec zero = {0, 0};
        sigtimedwait(&pipe_set, nullptr, &zero);
    }
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);

    if (error != 0)
        throw std::system_error(error, std::generic_category(), "Write failed");
    return static_cast<size_t>(bytes_written);
}

bool WritePipe::can_write(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw errno_error("poll failed");
    }

    // POLLERR means the read end is closed; the next write() reports EPIPE
    return result > 0 && (pfd.revents & (POLLOUT | POLLERR | POLLHUP)) != 0;
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

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const std::system_error&)
        {
            // Already reaped elsewhere; destructors must not throw
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw std::logic_error("Process already spawned");

    // Resolve the executable up front so the child only has to execve()
    auto resolved = find_executable(executable);
    if (!resolved)
        throw std::system_error(ENOENT, std::generic_category(),
                                "Executable not found: " + executable);

    // Everything the child needs is prepared before fork()
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char** env = environ; env && *env; ++env)
    {
        std::string entry(*env);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (options.environment.count(key) == 0)
            env_strings.push_back(std::move(entry));
    }
    for (const auto& [key, value] : options.environment)
        env_strings.push_back(key + "=" + value);

    std::vector<char*> envp;
    for (auto& entry : env_strings)
        envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    FdPair stdin_pipe, stdout_pipe, stderr_pipe, status_pipe;
    if (options.redirect_stdin)
    {
        stdin_pipe.open("stdin");
        // Parent end only; the child's read end is a separate open file description
        set_nonblocking(stdin_pipe.fds[1]);
    }
    if (options.redirect_stdout)
        stdout_pipe.open("stdout");
    if (options.redirect_stderr)
        stderr_pipe.open("stderr");
    status_pipe.open("exec status");

    pid_t pid = fork();
    if (pid < 0)
        throw errno_error("Failed to fork process");

    if (pid == 0)
    {
        // Child process
        const int status_fd = status_pipe.fds[1];

        // Start from a clean signal state; the parent may block or ignore SIGPIPE
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &dfl, nullptr);

        if (options.redirect_stdin)
            redirect(stdin_pipe.fds[0], STDIN_FILENO, status_fd);
        if (options.redirect_stdout)
            redirect(stdout_pipe.fds[1], STDOUT_FILENO, status_fd);
        if (options.redirect_stderr)
            redirect(stderr_pipe.fds[1], STDERR_FILENO, status_fd);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            report_and_exit(status_fd, errno);

        execve(resolved->c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        report_and_exit(status_fd, errno);
    }

    // Parent process
    status_pipe.close_write();

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        throw std::system_error(child_errno, std::generic_category(),
                                "Failed to execute " + executable);
    }

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe.release_write();
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe.release_read();
    }

    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe.release_read();
    }

    // Store process information
    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Peek without reaping so a zombie counts as exited
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno == EINTR;

    return info.si_pid == 0;
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
    if (result == 0 || errno == EINTR)
        return std::nullopt;

    throw errno_error("waitpid failed");
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

    throw errno_error("waitpid failed");
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
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

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (name.empty())
        return std::nullopt;

    // Absolute or relative path: no PATH search
    if (name.find('/') != std::string::npos)
    {
        if (fs::is_regular_file(name, ec) && access(name.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

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
            if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
                return candidate.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace mcpbridge
