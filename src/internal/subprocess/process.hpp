#ifndef MCPBRIDGE_SUBPROCESS_PROCESS_HPP
#define MCPBRIDGE_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge
{
namespace subprocess
{

// Defined in process_posix.cpp
struct ProcessHandle;
struct PipeHandle;

// Parent end of the child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // At most size bytes; 0 means EOF. Throws std::system_error.
    size_t read(char* buffer, size_t size);

    // True once a read would not block (data or EOF)
    bool has_data(int timeout_ms = 0);

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Parent end of the child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // The pipe is non-blocking: returns the bytes accepted, 0 when the pipe is full.
    // Throws std::system_error (errc::broken_pipe when the reader is gone).
    size_t write(const char* data, size_t size);

    // True once a write would not block, or would fail because the reader is gone
    bool can_write(int timeout_ms = 0);

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Empty working_directory keeps the parent's; environment entries override inherited ones
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

// Child process with optional piped stdio. Destruction kills and reaps a live child.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws std::system_error if pipes, fork or exec fail;
    // an exec failure is reported with the child's errno.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Valid only for streams redirected in ProcessOptions
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    // nullopt if the child is still running after timeout
    std::optional<int> wait_for(std::chrono::milliseconds timeout);
    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Names containing '/' are checked as given; bare names are searched on PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace mcpbridge

#endif // MCPBRIDGE_SUBPROCESS_PROCESS_HPP
