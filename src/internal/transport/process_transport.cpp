#include "process_transport.hpp"

#include <algorithm>
#include <chrono>
#include <mcpbridge/errors.hpp>
#include <system_error>

namespace mcpbridge
{
namespace internal
{

namespace
{
// Upper bound on one poll() so cancel() is noticed promptly
constexpr int POLL_SLICE_MS = 50;

constexpr size_t STDERR_CHUNK_SIZE = 4096;
constexpr size_t STDERR_DRAIN_LIMIT = 1024 * 1024;
constexpr auto DESTRUCTOR_GRACE = std::chrono::milliseconds(500);

std::string strip_line_ending(std::string line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    return line;
}
} // namespace

ProcessTransport::ProcessTransport(TransportOptions options)
    : options_(std::move(options)), line_buffer_(options_.max_line_size),
      chunk_(std::max<size_t>(options_.read_chunk_size, 1))
{
}

ProcessTransport::~ProcessTransport()
{
    try
    {
        terminate(DESTRUCTOR_GRACE);
    }
    catch (const BridgeError&)
    {
        // Process handle cleanup still kills and reaps
    }
}

void ProcessTransport::start(const LaunchSpec& spec)
{
    if (process_)
        throw LaunchError("Transport already started");
    if (spec.argv.empty() || spec.argv.front().empty())
        throw LaunchError("Cannot launch server: empty command");

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.environment = spec.environment;
    if (spec.working_directory)
        proc_opts.working_directory = *spec.working_directory;

    const std::string& executable = spec.argv.front();
    std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(executable, args, proc_opts);
    }
    catch (const std::system_error& e)
    {
        throw LaunchError("Failed to launch '" + executable + "': " + e.what());
    }

    process_ = std::move(process);
    start_stderr_reader();
}

void ProcessTransport::write_line(const std::string& line, std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!process_ || terminated_ || !process_->stdin_pipe().is_open())
        throw TransportClosed("Cannot write: server input is closed");

    std::string data = line;
    if (data.empty() || data.back() != '\n')
        data.push_back('\n');

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto& in = process_->stdin_pipe();
    size_t offset = 0;

    while (offset < data.size())
    {
        if (cancelled_)
            throw OperationCancelled("Write cancelled after " + std::to_string(offset) + " of " +
                                     std::to_string(data.size()) + " bytes");

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now())
                             .count();
        int slice = static_cast<int>(std::clamp<long long>(remaining, 0, POLL_SLICE_MS));

        try
        {
            // Always attempted once, so a zero timeout still writes into free pipe space
            if (in.can_write(slice))
                offset += in.write(data.data() + offset, data.size() - offset);
        }
        catch (const std::system_error& e)
        {
            in.close();
            if (e.code() == std::errc::broken_pipe)
                throw TransportClosed("Server closed its input (broken pipe)");
            throw TransportClosed(std::string("Write to server failed: ") + e.what());
        }

        if (offset < data.size() && std::chrono::steady_clock::now() >= deadline)
            throw TimeoutExpired("Server did not accept input within " +
                                 std::to_string(timeout.count()) + " ms (" +
                                 std::to_string(offset) + " of " + std::to_string(data.size()) +
                                 " bytes written)");
    }
}

std::string ProcessTransport::read_line(std::chrono::milliseconds timeout)
{
    if (!process_)
        throw TransportClosed("Cannot read: transport not started");

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        if (auto line = line_buffer_.extract_line())
            return *line;

        if (eof_)
        {
            if (line_buffer_.has_buffered_data())
                throw PrematureEOF("Server closed its output in the middle of a line (" +
                                   std::to_string(line_buffer_.size()) + " bytes pending)");
            throw PrematureEOF("Server closed its output without responding");
        }

        if (cancelled_)
            throw OperationCancelled("Read cancelled");

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            throw TimeoutExpired("No complete line within " + std::to_string(timeout.count()) +
                                 " ms");

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS));
        if (slice < 1)
            slice = 1;

        auto& out = process_->stdout_pipe();
        if (!out.is_open())
        {
            eof_ = true;
            continue;
        }

        try
        {
            if (!out.has_data(slice))
                continue;

            size_t n = out.read(chunk_.data(), chunk_.size());
            if (n == 0)
            {
                eof_ = true;
                continue;
            }

            line_buffer_.append(chunk_.data(), n);
        }
        catch (const std::system_error& e)
        {
            throw TransportClosed(std::string("Read from server failed: ") + e.what());
        }
    }
}

void ProcessTransport::terminate(std::chrono::milliseconds graceful_timeout)
{
    if (terminated_.exchange(true))
        return;

    cancelled_ = true;

    // Closing stdin tells the server no more requests are coming. A writer
    // blocked on a full pipe sees cancelled_ within one poll slice.
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (process_ && process_->stdin_pipe().is_open())
            process_->stdin_pipe().close();
    }

    if (!process_)
        return;

    try
    {
        if (!process_->try_wait())
        {
            process_->terminate();
            if (!process_->wait_for(graceful_timeout))
            {
                process_->kill();
                process_->wait();
            }
        }
    }
    catch (const std::system_error& e)
    {
        // Forceful path must still run
        process_->kill();
        stop_stderr_reader();
        process_->stdout_pipe().close();
        throw TransportClosed(std::string("Failed to reap server process: ") + e.what());
    }

    stop_stderr_reader();
    process_->stdout_pipe().close();
}

void ProcessTransport::cancel()
{
    cancelled_ = true;
}

bool ProcessTransport::is_running() const
{
    return process_ && process_->is_running();
}

long ProcessTransport::get_pid() const
{
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

void ProcessTransport::stderr_reader_loop()
{
    LineBuffer buffer(options_.max_line_size);
    std::vector<char> chunk(STDERR_CHUNK_SIZE);

    auto deliver = [this](const std::string& raw)
    {
        std::string line = strip_line_ending(raw);
        if (line.empty() || !options_.stderr_callback.has_value())
            return;
        try
        {
            (*options_.stderr_callback)(line);
        }
        catch (const std::exception&)
        {
            // Ignore exceptions from user callback
        }
    };

    try
    {
        auto& err = process_->stderr_pipe();
        while (stderr_running_)
        {
            if (!err.has_data(100))
                continue;

            size_t n = err.read(chunk.data(), chunk.size());
            if (n == 0)
                break; // EOF

            try
            {
                buffer.append(chunk.data(), n);
            }
            catch (const JSONDecodeError&)
            {
                // Overlong stderr line dropped
                continue;
            }

            while (auto line = buffer.extract_line())
                deliver(*line);
        }

        // Whatever the exited child left in the pipe, bounded in case
        // an orphaned grandchild keeps writing
        size_t drained = 0;
        while (drained < STDERR_DRAIN_LIMIT && err.is_open() && err.has_data(0))
        {
            size_t n = err.read(chunk.data(), chunk.size());
            if (n == 0)
                break;
            drained += n;
            try
            {
                buffer.append(chunk.data(), n);
            }
            catch (const JSONDecodeError&)
            {
                continue;
            }
            while (auto line = buffer.extract_line())
                deliver(*line);
        }
    }
    catch (const std::system_error&)
    {
        // Stderr is diagnostics only; losing it does not affect the protocol
    }

    // Last line without a trailing newline
    if (buffer.has_buffered_data())
    {
        buffer.append("\n", 1);
        while (auto line = buffer.extract_line())
            deliver(*line);
    }
}

void ProcessTransport::start_stderr_reader()
{
    stderr_running_ = true;
    stderr_reader_thread_ = std::thread(&ProcessTransport::stderr_reader_loop, this);
}

void ProcessTransport::stop_stderr_reader()
{
    if (stderr_running_)
    {
        stderr_running_ = false;
        if (stderr_reader_thread_.joinable())
            stderr_reader_thread_.join();
    }
}

} // namespace internal

// Factory function
std::unique_ptr<Transport> create_process_transport(const TransportOptions& options)
{
    return std::make_unique<internal::ProcessTransport>(options);
}

} // namespace mcpbridge
