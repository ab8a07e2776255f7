#ifndef MCPBRIDGE_TRANSPORT_HPP
#define MCPBRIDGE_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <mcpbridge/types.hpp>
#include <memory>
#include <string>

namespace mcpbridge
{

/**
 * Abstract byte-stream transport to one tool server.
 *
 * The bridge owns exactly one Transport per connection and drives it from a
 * single thread at a time, except for cancel() which may be called from any
 * thread to abort a blocked write_line() or read_line().
 *
 * Implementations include:
 * - ProcessTransport: child process speaking over stdin/stdout pipes
 * - Test doubles injected through a TransportFactory
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Launch the server process.
     * @throws LaunchError if the executable cannot be found or spawned
     */
    virtual void start(const LaunchSpec& spec) = 0;

    /**
     * Write one line, appending '\n' if absent. Returns once every byte was
     * handed to the child. A child that stops reading its input cannot hold
     * the caller past timeout; the line may then be partially written.
     * @throws TransportClosed if the input side is closed
     * @throws TimeoutExpired, OperationCancelled
     */
    virtual void write_line(const std::string& line, std::chrono::milliseconds timeout) = 0;

    /**
     * Block until one complete line is available and return it, including
     * the trailing '\n'. Bytes past the newline are kept for the next call.
     * @throws TimeoutExpired, PrematureEOF, OperationCancelled
     */
    virtual std::string read_line(std::chrono::milliseconds timeout) = 0;

    /**
     * Close stdin, ask the process to exit, and force it after
     * graceful_timeout. Idempotent.
     */
    virtual void terminate(std::chrono::milliseconds graceful_timeout) = 0;

    /**
     * Abort an in-flight write_line() or read_line() from another thread.
     * Non-blocking.
     */
    virtual void cancel() = 0;

    /**
     * Check if the server process is still alive.
     */
    virtual bool is_running() const = 0;

    /**
     * Process ID of the server, 0 when not applicable.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

/// Creates the transport for a named connection. Used to inject test doubles.
using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& name)>;

// Factory for the default child-process transport
std::unique_ptr<Transport> create_process_transport(const TransportOptions& options = {});

} // namespace mcpbridge

#endif // MCPBRIDGE_TRANSPORT_HPP
