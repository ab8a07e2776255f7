#ifndef MCPBRIDGE_INTERNAL_PROCESS_TRANSPORT_HPP
#define MCPBRIDGE_INTERNAL_PROCESS_TRANSPORT_HPP

#include "../line_buffer.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <mcpbridge/transport.hpp>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcpbridge
{
namespace internal
{

/**
 * Transport to a tool server running as a child process.
 *
 * stdin carries requests, stdout carries newline-delimited responses, and
 * stderr is drained on a background thread into the stderr callback so the
 * child never blocks on a full stderr pipe.
 */
class ProcessTransport : public Transport
{
  public:
    explicit ProcessTransport(TransportOptions options = TransportOptions{});
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    // Transport interface
    void start(const LaunchSpec& spec) override;
    void write_line(const std::string& line, std::chrono::milliseconds timeout) override;
    std::string read_line(std::chrono::milliseconds timeout) override;
    void terminate(std::chrono::milliseconds graceful_timeout) override;
    void cancel() override;
    bool is_running() const override;
    long get_pid() const override;

  private:
    // Background stderr reader thread
    void stderr_reader_loop();
    void start_stderr_reader();
    void stop_stderr_reader();

    TransportOptions options_;

    // Process management
    std::unique_ptr<subprocess::Process> process_;

    // Stdout reassembly
    LineBuffer line_buffer_;
    std::vector<char> chunk_;
    bool eof_ = false;

    // Serialize stdin writes and coordinate with terminate(), which sets
    // cancelled_ first so a writer stuck on a full pipe lets go
    std::mutex write_mutex_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> terminated_{false};

    // Stderr reader thread
    std::thread stderr_reader_thread_;
    std::atomic<bool> stderr_running_{false};
};

} // namespace internal
} // namespace mcpbridge

#endif // MCPBRIDGE_INTERNAL_PROCESS_TRANSPORT_HPP
