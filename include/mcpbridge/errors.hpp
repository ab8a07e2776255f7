#ifndef MCPBRIDGE_ERRORS_HPP
#define MCPBRIDGE_ERRORS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpbridge
{

// Error kinds - one per exception class, so callers can branch without string matching
enum class ErrorKind
{
    Launch,
    TransportClosed,
    PrematureEOF,
    Timeout,
    RequestTimeout,
    Cancelled,
    Decode,
    Protocol,
    ResponseIdMismatch,
    Handshake,
    ToolInvocation,
    NotInitialized,
    ConnectionClosed,
    UnknownConnection,
    Configuration,
    PartialStartup,
};

const char* to_string(ErrorKind kind);

// Child process or pipe trouble: suggests infrastructure problems
bool is_transport_error(ErrorKind kind);

// The remote tool itself reported an error: suggests bad input
bool is_application_error(ErrorKind kind);

// Where an error happened, as far as it is known
struct ErrorContext
{
    std::string connection;
    std::string method;
    std::optional<std::int64_t> request_id;

    std::string describe() const;
};

// Base exception
class BridgeError : public std::runtime_error
{
  public:
    BridgeError(ErrorKind kind, const std::string& message, ErrorContext context = {})
        : std::runtime_error(message), kind_(kind), context_(std::move(context))
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

    const ErrorContext& context() const
    {
        return context_;
    }

  private:
    ErrorKind kind_;
    ErrorContext context_;
};

// ============================================================================
// Transport errors
// ============================================================================

// Process could not be started
class LaunchError : public BridgeError
{
  public:
    explicit LaunchError(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::Launch, message, std::move(context))
    {
    }
};

// Write attempted after stdin was closed, or the child closed its end
class TransportClosed : public BridgeError
{
  public:
    explicit TransportClosed(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::TransportClosed, message, std::move(context))
    {
    }
};

// Stdout closed with no complete line pending
class PrematureEOF : public BridgeError
{
  public:
    explicit PrematureEOF(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::PrematureEOF, message, std::move(context))
    {
    }
};

// No newline within the read deadline (transport level)
class TimeoutExpired : public BridgeError
{
  public:
    explicit TimeoutExpired(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::Timeout, message, std::move(context))
    {
    }
};

// No response to a request within the request timeout
class RequestTimeout : public BridgeError
{
  public:
    explicit RequestTimeout(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::RequestTimeout, message, std::move(context))
    {
    }
};

// In-flight read was cancelled by cancel() or shutdown()
class OperationCancelled : public BridgeError
{
  public:
    explicit OperationCancelled(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::Cancelled, message, std::move(context))
    {
    }
};

// ============================================================================
// Protocol errors
// ============================================================================

// Response line is not valid JSON, or a line exceeded the size limit
class JSONDecodeError : public BridgeError
{
  public:
    explicit JSONDecodeError(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::Decode, message, std::move(context))
    {
    }
};

// Valid JSON that is not a JSON-RPC response envelope
class ProtocolError : public BridgeError
{
  public:
    explicit ProtocolError(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::Protocol, message, std::move(context))
    {
    }
};

class ResponseIdMismatch : public BridgeError
{
  public:
    ResponseIdMismatch(const std::string& message, std::int64_t expected_id,
                       nlohmann::json received_id, ErrorContext context = {})
        : BridgeError(ErrorKind::ResponseIdMismatch, message, std::move(context)),
          expected_id_(expected_id), received_id_(std::move(received_id))
    {
    }

    std::int64_t expected_id() const
    {
        return expected_id_;
    }

    const nlohmann::json& received_id() const
    {
        return received_id_;
    }

  private:
    std::int64_t expected_id_;
    nlohmann::json received_id_;
};

// initialize answered with an error
class HandshakeError : public BridgeError
{
  public:
    HandshakeError(const std::string& message, nlohmann::json error, ErrorContext context = {})
        : BridgeError(ErrorKind::Handshake, message, std::move(context)), error_(std::move(error))
    {
    }

    const nlohmann::json& error() const
    {
        return error_;
    }

  private:
    nlohmann::json error_;
};

// ============================================================================
// Application errors
// ============================================================================

// The remote tool answered with a JSON-RPC error. The payload is kept verbatim.
class ToolInvocationError : public BridgeError
{
  public:
    ToolInvocationError(const std::string& message, nlohmann::json error, ErrorContext context = {})
        : BridgeError(ErrorKind::ToolInvocation, message, std::move(context)),
          error_(std::make_shared<nlohmann::json>(std::move(error)))
    {
    }

    const nlohmann::json& error() const
    {
        return *error_;
    }

  private:
    std::shared_ptr<nlohmann::json> error_;
};

// ============================================================================
// Usage errors
// ============================================================================

// Connection exists but has not completed its handshake
class NotInitialized : public BridgeError
{
  public:
    explicit NotInitialized(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::NotInitialized, message, std::move(context))
    {
    }
};

// Connection is closed, or the bridge was shut down
class ConnectionClosed : public BridgeError
{
  public:
    explicit ConnectionClosed(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::ConnectionClosed, message, std::move(context))
    {
    }
};

class UnknownConnection : public BridgeError
{
  public:
    explicit UnknownConnection(const std::string& message, ErrorContext context = {})
        : BridgeError(ErrorKind::UnknownConnection, message, std::move(context))
    {
    }
};

class ConfigurationError : public BridgeError
{
  public:
    explicit ConfigurationError(const std::string& message)
        : BridgeError(ErrorKind::Configuration, message)
    {
    }
};

// start_all() could not bring up every connection. Successful ones keep running.
class PartialStartupFailure : public BridgeError
{
  public:
    PartialStartupFailure(const std::string& message, std::vector<std::string> succeeded,
                          std::map<std::string, std::string> failed)
        : BridgeError(ErrorKind::PartialStartup, message), succeeded_(std::move(succeeded)),
          failed_(std::move(failed))
    {
    }

    const std::vector<std::string>& succeeded() const
    {
        return succeeded_;
    }

    // name -> failure message
    const std::map<std::string, std::string>& failed() const
    {
        return failed_;
    }

  private:
    std::vector<std::string> succeeded_;
    std::map<std::string, std::string> failed_;
};

} // namespace mcpbridge

#endif // MCPBRIDGE_ERRORS_HPP
