#include <mcpbridge/errors.hpp>
#include <mcpbridge/result.hpp>

namespace mcpbridge
{

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Launch:
        return "launch";
    case ErrorKind::TransportClosed:
        return "transport_closed";
    case ErrorKind::PrematureEOF:
        return "premature_eof";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::RequestTimeout:
        return "request_timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::Protocol:
        return "protocol";
    case ErrorKind::ResponseIdMismatch:
        return "response_id_mismatch";
    case ErrorKind::Handshake:
        return "handshake";
    case ErrorKind::ToolInvocation:
        return "tool_invocation";
    case ErrorKind::NotInitialized:
        return "not_initialized";
    case ErrorKind::ConnectionClosed:
        return "connection_closed";
    case ErrorKind::UnknownConnection:
        return "unknown_connection";
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::PartialStartup:
        return "partial_startup";
    }
    return "unknown";
}

bool is_transport_error(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Launch:
    case ErrorKind::TransportClosed:
    case ErrorKind::PrematureEOF:
    case ErrorKind::Timeout:
    case ErrorKind::RequestTimeout:
    case ErrorKind::Cancelled:
        return true;
    default:
        return false;
    }
}

bool is_application_error(ErrorKind kind)
{
    return kind == ErrorKind::ToolInvocation;
}

std::string ErrorContext::describe() const
{
    std::string text;
    if (!connection.empty())
        text += "server '" + connection + "'";
    if (!method.empty())
        text += (text.empty() ? "" : ", ") + std::string("method '") + method + "'";
    if (request_id)
        text += (text.empty() ? "" : ", ") + std::string("request id ") +
                std::to_string(*request_id);
    return text;
}

ErrorInfo ErrorInfo::from_exception(const BridgeError& e)
{
    ErrorInfo info;
    info.kind = e.kind();
    info.message = e.what();
    info.context = e.context();

    if (const auto* tool_error = dynamic_cast<const ToolInvocationError*>(&e))
        info.payload = tool_error->error();
    else if (const auto* handshake_error = dynamic_cast<const HandshakeError*>(&e))
        info.payload = handshake_error->error();

    return info;
}

} // namespace mcpbridge
