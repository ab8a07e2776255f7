#ifndef MCPBRIDGE_PROTOCOL_JSONRPC_HPP
#define MCPBRIDGE_PROTOCOL_JSONRPC_HPP

#include <cstdint>
#include <mcpbridge/types.hpp>
#include <optional>
#include <string>

namespace mcpbridge
{
namespace protocol
{

constexpr const char* JSONRPC_VERSION = "2.0";

// Method names used by the bridge
namespace Method
{
constexpr const char* Initialize = "initialize";
constexpr const char* Initialized = "notifications/initialized";
constexpr const char* ToolsList = "tools/list";
constexpr const char* ToolsCall = "tools/call";
} // namespace Method

// Outgoing request - expects exactly one response carrying the same id
struct Request
{
    std::int64_t id = 0;
    std::string method;
    json params = json::object();

    json to_json() const;
};

// Outgoing notification - no id, no response
struct Notification
{
    std::string method;
    std::optional<json> params = std::nullopt;

    json to_json() const;
};

// What a single incoming line turned out to be
enum class MessageKind
{
    Response,
    Notification,  // Server-to-client notification: method, no id
    ServerRequest, // Server-to-client request: method and id
};

// Incoming response envelope - exactly one of result / error is set
struct Response
{
    json id;
    std::optional<json> result = std::nullopt;
    std::optional<json> error = std::nullopt;

    bool is_error() const
    {
        return error.has_value();
    }

    // Integer id, if the id is an integer
    std::optional<std::int64_t> int_id() const;

    json to_json() const;
};

// Incoming line after envelope decoding
struct IncomingMessage
{
    MessageKind kind = MessageKind::Response;
    Response response;  // Valid when kind == Response
    std::string method; // Valid for Notification / ServerRequest
    json raw;
};

// Serialize a message to a single wire line, '\n' included
std::string serialize_line(const json& message);

// Decode one wire line.
// Throws JSONDecodeError on invalid JSON, ProtocolError on an invalid envelope.
IncomingMessage decode_line(const std::string& line);

// Build the params object for initialize
json make_initialize_params(const std::string& protocol_version, const std::string& client_name,
                            const std::string& client_version);

// Build the params object for tools/call
json make_tool_call_params(const std::string& tool_name, const json& arguments);

// Human-readable form of an error payload: "message (code N)" when it has that shape
std::string describe_error(const json& error);

} // namespace protocol
} // namespace mcpbridge

#endif // MCPBRIDGE_PROTOCOL_JSONRPC_HPP
