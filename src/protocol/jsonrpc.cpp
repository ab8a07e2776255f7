#include <mcpbridge/errors.hpp>
#include <mcpbridge/protocol/jsonrpc.hpp>

namespace mcpbridge
{
namespace protocol
{

json Request::to_json() const
{
    return json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"method", method}, {"params", params}};
}

json Notification::to_json() const
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"method", method}};
    if (params.has_value())
        msg["params"] = *params;
    return msg;
}

std::optional<std::int64_t> Response::int_id() const
{
    if (id.is_number_integer())
        return id.get<std::int64_t>();
    return std::nullopt;
}

json Response::to_json() const
{
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"id", id}};
    if (error.has_value())
        msg["error"] = *error;
    else
        msg["result"] = result.has_value() ? *result : json(nullptr);
    return msg;
}

std::string serialize_line(const json& message)
{
    // dump() escapes control characters, so the line holds no raw '\n'.
    // Invalid UTF-8 is replaced rather than aborting the request.
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

IncomingMessage decode_line(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object())
        throw ProtocolError("JSON-RPC message is not an object: " + j.dump());

    IncomingMessage msg;
    msg.raw = j;

    if (j.contains("method"))
    {
        if (!j["method"].is_string())
            throw ProtocolError("JSON-RPC method is not a string");
        msg.method = j["method"].get<std::string>();
        msg.kind = j.contains("id") ? MessageKind::ServerRequest : MessageKind::Notification;
        return msg;
    }

    if (!j.contains("id"))
        throw ProtocolError("JSON-RPC response has no id");

    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error)
        throw ProtocolError(has_result ? "JSON-RPC response carries both result and error"
                                       : "JSON-RPC response carries neither result nor error");

    msg.kind = MessageKind::Response;
    msg.response.id = j["id"];
    if (has_result)
        msg.response.result = j["result"];
    else
        msg.response.error = j["error"];
    return msg;
}

json make_initialize_params(const std::string& protocol_version, const std::string& client_name,
                            const std::string& client_version)
{
    return json{{"protocolVersion", protocol_version},
                {"capabilities", json::object()},
                {"clientInfo", {{"name", client_name}, {"version", client_version}}}};
}

json make_tool_call_params(const std::string& tool_name, const json& arguments)
{
    return json{{"name", tool_name},
                {"arguments", arguments.is_null() ? json::object() : arguments}};
}

std::string describe_error(const json& error)
{
    if (error.is_object() && error.contains("message") && error["message"].is_string())
    {
        std::string text = error["message"].get<std::string>();
        if (error.contains("code") && error["code"].is_number_integer())
            text += " (code " + std::to_string(error["code"].get<long long>()) + ")";
        return text;
    }
    if (error.is_string())
        return error.get<std::string>();
    return error.dump();
}

} // namespace protocol
} // namespace mcpbridge
