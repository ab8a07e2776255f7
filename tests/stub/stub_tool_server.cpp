/**
 * stub_tool_server - scripted MCP tool server used by the integration tests
 *
 * Speaks newline-delimited JSON-RPC on stdin/stdout. The first argument picks
 * a behavior:
 *
 *   echo              Well-behaved server (default)
 *   exit-immediately  Exits with status 3 before reading anything
 *   exit-after-init   Completes the handshake, then exits on the next request
 *   malformed         Answers tool requests with a line that is not JSON
 *   mismatch          Answers tool requests with the wrong id
 *   silent            Completes the handshake, then never answers again
 *   no-init-response  Never answers anything
 *   init-error        Answers initialize with a JSON-RPC error
 *   trickle           Writes every response one byte at a time
 *   notify-first      Sends a notification and a server request before each response
 *   ignore-term       Like echo, but ignores SIGTERM and outlives its stdin
 *   partial-line      Answers tool requests with half a line, then exits
 *   deaf              Completes the handshake, then stops reading stdin
 *
 * Tools offered in the well-behaved modes:
 *   echo             result is the arguments object
 *   text             text content carrying arguments.text (default "hello")
 *   fail             JSON-RPC error -32000
 *   whoami           text content carrying the request id
 *   handshake_state  text content: "initialized" once the notification arrived
 *   slow             sleeps arguments.ms, then answers like text
 *   big              text content of arguments.size 'x' characters
 *   raw              result is arguments.value unchanged
 *   last_reply       text content: the last reply received for a server request
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace
{

std::string mode = "echo";
bool initialized_seen = false;
json last_server_reply = nullptr;

void write_raw(const std::string& data)
{
    if (mode == "trickle")
    {
        for (char c : data)
        {
            std::fwrite(&c, 1, 1, stdout);
            std::fflush(stdout);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return;
    }
    std::fwrite(data.data(), 1, data.size(), stdout);
    std::fflush(stdout);
}

void send(const json& message)
{
    write_raw(message.dump() + "\n");
}

void send_result(const json& id, const json& result)
{
    send({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

void send_error(const json& id, int code, const std::string& message)
{
    send({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

json text_content(const std::string& text)
{
    return json::array({{{"type", "text"}, {"text", text}}});
}

json tool_list()
{
    auto tool = [](const std::string& name, const std::string& description)
    {
        return json{{"name", name},
                    {"description", description},
                    {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}};
    };

    json text = tool("text", "Return a text block");
    text["inputSchema"]["properties"]["text"] = {{"type", "string"}};
    text["inputSchema"]["required"] = json::array({"text"});

    return json::array({tool("echo", "Echo the arguments back"), text,
                        tool("fail", "Always fails"), tool("whoami", "Return the request id"),
                        tool("handshake_state", "Report whether initialized was received"),
                        tool("slow", "Sleep before answering"), tool("big", "Return a large text"),
                        tool("raw", "Return a value unchanged"),
                        tool("last_reply", "Last reply to a server request")});
}

void handle_tool_call(const json& id, const json& params)
{
    std::string name = params.value("name", "");
    json args = params.value("arguments", json::object());

    if (name == "echo")
        send_result(id, args);
    else if (name == "text")
        send_result(id, text_content(args.value("text", "hello")));
    else if (name == "fail")
        send_error(id, -32000, "tool failed: " + args.value("reason", std::string("on purpose")));
    else if (name == "whoami")
        send_result(id, text_content(id.dump()));
    else if (name == "handshake_state")
        send_result(id, text_content(initialized_seen ? "initialized" : "not-initialized"));
    else if (name == "slow")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 1000)));
        send_result(id, text_content(args.value("text", "slow done")));
    }
    else if (name == "big")
        send_result(id, text_content(std::string(args.value("size", 100000), 'x')));
    else if (name == "raw")
        send_result(id, args.value("value", json(nullptr)));
    else if (name == "last_reply")
        send_result(id, text_content(last_server_reply.dump()));
    else
        send_error(id, -32602, "Unknown tool: " + name);
}

void handle_request(const json& msg)
{
    const json& id = msg["id"];
    std::string method = msg["method"];

    if (method == "initialize")
    {
        if (mode == "no-init-response")
            return;
        if (mode == "init-error")
        {
            send_error(id, -32603, "initialization refused");
            return;
        }
        send_result(id, {{"protocolVersion", msg["params"].value("protocolVersion", "")},
                         {"capabilities", {{"tools", json::object()}}},
                         {"serverInfo", {{"name", "stub"}, {"version", "1.0"}}}});
        return;
    }

    if (mode == "exit-after-init")
        std::exit(0);
    if (mode == "silent" || mode == "no-init-response")
        return;
    if (mode == "malformed")
    {
        write_raw("this is not json\n");
        return;
    }
    if (mode == "mismatch")
    {
        send_result(id.is_number_integer() ? json(id.get<long long>() + 100) : json("wrong"),
                    json::object());
        return;
    }
    if (mode == "partial-line")
    {
        write_raw("{\"jsonrpc\":\"2.0\",\"id\":");
        std::exit(0);
    }
    if (mode == "notify-first")
    {
        send({{"jsonrpc", "2.0"}, {"method", "notifications/message"},
              {"params", {{"level", "info"}, {"data", "working"}}}});
        send({{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "sampling/createMessage"},
              {"params", json::object()}});
    }

    if (method == "tools/list")
        send_result(id, {{"tools", tool_list()}});
    else if (method == "tools/call")
        handle_tool_call(id, msg.value("params", json::object()));
    else
        send_error(id, -32601, "Method not found: " + method);
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc > 1)
        mode = argv[1];

    if (mode == "exit-immediately")
        return 3;
    if (mode == "ignore-term")
        std::signal(SIGTERM, SIG_IGN);

    std::cerr << "stub_tool_server starting in mode " << mode << std::endl;

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object())
        {
            std::cerr << "stub_tool_server: unparseable input" << std::endl;
            continue;
        }

        if (!msg.contains("method"))
        {
            // Client reply to one of our server requests
            last_server_reply = msg;
            continue;
        }

        if (!msg.contains("id"))
        {
            if (msg["method"] == "notifications/initialized")
                initialized_seen = true;
            // Requests pile up in the pipe until the writer blocks
            if (mode == "deaf" && initialized_seen)
                while (true)
                    pause();
            continue;
        }

        handle_request(msg);
    }

    std::cerr << "stub_tool_server: stdin closed" << std::endl;

    // Only SIGKILL gets rid of us
    if (mode == "ignore-term")
        while (true)
            pause();
    return 0;
}
