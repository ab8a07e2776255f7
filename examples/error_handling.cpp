/**
 * @file error_handling.cpp
 * @brief Start a set of MCP servers and react to each failure kind
 *
 * Usage: error_handling <servers.json> <server> <tool> ['{"arg": "value"}']
 *
 * Demonstrates:
 * - Partial startup: carrying on with the servers that came up
 * - Telling tool errors (bad input) apart from transport errors (infrastructure)
 * - The non-throwing try_call_tool() variant
 */

#include <iostream>
#include <mcpbridge/mcpbridge.hpp>
#include <string>

using namespace mcpbridge;

int main(int argc, char* argv[])
{
    if (argc < 4)
    {
        std::cerr << "Usage: " << argv[0] << " <servers.json> <server> <tool> [json-args]\n";
        return 64;
    }

    const std::string server = argv[2];
    const std::string tool = argv[3];
    json arguments = argc > 4 ? json::parse(argv[4], nullptr, false) : json::object();
    if (arguments.is_discarded())
    {
        std::cerr << "Arguments are not valid JSON\n";
        return 64;
    }

    BridgeOptions options = BridgeOptions::from_environment();
    options.log_callback = [](LogLevel level, const std::string& message)
    { std::cerr << "[" << to_string(level) << "] " << message << "\n"; };
    options.min_log_level = LogLevel::Info;

    ProtocolBridge bridge(options);

    try
    {
        bridge.configure(load_server_configs_file(argv[1]));
        bridge.start_all();
    }
    catch (const PartialStartupFailure& e)
    {
        std::cerr << "\nSome servers failed to start:\n";
        for (const auto& [name, reason] : e.failed())
            std::cerr << "  " << name << ": " << reason << "\n";
        std::cerr << "Continuing with " << e.succeeded().size() << " server(s)\n\n";
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 64;
    }

    auto result = bridge.try_call_tool(server, tool, arguments);
    if (result)
    {
        std::cout << to_display_string(result.value()) << "\n";
        return 0;
    }

    const ErrorInfo& error = result.error();
    if (is_application_error(error.kind))
    {
        // The tool ran and rejected the input; the payload is the server's own error object
        std::cerr << "Tool error: " << error.message << "\n";
        std::cerr << "Payload: " << error.payload.dump(2) << "\n";
        return 1;
    }

    if (is_transport_error(error.kind))
        std::cerr << "Server '" << server << "' is unreachable (" << to_string(error.kind)
                  << "): " << error.message << "\n";
    else
        std::cerr << "Bridge error (" << to_string(error.kind) << "): " << error.message << "\n";

    if (bridge.state(server) == ConnectionState::Closed)
        std::cerr << "The connection is closed; restart the bridge to retry.\n";

    return 2;
}
