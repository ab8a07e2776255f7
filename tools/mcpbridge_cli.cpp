/**
 * mcpbridge-cli - drive MCP tool servers from the command line
 *
 * Usage:
 *   mcpbridge-cli --config servers.json [--timeout-ms N] [--verbose] servers
 *   mcpbridge-cli --config servers.json list <server>
 *   mcpbridge-cli --config servers.json call <server> <tool> ['{"arg": 1}']
 *
 * Every configured server is started, the command runs, and all servers are
 * shut down before exit.
 *
 * Exit codes: 0 success, 1 tool error, 2 transport/protocol error, 64 usage.
 */

#include <iostream>
#include <mcpbridge/mcpbridge.hpp>
#include <string>
#include <vector>

using namespace mcpbridge;

namespace
{

constexpr int EXIT_OK = 0;
constexpr int EXIT_TOOL_ERROR = 1;
constexpr int EXIT_BRIDGE_ERROR = 2;
constexpr int EXIT_USAGE = 64;

struct CliArgs
{
    std::string config_path;
    std::optional<long long> timeout_ms;
    bool verbose = false;
    std::vector<std::string> command;
};

void print_usage(std::ostream& out)
{
    out << "Usage: mcpbridge-cli --config <file> [--timeout-ms N] [--verbose] <command>\n"
        << "\n"
        << "Commands:\n"
        << "  servers                      List configured servers and their state\n"
        << "  list <server>                List the tools a server provides\n"
        << "  call <server> <tool> [args]  Call a tool; args is a JSON object\n";
}

std::optional<CliArgs> parse_args(int argc, char* argv[])
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--timeout-ms" && i + 1 < argc)
        {
            try
            {
                args.timeout_ms = std::stoll(argv[++i]);
            }
            catch (const std::exception&)
            {
                std::cerr << "Invalid --timeout-ms value: " << argv[i] << "\n";
                return std::nullopt;
            }
            if (*args.timeout_ms <= 0)
                return std::nullopt;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            args.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-' && args.command.empty())
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
        else
        {
            args.command.push_back(arg);
        }
    }

    if (args.config_path.empty() || args.command.empty())
        return std::nullopt;

    const auto& cmd = args.command[0];
    size_t n = args.command.size();
    bool ok = (cmd == "servers" && n == 1) || (cmd == "list" && n == 2) ||
              (cmd == "call" && (n == 3 || n == 4));
    if (!ok)
        return std::nullopt;
    return args;
}

int run_command(ProtocolBridge& bridge, const CliArgs& args)
{
    const auto& cmd = args.command[0];

    if (cmd == "servers")
    {
        json out = json::array();
        for (const auto& name : bridge.connection_names())
        {
            json entry = {{"name", name}, {"state", to_string(bridge.state(name))}};
            if (auto info = bridge.server_info(name))
                entry["serverInfo"] = info->value("serverInfo", json::object());
            out.push_back(entry);
        }
        std::cout << out.dump(2) << std::endl;
        return EXIT_OK;
    }

    if (cmd == "list")
    {
        json out = json::array();
        for (const auto& tool : bridge.list_tools(args.command[1]))
            out.push_back(tool.to_json());
        std::cout << out.dump(2) << std::endl;
        return EXIT_OK;
    }

    // call
    json arguments = json::object();
    if (args.command.size() == 4)
    {
        try
        {
            arguments = json::parse(args.command[3]);
        }
        catch (const json::parse_error& e)
        {
            std::cerr << "Arguments are not valid JSON: " << e.what() << "\n";
            return EXIT_USAGE;
        }
        if (!arguments.is_object())
        {
            std::cerr << "Arguments must be a JSON object\n";
            return EXIT_USAGE;
        }
    }

    auto result = bridge.call_tool(args.command[1], args.command[2], arguments);
    std::cout << to_display_string(result) << std::endl;
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[])
{
    auto args = parse_args(argc, argv);
    if (!args)
    {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    std::vector<ServerConfig> servers;
    try
    {
        servers = load_server_configs_file(args->config_path);
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    BridgeOptions options = BridgeOptions::from_environment();
    if (args->timeout_ms)
        options.request_timeout = std::chrono::milliseconds(*args->timeout_ms);
    if (args->verbose)
        options.min_log_level = LogLevel::Debug;

    ProtocolBridge bridge(options);
    int exit_code = EXIT_OK;

    try
    {
        bridge.configure(servers);
        try
        {
            bridge.start_all();
        }
        catch (const PartialStartupFailure& e)
        {
            // Commands addressing a running server can still proceed
            std::cerr << "Warning: " << e.what() << "\n";
        }
        exit_code = run_command(bridge, *args);
    }
    catch (const ToolInvocationError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = EXIT_TOOL_ERROR;
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = EXIT_USAGE;
    }
    catch (const BridgeError& e)
    {
        std::cerr << "Error [" << to_string(e.kind()) << "]: " << e.what() << "\n";
        exit_code = EXIT_BRIDGE_ERROR;
    }

    bridge.shutdown();
    return exit_code;
}
