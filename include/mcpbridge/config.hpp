#ifndef MCPBRIDGE_CONFIG_HPP
#define MCPBRIDGE_CONFIG_HPP

#include <mcpbridge/types.hpp>
#include <string>
#include <vector>

namespace mcpbridge
{

// Environment variables read by BridgeOptions::from_environment()
namespace EnvVar
{
constexpr const char* RequestTimeoutMs = "MCPBRIDGE_REQUEST_TIMEOUT_MS";
constexpr const char* InitializeTimeoutMs = "MCPBRIDGE_INITIALIZE_TIMEOUT_MS";
constexpr const char* ShutdownTimeoutMs = "MCPBRIDGE_SHUTDOWN_TIMEOUT_MS";
constexpr const char* LogLevel = "MCPBRIDGE_LOG_LEVEL";
} // namespace EnvVar

/// Parse one server entry. Accepted shapes:
///   {"command": ["python", "server.py"]}
///   {"command": "python", "args": ["server.py"]}
///   {"container": "db", "command": ["python", "server.py"], "exec": "docker"}
/// The container form expands to [exec, "exec", "-i", container, ...command].
/// Optional: "cwd" (string), "env" (object of strings).
/// Throws ConfigurationError.
LaunchSpec parse_launch_spec(const std::string& name, const nlohmann::ordered_json& entry);

/// Parse {name: entry, ...} or {"mcpServers": {name: entry, ...}}, keeping document order.
std::vector<ServerConfig> load_server_configs(const nlohmann::ordered_json& document);

/// load_server_configs() on JSON text. Throws ConfigurationError if the text is not JSON.
std::vector<ServerConfig> parse_server_configs(const std::string& json_text);

/// Read and parse a config file. Throws ConfigurationError if unreadable.
std::vector<ServerConfig> load_server_configs_file(const std::string& path);

} // namespace mcpbridge

#endif // MCPBRIDGE_CONFIG_HPP
