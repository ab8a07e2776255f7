#ifndef MCPBRIDGE_TYPES_HPP
#define MCPBRIDGE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpbridge
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel
{
    Debug = 0,
    Info,
    Warning,
    Error,
};

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Receives every message at or above BridgeOptions::min_log_level.
/// May be invoked from the thread that drains a child's stderr.
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/// Receives each stderr line of a tool server (trailing newline stripped)
using StderrCallback = std::function<void(const std::string& line)>;

// ============================================================================
// Configuration
// ============================================================================

/// How to launch one tool server. argv[0] is looked up in PATH.
/// Any container-exec prefix ("docker", "exec", "-i", name, ...) is part of argv.
struct LaunchSpec
{
    std::vector<std::string> argv;
    std::optional<std::string> working_directory = std::nullopt;
    std::map<std::string, std::string> environment; // Overrides on top of the inherited env
};

/// One named tool server
struct ServerConfig
{
    std::string name;
    LaunchSpec launch;
};

/// Per-transport knobs, derived from BridgeOptions
struct TransportOptions
{
    std::size_t read_chunk_size = 64 * 1024;
    std::size_t max_line_size = 64 * 1024 * 1024;
    std::optional<StderrCallback> stderr_callback;
};

/// Everything a ProtocolBridge instance needs. Nothing is read from globals
/// unless from_environment() is used explicitly.
struct BridgeOptions
{
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds initialize_timeout{60000};
    std::chrono::milliseconds graceful_shutdown_timeout{2000};

    std::string protocol_version = "2024-11-05";
    std::string client_name = "mcpbridge";
    std::string client_version; // Empty: library version

    std::size_t read_chunk_size = 64 * 1024;
    std::size_t max_line_size = 64 * 1024 * 1024;

    /// Log sink. When unset, messages go to std::cerr.
    std::optional<LogCallback> log_callback;
    LogLevel min_log_level = LogLevel::Warning;

    /// Child stderr sink. When unset, stderr lines are logged at Debug level.
    std::optional<StderrCallback> stderr_callback;

    /// Defaults with MCPBRIDGE_* environment overrides applied
    static BridgeOptions from_environment();

    /// Apply MCPBRIDGE_* environment overrides on top of base
    static BridgeOptions from_environment(BridgeOptions base);
};

// ============================================================================
// Connection state
// ============================================================================

enum class ConnectionState
{
    Unstarted,
    Starting,
    Handshaking,
    Ready,
    Closed,
};

const char* to_string(ConnectionState state);

// ============================================================================
// Tools
// ============================================================================

/// Tool discovered via tools/list
struct ToolDescriptor
{
    std::string name;
    std::string description;
    json input_schema = json::object(); // JSON schema of the accepted arguments

    /// Names listed in input_schema.required
    std::vector<std::string> required_arguments() const;

    json to_json() const;

    /// Accepts both "inputSchema" (MCP) and "parameters" (function-calling style)
    static ToolDescriptor from_json(const json& j);
};

/// Result that followed the text-content convention: [{"type":"text","text":...}, ...]
struct TextResult
{
    std::string text;
};

/// Any other object or array result
struct StructuredResult
{
    json value;
};

/// A primitive result (string, number, boolean, null)
struct RawValue
{
    json value;
};

using ToolResult = std::variant<TextResult, StructuredResult, RawValue>;

/// The one place where the text-content convention is applied
ToolResult unwrap_tool_result(const json& result);

inline bool is_text_result(const ToolResult& result)
{
    return std::holds_alternative<TextResult>(result);
}

inline bool is_structured_result(const ToolResult& result)
{
    return std::holds_alternative<StructuredResult>(result);
}

inline bool is_raw_value(const ToolResult& result)
{
    return std::holds_alternative<RawValue>(result);
}

/// JSON view of a result: text becomes a JSON string
json to_json(const ToolResult& result);

/// Display form: text as-is, strings unquoted, everything else serialized
std::string to_display_string(const ToolResult& result);

} // namespace mcpbridge

#endif // MCPBRIDGE_TYPES_HPP
