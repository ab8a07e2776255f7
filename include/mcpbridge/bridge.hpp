#ifndef MCPBRIDGE_BRIDGE_HPP
#define MCPBRIDGE_BRIDGE_HPP

#include <mcpbridge/result.hpp>
#include <mcpbridge/transport.hpp>
#include <mcpbridge/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge
{

/**
 * Bridge between an agent orchestrator and a named set of MCP tool servers.
 *
 * Each configured server becomes one connection: a child process plus its
 * JSON-RPC state. Requests on a connection are strictly one at a time (no
 * pipelining); different connections are independent and may be used from
 * different threads.
 *
 * Typical use:
 *   ProtocolBridge bridge(BridgeOptions::from_environment());
 *   bridge.configure({{"database", {{"docker", "exec", "-i", "db", "python", "server.py"}}}});
 *   bridge.start_all();
 *   auto result = bridge.call_tool("database", "get_taxonomy", {{"query", "Salmo salar"}});
 *   bridge.shutdown();
 */
class ProtocolBridge
{
  public:
    explicit ProtocolBridge(BridgeOptions options = BridgeOptions{});
    // Test-only/advanced: inject a custom transport per connection.
    ProtocolBridge(BridgeOptions options, TransportFactory transport_factory);
    ~ProtocolBridge();

    // No copy, move only
    ProtocolBridge(const ProtocolBridge&) = delete;
    ProtocolBridge& operator=(const ProtocolBridge&) = delete;
    ProtocolBridge(ProtocolBridge&&) noexcept;
    ProtocolBridge& operator=(ProtocolBridge&&) noexcept;

    /// Register the servers to connect to, in start order. No I/O.
    /// Throws ConfigurationError on duplicate names, empty argv, or live connections.
    void configure(const std::vector<ServerConfig>& servers);

    /// Launch and handshake every unstarted connection.
    /// Throws PartialStartupFailure if any failed; the others stay running.
    void start_all();

    /// tools/list on one connection
    std::vector<ToolDescriptor> list_tools(const std::string& server);

    /// tools/call on one connection. Throws ToolInvocationError when the tool
    /// reports an error, and transport/protocol errors otherwise.
    ToolResult call_tool(const std::string& server, const std::string& tool,
                         const json& arguments = json::object());

    /// Non-throwing variants for callers that branch on ErrorKind
    Result<std::vector<ToolDescriptor>> try_list_tools(const std::string& server);
    Result<ToolResult> try_call_tool(const std::string& server, const std::string& tool,
                                     const json& arguments = json::object());

    /// Abort the in-flight request on a connection (from another thread).
    /// The aborted connection is closed. No-op for unknown or idle connections.
    void cancel(const std::string& server);

    /// Terminate every connection and clear the registry. Never throws.
    /// Safe to call repeatedly and while requests are in flight.
    void shutdown() noexcept;

    // Introspection
    std::vector<std::string> connection_names() const;
    ConnectionState state(const std::string& server) const;
    std::optional<json> server_info(const std::string& server) const;
    long get_pid(const std::string& server) const;
    bool is_torn_down() const;
    const BridgeOptions& options() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpbridge

#endif // MCPBRIDGE_BRIDGE_HPP
