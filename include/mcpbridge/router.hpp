#ifndef MCPBRIDGE_ROUTER_HPP
#define MCPBRIDGE_ROUTER_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <mcpbridge/summary.hpp>
#include <mcpbridge/types.hpp>
#include <string>

namespace mcpbridge
{

class ProtocolBridge;

struct Route
{
    std::string server;
    std::string tool;
};

struct RouterOptions
{
    std::size_t max_result_chars = DEFAULT_SUMMARY_MAX_CHARS;
    bool summarize = true;
};

/// Synchronous callback handed to the agent framework: arguments in, text out
using ToolCallback = std::function<std::string(const json& arguments)>;

/**
 * Maps agent-visible function names onto (server, tool) pairs.
 *
 * Failures are returned to the agent as "Error: ..." text rather than thrown,
 * so a bad argument becomes something the model can read and correct.
 */
class ToolRouter
{
  public:
    explicit ToolRouter(ProtocolBridge& bridge, RouterOptions options = RouterOptions{});

    void add_route(const std::string& function, const std::string& server,
                   const std::string& tool);
    bool has_route(const std::string& function) const;
    const std::map<std::string, Route>& routes() const
    {
        return routes_;
    }

    /// Throws ConfigurationError for an unknown function name
    std::string execute(const std::string& function, const json& arguments);

    /// Throws ConfigurationError for an unknown function name
    ToolCallback make_callback(const std::string& function);

    /**
     * Function definitions for the agent framework, one per route:
     * {"name": function, "description": ..., "parameters": <input schema>}.
     *
     * Descriptions and schemas come from each server's tools/list. Routes to a
     * server that cannot be listed are left out.
     * @throws ConfigurationError if a listed server does not offer a routed tool
     */
    json function_definitions();

  private:
    ProtocolBridge& bridge_;
    RouterOptions options_;
    std::map<std::string, Route> routes_;
};

} // namespace mcpbridge

#endif // MCPBRIDGE_ROUTER_HPP
