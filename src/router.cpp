#include <algorithm>
#include <mcpbridge/bridge.hpp>
#include <mcpbridge/errors.hpp>
#include <mcpbridge/router.hpp>
#include <optional>

namespace mcpbridge
{

ToolRouter::ToolRouter(ProtocolBridge& bridge, RouterOptions options)
    : bridge_(bridge), options_(options)
{
}

void ToolRouter::add_route(const std::string& function, const std::string& server,
                           const std::string& tool)
{
    if (function.empty() || server.empty() || tool.empty())
        throw ConfigurationError("Route needs a function name, a server and a tool");
    routes_[function] = Route{server, tool};
}

bool ToolRouter::has_route(const std::string& function) const
{
    return routes_.count(function) > 0;
}

std::string ToolRouter::execute(const std::string& function, const json& arguments)
{
    auto it = routes_.find(function);
    if (it == routes_.end())
        throw ConfigurationError("Unknown function: " + function);

    const Route& route = it->second;
    auto result = bridge_.try_call_tool(route.server, route.tool,
                                        arguments.is_null() ? json::object() : arguments);
    if (!result)
        return "Error: " + result.error().message;

    std::string text = to_display_string(result.value());
    if (!options_.summarize)
        return text;
    return summarize_large_result(text, options_.max_result_chars);
}

ToolCallback ToolRouter::make_callback(const std::string& function)
{
    if (!has_route(function))
        throw ConfigurationError("Unknown function: " + function);

    return [this, function](const json& arguments) { return execute(function, arguments); };
}

json ToolRouter::function_definitions()
{
    // One tools/list per server; nullopt marks a server that could not be listed
    std::map<std::string, std::optional<std::vector<ToolDescriptor>>> listed;
    for (const auto& [function, route] : routes_)
    {
        if (listed.count(route.server))
            continue;
        auto tools = bridge_.try_list_tools(route.server);
        if (tools)
            listed[route.server] = tools.value();
        else
            listed[route.server] = std::nullopt;
    }

    json definitions = json::array();
    for (const auto& [function, route] : routes_)
    {
        const auto& tools = listed[route.server];
        if (!tools)
            continue;

        auto it = std::find_if(tools->begin(), tools->end(),
                               [&route](const ToolDescriptor& t) { return t.name == route.tool; });
        if (it == tools->end())
            throw ConfigurationError("Server " + route.server + " does not offer tool " +
                                     route.tool + " (routed as " + function + ")");

        json parameters = it->input_schema;
        if (!parameters.is_object() || parameters.empty())
            parameters = {{"type", "object"}, {"properties", json::object()}};

        definitions.push_back(
            {{"name", function}, {"description", it->description}, {"parameters", parameters}});
    }
    return definitions;
}

} // namespace mcpbridge
