#include <cstdlib>
#include <fstream>
#include <mcpbridge/config.hpp>
#include <mcpbridge/errors.hpp>
#include <sstream>

namespace mcpbridge
{

namespace
{

using ordered_json = nlohmann::ordered_json;

// Positive integer milliseconds from the environment, if set and valid
std::optional<std::chrono::milliseconds> env_millis(const char* var)
{
    const char* value = std::getenv(var);
    if (!value || !*value)
        return std::nullopt;

    try
    {
        size_t consumed = 0;
        long long ms = std::stoll(value, &consumed);
        if (consumed != std::string(value).size() || ms <= 0)
            return std::nullopt;
        return std::chrono::milliseconds(ms);
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

std::vector<std::string> string_array(const std::string& name, const char* field,
                                      const ordered_json& value)
{
    if (!value.is_array())
        throw ConfigurationError("Server '" + name + "': '" + field + "' must be an array");

    std::vector<std::string> out;
    for (const auto& item : value)
    {
        if (!item.is_string())
            throw ConfigurationError("Server '" + name + "': '" + field +
                                     "' must contain only strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

BridgeOptions BridgeOptions::from_environment()
{
    return from_environment(BridgeOptions{});
}

BridgeOptions BridgeOptions::from_environment(BridgeOptions base)
{
    if (auto ms = env_millis(EnvVar::RequestTimeoutMs))
        base.request_timeout = *ms;
    if (auto ms = env_millis(EnvVar::InitializeTimeoutMs))
        base.initialize_timeout = *ms;
    if (auto ms = env_millis(EnvVar::ShutdownTimeoutMs))
        base.graceful_shutdown_timeout = *ms;

    if (const char* level = std::getenv(EnvVar::LogLevel))
        if (auto parsed = parse_log_level(level))
            base.min_log_level = *parsed;

    return base;
}

LaunchSpec parse_launch_spec(const std::string& name, const ordered_json& entry)
{
    if (!entry.is_object())
        throw ConfigurationError("Server '" + name + "': entry must be an object");
    if (!entry.contains("command"))
        throw ConfigurationError("Server '" + name + "': missing 'command'");

    std::vector<std::string> command;
    const auto& cmd = entry["command"];
    if (cmd.is_string())
    {
        command.push_back(cmd.get<std::string>());
        if (entry.contains("args"))
        {
            auto args = string_array(name, "args", entry["args"]);
            command.insert(command.end(), args.begin(), args.end());
        }
    }
    else
    {
        command = string_array(name, "command", cmd);
    }

    if (command.empty() || command.front().empty())
        throw ConfigurationError("Server '" + name + "': 'command' is empty");

    LaunchSpec spec;

    if (entry.contains("container"))
    {
        const auto& container = entry["container"];
        if (!container.is_string() || container.get<std::string>().empty())
            throw ConfigurationError("Server '" + name + "': 'container' must be a non-empty string");

        std::string exec = "docker";
        if (entry.contains("exec"))
        {
            if (!entry["exec"].is_string() || entry["exec"].get<std::string>().empty())
                throw ConfigurationError("Server '" + name + "': 'exec' must be a non-empty string");
            exec = entry["exec"].get<std::string>();
        }

        spec.argv = {exec, "exec", "-i", container.get<std::string>()};
        spec.argv.insert(spec.argv.end(), command.begin(), command.end());
    }
    else
    {
        spec.argv = std::move(command);
    }

    if (entry.contains("cwd"))
    {
        if (!entry["cwd"].is_string())
            throw ConfigurationError("Server '" + name + "': 'cwd' must be a string");
        spec.working_directory = entry["cwd"].get<std::string>();
    }

    if (entry.contains("env"))
    {
        const auto& env = entry["env"];
        if (!env.is_object())
            throw ConfigurationError("Server '" + name + "': 'env' must be an object");
        for (auto it = env.begin(); it != env.end(); ++it)
        {
            if (!it.value().is_string())
                throw ConfigurationError("Server '" + name + "': env value for '" + it.key() +
                                         "' must be a string");
            spec.environment[it.key()] = it.value().get<std::string>();
        }
    }

    return spec;
}

std::vector<ServerConfig> load_server_configs(const ordered_json& document)
{
    if (!document.is_object())
        throw ConfigurationError("Server configuration must be a JSON object");

    const ordered_json* servers = &document;
    if (document.contains("mcpServers"))
    {
        servers = &document["mcpServers"];
        if (!servers->is_object())
            throw ConfigurationError("'mcpServers' must be an object");
    }

    std::vector<ServerConfig> configs;
    for (auto it = servers->begin(); it != servers->end(); ++it)
    {
        if (it.key().empty())
            throw ConfigurationError("Server name must not be empty");
        configs.push_back(ServerConfig{it.key(), parse_launch_spec(it.key(), it.value())});
    }
    return configs;
}

std::vector<ServerConfig> parse_server_configs(const std::string& json_text)
{
    ordered_json document;
    try
    {
        document = ordered_json::parse(json_text);
    }
    catch (const ordered_json::parse_error& e)
    {
        throw ConfigurationError(std::string("Invalid server configuration JSON: ") + e.what());
    }
    return load_server_configs(document);
}

std::vector<ServerConfig> load_server_configs_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("Cannot open server configuration file: " + path);

    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_server_configs(contents.str());
}

} // namespace mcpbridge
