#include <algorithm>
#include <cctype>
#include <mcpbridge/types.hpp>

namespace mcpbridge
{

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    return std::nullopt;
}

const char* to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Unstarted:
        return "unstarted";
    case ConnectionState::Starting:
        return "starting";
    case ConnectionState::Handshaking:
        return "handshaking";
    case ConnectionState::Ready:
        return "ready";
    case ConnectionState::Closed:
        return "closed";
    }
    return "unknown";
}

// ============================================================================
// ToolDescriptor
// ============================================================================

std::vector<std::string> ToolDescriptor::required_arguments() const
{
    std::vector<std::string> names;
    if (input_schema.is_object() && input_schema.contains("required") &&
        input_schema["required"].is_array())
    {
        for (const auto& item : input_schema["required"])
            if (item.is_string())
                names.push_back(item.get<std::string>());
    }
    return names;
}

json ToolDescriptor::to_json() const
{
    return json{{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

ToolDescriptor ToolDescriptor::from_json(const json& j)
{
    ToolDescriptor tool;
    tool.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        tool.description = j["description"].get<std::string>();

    if (j.contains("inputSchema"))
        tool.input_schema = j["inputSchema"];
    else if (j.contains("parameters"))
        tool.input_schema = j["parameters"];

    return tool;
}

// ============================================================================
// ToolResult
// ============================================================================

ToolResult unwrap_tool_result(const json& result)
{
    // Text-content convention: a non-empty list whose first item has "text"
    if (result.is_array() && !result.empty())
    {
        const auto& first = result.front();
        if (first.is_object() && first.contains("text"))
        {
            const auto& text = first["text"];
            return TextResult{text.is_string() ? text.get<std::string>() : text.dump()};
        }
    }

    if (result.is_object() || result.is_array())
        return StructuredResult{result};

    return RawValue{result};
}

json to_json(const ToolResult& result)
{
    if (const auto* text = std::get_if<TextResult>(&result))
        return text->text;
    if (const auto* structured = std::get_if<StructuredResult>(&result))
        return structured->value;
    return std::get<RawValue>(result).value;
}

std::string to_display_string(const ToolResult& result)
{
    if (const auto* text = std::get_if<TextResult>(&result))
        return text->text;

    json value = to_json(result);
    if (value.is_string())
        return value.get<std::string>();
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace mcpbridge
