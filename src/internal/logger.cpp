#include "logger.hpp"

#include <iostream>

namespace mcpbridge
{
namespace internal
{

Logger::Logger(std::optional<LogCallback> callback, LogLevel min_level)
    : callback_(std::move(callback)), min_level_(min_level)
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;

    // Serialize so lines from the stderr reader and the caller do not interleave
    std::lock_guard<std::mutex> lock(mutex_);

    if (callback_.has_value())
    {
        try
        {
            (*callback_)(level, message);
        }
        catch (const std::exception&)
        {
            // Ignore exceptions from user callback
        }
        return;
    }

    std::cerr << to_string(level) << ":mcpbridge:" << message << std::endl;
}

} // namespace internal
} // namespace mcpbridge
