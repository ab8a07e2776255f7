#ifndef MCPBRIDGE_INTERNAL_LOGGER_HPP
#define MCPBRIDGE_INTERNAL_LOGGER_HPP

#include <mcpbridge/types.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge
{
namespace internal
{

// Per-bridge log sink: the user's callback, or std::cerr when none is set
class Logger
{
  public:
    Logger(std::optional<LogCallback> callback, LogLevel min_level);

    bool enabled(LogLevel level) const
    {
        return level >= min_level_;
    }

    // Never throws; exceptions from the callback are dropped
    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    std::optional<LogCallback> callback_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

} // namespace internal
} // namespace mcpbridge

#endif // MCPBRIDGE_INTERNAL_LOGGER_HPP
