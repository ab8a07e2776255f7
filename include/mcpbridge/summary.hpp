#ifndef MCPBRIDGE_SUMMARY_HPP
#define MCPBRIDGE_SUMMARY_HPP

#include <cstddef>
#include <string>

namespace mcpbridge
{

constexpr std::size_t DEFAULT_SUMMARY_MAX_CHARS = 5000;

/// Shorten a large tool result so it fits an LLM context.
/// Results within max_chars come back unchanged. JSON results are summarized
/// structurally (sequence counts, record previews, key lists), anything else is
/// truncated with a note saying how much was cut.
std::string summarize_large_result(const std::string& result,
                                   std::size_t max_chars = DEFAULT_SUMMARY_MAX_CHARS);

} // namespace mcpbridge

#endif // MCPBRIDGE_SUMMARY_HPP
