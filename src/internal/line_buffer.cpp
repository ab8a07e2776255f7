#include "line_buffer.hpp"

#include <mcpbridge/errors.hpp>

namespace mcpbridge
{
namespace internal
{

LineBuffer::LineBuffer(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

void LineBuffer::append(const char* data, size_t size)
{
    buffer_.append(data, size);

    // Only the incomplete tail counts against the limit
    size_t newline = buffer_.find('\n', scan_pos_);
    size_t pending = newline == std::string::npos ? buffer_.size() : newline;
    if (pending > max_buffer_size_)
    {
        size_t total = buffer_.size();
        clear();
        throw JSONDecodeError("Line exceeded maximum size of " + std::to_string(max_buffer_size_) +
                              " bytes (buffered " + std::to_string(total) + ")");
    }
}

std::optional<std::string> LineBuffer::extract_line()
{
    size_t pos = buffer_.find('\n', scan_pos_);
    if (pos == std::string::npos)
    {
        scan_pos_ = buffer_.size();
        return std::nullopt;
    }

    std::string line = buffer_.substr(0, pos + 1);
    buffer_.erase(0, pos + 1);
    scan_pos_ = 0;

    return line;
}

} // namespace internal
} // namespace mcpbridge
