#ifndef MCPBRIDGE_INTERNAL_LINE_BUFFER_HPP
#define MCPBRIDGE_INTERNAL_LINE_BUFFER_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace mcpbridge
{
namespace internal
{

// Reassembles newline-delimited lines from arbitrarily split chunks
class LineBuffer
{
  public:
    explicit LineBuffer(size_t max_buffer_size = 64 * 1024 * 1024);

    // Append raw bytes. Throws JSONDecodeError if the pending (incomplete)
    // line grows past max_buffer_size; the buffer is cleared in that case.
    void append(const char* data, size_t size);

    void append(const std::string& data)
    {
        append(data.data(), data.size());
    }

    // Remove and return the first complete line, '\n' included.
    // Bytes after it stay buffered.
    std::optional<std::string> extract_line();

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    size_t size() const
    {
        return buffer_.size();
    }

    // Clear buffer
    void clear()
    {
        buffer_.clear();
        scan_pos_ = 0;
    }

  private:
    std::string buffer_;
    size_t max_buffer_size_;
    // Bytes before this offset are known to contain no '\n'
    size_t scan_pos_ = 0;
};

} // namespace internal
} // namespace mcpbridge

#endif // MCPBRIDGE_INTERNAL_LINE_BUFFER_HPP
