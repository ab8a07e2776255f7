#include <mcpbridge/summary.hpp>
#include <mcpbridge/types.hpp>
#include <sstream>

namespace mcpbridge
{

namespace
{

constexpr std::size_t FASTA_SNIFF_CHARS = 1000;
constexpr std::size_t FASTA_PREVIEW_SEQUENCES = 2;
constexpr std::size_t RECORD_PREVIEW_COUNT = 3;
constexpr std::size_t RECORD_PREVIEW_FIELDS = 5;
constexpr std::size_t FIELD_PREVIEW_CHARS = 100;
constexpr std::size_t ITEM_PREVIEW_CHARS = 200;
constexpr std::size_t KEY_PREVIEW_COUNT = 10;

bool is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Lengths and cuts count UTF-8 code points, never splitting a multi-byte sequence
std::size_t utf8_length(const std::string& text)
{
    std::size_t count = 0;
    for (char c : text)
        if (!is_continuation_byte(c))
            ++count;
    return count;
}

// Byte offset just past the first max_chars code points
std::size_t utf8_offset(const std::string& text, std::size_t max_chars)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (is_continuation_byte(text[i]))
            continue;
        if (seen == max_chars)
            return i;
        ++seen;
    }
    return text.size();
}

std::string clip(const std::string& text, std::size_t max)
{
    return text.substr(0, utf8_offset(text, max));
}

// Strings print bare, everything else as compact JSON
std::string scalar_text(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Serialized form with JSON string escapes resolved so FASTA headers and
// newlines inside string values are visible
std::string flatten(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();

    std::string out;
    if (value.is_object())
    {
        for (auto it = value.begin(); it != value.end(); ++it)
            out += it.key() + ":\n" + flatten(it.value()) + "\n";
    }
    else if (value.is_array())
    {
        for (const auto& item : value)
            out += flatten(item) + "\n";
    }
    else
    {
        out = scalar_text(value);
    }
    return out;
}

std::optional<std::string> summarize_fasta(const json& data)
{
    std::string text = flatten(data);
    bool looks_like_fasta = clip(text, FASTA_SNIFF_CHARS).find('>') != std::string::npos;
    if (!data.contains("sequences") && !looks_like_fasta)
        return std::nullopt;

    std::size_t count = 0;
    for (char c : text)
        if (c == '>')
            ++count;
    if (count == 0)
        return std::nullopt;

    std::ostringstream oss;
    oss << "Retrieved " << count << " sequences\n\n\nFirst " << FASTA_PREVIEW_SEQUENCES
        << " sequences (preview):\n";

    std::istringstream lines(text);
    std::string line;
    std::size_t seen = 0;
    std::string preview;
    while (std::getline(lines, line))
    {
        if (!line.empty() && line.front() == '>' && ++seen > FASTA_PREVIEW_SEQUENCES)
            break;
        preview += (preview.empty() ? "" : "\n") + line;
    }
    oss << preview << "\n\n... and "
        << (count > FASTA_PREVIEW_SEQUENCES ? count - FASTA_PREVIEW_SEQUENCES : 0)
        << " more sequences";
    return oss.str();
}

std::optional<std::string> summarize_records(const json& data)
{
    const char* key = data.contains("records") ? "records" : "results";
    if (!data.contains(key))
        return std::nullopt;

    const json& records = data[key];
    if (!records.is_array() || records.empty())
        return std::nullopt;

    std::ostringstream oss;
    oss << "Retrieved " << records.size() << " records\n\nFirst " << RECORD_PREVIEW_COUNT
        << " records (preview):";

    for (std::size_t i = 0; i < records.size() && i < RECORD_PREVIEW_COUNT; ++i)
    {
        const json& record = records[i];
        oss << "\n\nRecord " << (i + 1) << ":";
        if (record.is_object())
        {
            std::size_t fields = 0;
            for (auto it = record.begin(); it != record.end() && fields < RECORD_PREVIEW_FIELDS;
                 ++it, ++fields)
                oss << "\n  " << it.key() << ": "
                    << clip(scalar_text(it.value()), FIELD_PREVIEW_CHARS);
        }
        else
        {
            oss << "\n  " << clip(scalar_text(record), ITEM_PREVIEW_CHARS);
        }
    }

    if (records.size() > RECORD_PREVIEW_COUNT)
        oss << "\n\n... and " << (records.size() - RECORD_PREVIEW_COUNT) << " more records";
    return oss.str();
}

std::string summarize_object(const json& data)
{
    std::ostringstream oss;
    oss << "Result contains " << data.size() << " top-level keys\nKeys: ";

    std::size_t shown = 0;
    for (auto it = data.begin(); it != data.end() && shown < KEY_PREVIEW_COUNT; ++it, ++shown)
        oss << (shown ? ", " : "") << it.key();

    if (data.size() > KEY_PREVIEW_COUNT)
        oss << "\n... and " << (data.size() - KEY_PREVIEW_COUNT) << " more keys";
    return oss.str();
}

std::string summarize_array(const json& data)
{
    std::ostringstream oss;
    oss << "Retrieved " << data.size() << " items";
    if (data.empty())
        return oss.str();

    oss << "\n\nFirst " << RECORD_PREVIEW_COUNT << " items (preview):";
    for (std::size_t i = 0; i < data.size() && i < RECORD_PREVIEW_COUNT; ++i)
        oss << "\n\n" << (i + 1) << ". " << clip(scalar_text(data[i]), ITEM_PREVIEW_CHARS);

    if (data.size() > RECORD_PREVIEW_COUNT)
        oss << "\n\n... and " << (data.size() - RECORD_PREVIEW_COUNT) << " more items";
    return oss.str();
}

} // namespace

std::string summarize_large_result(const std::string& result, std::size_t max_chars)
{
    const std::size_t length = utf8_length(result);
    if (length <= max_chars)
        return result;

    json data = json::parse(result, nullptr, false);
    if (data.is_object())
    {
        if (auto summary = summarize_fasta(data))
            return *summary;
        if (auto summary = summarize_records(data))
            return *summary;
        return summarize_object(data);
    }
    if (data.is_array())
        return summarize_array(data);

    return clip(result, max_chars) + "\n\n... [Output truncated: " +
           std::to_string(length - max_chars) + " more characters.]";
}

} // namespace mcpbridge
