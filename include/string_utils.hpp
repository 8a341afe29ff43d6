#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by config, decoder and report code.
 *
 * Case normalization, trimming, field splitting, quote stripping
 * and JSON escaping for the config reader, the log
 * decoder, the text table reader and report output.
 */

namespace fmet
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 * @param value Source string view.
 * @return Trimmed string.
 */
inline std::string trim_copy(std::string_view value)
{
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])))
    {
        ++start;
    }
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])))
    {
        --end;
    }
    return std::string(value.substr(start, end - start));
}

/**
 * @brief Splits on a single separator character and trims every field.
 *
 * Empty fields are kept, so "a,,b" yields three fields. An empty input
 * yields one empty field.
 */
inline std::vector<std::string> split_trimmed(std::string_view value, char separator)
{
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = value.find(separator, start);
        if (pos == std::string_view::npos)
        {
            fields.push_back(trim_copy(value.substr(start)));
            break;
        }
        fields.push_back(trim_copy(value.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

/**
 * @brief Removes one pair of matching single or double quotes.
 */
inline std::string unquote_copy(std::string_view value)
{
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
    {
        return std::string(value.substr(1, value.size() - 2));
    }
    return std::string(value);
}

/**
 * @brief Escapes control characters for safe JSON string emission.
 * @param value Input string view.
 * @return Escaped JSON-safe string.
 */
inline std::string json_escape(std::string_view value)
{
    std::ostringstream oss;
    for (char c : value)
    {
        switch (c)
        {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

} // namespace strutil
} // namespace fmet
