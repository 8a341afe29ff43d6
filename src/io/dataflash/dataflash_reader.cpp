/**
 * @file dataflash_reader.cpp
 * @brief Implementation of the DataFlash log decoder.
 *
 * Decoding runs in two passes. The first walks the byte stream, learns
 * message layouts from FMT messages and decodes every message it can.
 * The second ties TimeUS to UTC using the GPS anchor and emits records.
 */

#include "dataflash_reader.hpp"
#include "numeric_utils.hpp"
#include "physical_constants.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>

namespace fmet
{
namespace
{

constexpr std::size_t kHeaderLength = 3;
constexpr std::size_t kFmtNameLength = 4;
constexpr std::size_t kFmtFormatLength = 16;
constexpr std::size_t kFmtColumnsLength = 64;

struct RawMessage
{
    std::string type;
    std::map<std::string, double> fields;
};

/**
 * @brief Assembles an unsigned little-endian integer of N bytes.
 */
std::uint64_t read_le_bits(const std::uint8_t* p, std::size_t width)
{
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i)
    {
        value |= static_cast<std::uint64_t>(p[i]) << (8 * i);
    }
    return value;
}

std::int64_t sign_extend(std::uint64_t value, std::size_t width)
{
    const unsigned bits = static_cast<unsigned>(width * 8);
    if (bits >= 64)
    {
        return static_cast<std::int64_t>(value);
    }
    const std::uint64_t sign_bit = std::uint64_t{1} << (bits - 1);
    return static_cast<std::int64_t>((value ^ sign_bit) - sign_bit);
}

float read_le_f32(const std::uint8_t* p)
{
    const std::uint32_t bits = static_cast<std::uint32_t>(read_le_bits(p, 4));
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double read_le_f64(const std::uint8_t* p)
{
    const std::uint64_t bits = read_le_bits(p, 8);
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

/**
 * @brief Widens an IEEE 754 binary16 value, keeping subnormals, infinities and NaN.
 */
double half_to_double(std::uint16_t bits)
{
    const double sign = (bits & 0x8000u) ? -1.0 : 1.0;
    const int exponent = (bits >> 10) & 0x1f;
    const int mantissa = bits & 0x3ff;

    if (exponent == 0)
    {
        return sign * std::ldexp(static_cast<double>(mantissa), -24);
    }
    if (exponent == 0x1f)
    {
        return mantissa == 0 ? sign * std::numeric_limits<double>::infinity() : numeric::quiet_nan();
    }
    return sign * std::ldexp(static_cast<double>(mantissa | 0x400), exponent - 25);
}

/**
 * @brief Byte width of one DataFlash format character, 0 when unknown.
 */
std::size_t format_char_size(char c)
{
    switch (c)
    {
        case 'b':
        case 'B':
        case 'M':
            return 1;
        case 'h':
        case 'H':
        case 'c':
        case 'C':
        case 'g':
            return 2;
        case 'i':
        case 'I':
        case 'f':
        case 'e':
        case 'E':
        case 'L':
        case 'n':
            return 4;
        case 'q':
        case 'Q':
        case 'd':
            return 8;
        case 'N':
            return 16;
        case 'Z':
        case 'a':
            return 64;
        default:
            return 0;
    }
}

/**
 * @brief Decodes one numeric field, or nothing for text and array fields.
 */
std::optional<double> decode_field(char c, const std::uint8_t* p)
{
    switch (c)
    {
        case 'b':
            return static_cast<double>(sign_extend(read_le_bits(p, 1), 1));
        case 'B':
        case 'M':
            return static_cast<double>(p[0]);
        case 'h':
            return static_cast<double>(sign_extend(read_le_bits(p, 2), 2));
        case 'H':
            return static_cast<double>(read_le_bits(p, 2));
        case 'i':
            return static_cast<double>(sign_extend(read_le_bits(p, 4), 4));
        case 'I':
            return static_cast<double>(read_le_bits(p, 4));
        case 'q':
            return static_cast<double>(sign_extend(read_le_bits(p, 8), 8));
        case 'Q':
            return static_cast<double>(read_le_bits(p, 8));
        case 'g':
            return half_to_double(static_cast<std::uint16_t>(read_le_bits(p, 2)));
        case 'f':
            return static_cast<double>(read_le_f32(p));
        case 'd':
            return read_le_f64(p);
        case 'c':
            return static_cast<double>(sign_extend(read_le_bits(p, 2), 2)) * 0.01;
        case 'C':
            return static_cast<double>(read_le_bits(p, 2)) * 0.01;
        case 'e':
            return static_cast<double>(sign_extend(read_le_bits(p, 4), 4)) * 0.01;
        case 'E':
            return static_cast<double>(read_le_bits(p, 4)) * 0.01;
        case 'L':
            return static_cast<double>(sign_extend(read_le_bits(p, 4), 4)) * 1.0e-7;
        default:
            return std::nullopt;
    }
}

/**
 * @brief Reads a NUL-padded fixed-width text field.
 */
std::string fixed_string(const std::uint8_t* p, std::size_t width)
{
    std::size_t len = 0;
    while (len < width && p[len] != 0)
    {
        ++len;
    }
    return std::string(reinterpret_cast<const char*>(p), len);
}

/**
 * @brief Parses an FMT payload starting right after the message header.
 */
bool parse_fmt_payload(const std::uint8_t* p, DataflashMessageFormat& out)
{
    out.type = p[0];
    out.length = p[1];
    out.name = strutil::trim_copy(fixed_string(p + 2, kFmtNameLength));
    out.format = fixed_string(p + 2 + kFmtNameLength, kFmtFormatLength);
    const std::string columns = fixed_string(p + 2 + kFmtNameLength + kFmtFormatLength, kFmtColumnsLength);
    out.columns.clear();
    if (!columns.empty())
    {
        out.columns = strutil::split_trimmed(columns, ',');
    }

    std::size_t payload = 0;
    if (out.name.empty() || !dataflash_format_size(out.format, payload))
    {
        return false;
    }
    if (payload + kHeaderLength != out.length || out.columns.size() != out.format.size())
    {
        return false;
    }
    return true;
}

void decode_message(const DataflashMessageFormat& fmt, const std::uint8_t* payload, RawMessage& out)
{
    out.type = fmt.name;
    out.fields.clear();
    std::size_t offset = 0;
    for (std::size_t i = 0; i < fmt.format.size(); ++i)
    {
        const char c = fmt.format[i];
        const std::optional<double> value = decode_field(c, payload + offset);
        if (value)
        {
            out.fields[fmt.columns[i]] = *value;
        }
        offset += format_char_size(c);
    }
}

/**
 * @brief First pass: byte stream to raw messages in decode order.
 */
std::vector<RawMessage> decode_messages(const std::vector<std::uint8_t>& bytes, DataflashReadStats& stats)
{
    std::map<std::uint8_t, DataflashMessageFormat> formats;
    std::vector<RawMessage> messages;

    const std::size_t n = bytes.size();
    std::size_t pos = 0;
    while (pos + kHeaderLength <= n)
    {
        if (bytes[pos] != dataflash_head_byte1 || bytes[pos + 1] != dataflash_head_byte2)
        {
            ++stats.skipped_bytes;
            ++pos;
            continue;
        }

        const std::uint8_t type = bytes[pos + 2];
        if (type == dataflash_fmt_type)
        {
            if (pos + dataflash_fmt_length > n)
            {
                ++stats.truncated_messages;
                break;
            }
            DataflashMessageFormat fmt;
            if (parse_fmt_payload(bytes.data() + pos + kHeaderLength, fmt))
            {
                formats[fmt.type] = fmt;
                ++stats.formats_defined;
            }
            else
            {
                ++stats.malformed_messages;
            }
            pos += dataflash_fmt_length;
            continue;
        }

        const auto it = formats.find(type);
        if (it == formats.end())
        {
            ++stats.unknown_type_messages;
            ++pos;
            continue;
        }

        const DataflashMessageFormat& fmt = it->second;
        if (pos + fmt.length > n)
        {
            ++stats.truncated_messages;
            break;
        }

        RawMessage message;
        decode_message(fmt, bytes.data() + pos + kHeaderLength, message);
        messages.push_back(std::move(message));
        ++stats.messages_decoded;
        pos += fmt.length;
    }

    // Trailing bytes too short for a header.
    if (pos < n && pos + kHeaderLength > n)
    {
        stats.skipped_bytes += n - pos;
    }
    return messages;
}

/**
 * @brief Finds the boot-clock to UTC offset from the first usable GPS fix.
 */
std::optional<double> find_utc_offset(const std::vector<RawMessage>& messages)
{
    using namespace physical_constants;

    for (const auto& message : messages)
    {
        if (message.type != "GPS")
        {
            continue;
        }
        const auto week = message.fields.find("GWk");
        const auto week_ms = message.fields.find("GMS");
        const auto time_us = message.fields.find("TimeUS");
        if (week == message.fields.end() || week_ms == message.fields.end() ||
            time_us == message.fields.end() || week->second <= 0.0)
        {
            continue;
        }
        return week->second * seconds_per_gps_week + week_ms->second / 1000.0 +
               gps_to_unix_offset_s - gps_leap_seconds - time_us->second / 1.0e6;
    }
    return std::nullopt;
}

void report_decode_warnings(const DataflashReadStats& stats)
{
    if (stats.skipped_bytes > 0)
    {
        log_warning("Skipped " + std::to_string(stats.skipped_bytes) +
                    " bytes outside message boundaries while resynchronising");
    }
    if (stats.unknown_type_messages > 0)
    {
        log_warning("Skipped " + std::to_string(stats.unknown_type_messages) +
                    " headers with no preceding FMT definition");
    }
    if (stats.malformed_messages > 0)
    {
        log_warning("Ignored " + std::to_string(stats.malformed_messages) + " malformed FMT messages");
    }
    if (stats.truncated_messages > 0)
    {
        log_warning("Log ends with a truncated message");
    }
    if (!stats.time_anchored)
    {
        log_warning("No GPS message with a valid week number; record times are undefined");
    }
}

} // namespace

bool dataflash_format_size(const std::string& format, std::size_t& size)
{
    std::size_t total = 0;
    for (const char c : format)
    {
        const std::size_t width = format_char_size(c);
        if (width == 0)
        {
            return false;
        }
        total += width;
    }
    size = total;
    return true;
}

FlightRecordStream read_dataflash_bytes(const std::vector<std::uint8_t>& bytes, DataflashReadStats* stats)
{
    DataflashReadStats local;
    const std::vector<RawMessage> messages = decode_messages(bytes, local);

    const std::optional<double> offset = find_utc_offset(messages);
    local.time_anchored = offset.has_value();
    local.utc_offset_s = offset.value_or(0.0);

    FlightRecordStream records;
    records.reserve(messages.size());
    for (const auto& message : messages)
    {
        const auto time_us = message.fields.find("TimeUS");
        if (time_us == message.fields.end())
        {
            ++local.records_without_time;
            continue;
        }

        FlightRecord record;
        record.type = message.type;
        record.fields = message.fields;
        record.timestamp = offset ? time_us->second / 1.0e6 + *offset : numeric::quiet_nan();
        records.push_back(std::move(record));
    }
    local.records_emitted = records.size();

    report_decode_warnings(local);
    if (log_debug_enabled())
    {
        std::cout << "DataFlash: " << local.formats_defined << " formats, " << local.messages_decoded
                  << " messages, " << local.records_emitted << " timed records" << std::endl;
        if (local.time_anchored)
        {
            std::cout << "DataFlash: boot clock to UTC offset " << local.utc_offset_s << " s" << std::endl;
        }
    }

    if (stats)
    {
        *stats = local;
    }
    return records;
}

FlightRecordStream read_dataflash_file(const std::filesystem::path& path, DataflashReadStats* stats)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Failed to open flight log: " + path.string());
    }

    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                          std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw std::runtime_error("Failed to read flight log: " + path.string());
    }
    if (bytes.empty())
    {
        throw std::runtime_error("Flight log is empty: " + path.string());
    }

    if (log_normal_enabled())
    {
        std::cout << "Reading " << path.string() << " (" << bytes.size() << " bytes)" << std::endl;
    }
    return read_dataflash_bytes(bytes, stats);
}

} // namespace fmet
