#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "flight_record.hpp"

/**
 * @file dataflash_reader.hpp
 * @brief ArduPilot DataFlash (.bin) log decoder.
 *
 * Decodes the self-describing binary log into FlightRecords with
 * absolute UTC timestamps. The boot clock (TimeUS) is tied to UTC by the
 * first GPS message that carries a valid GPS week.
 */

namespace fmet
{

inline constexpr std::uint8_t dataflash_head_byte1 = 0xA3;
inline constexpr std::uint8_t dataflash_head_byte2 = 0x95;
inline constexpr std::uint8_t dataflash_fmt_type = 128;
inline constexpr std::size_t dataflash_fmt_length = 89;

struct DataflashMessageFormat
{
    std::uint8_t type = 0;
    std::uint8_t length = 0;
    std::string name;
    std::string format;
    std::vector<std::string> columns;
};

struct DataflashReadStats
{
    std::size_t messages_decoded = 0;
    std::size_t formats_defined = 0;
    std::size_t records_emitted = 0;
    std::size_t records_without_time = 0;
    std::size_t skipped_bytes = 0;
    std::size_t unknown_type_messages = 0;
    std::size_t malformed_messages = 0;
    std::size_t truncated_messages = 0;
    bool time_anchored = false;
    double utc_offset_s = 0.0;
};

/**
 * @brief Returns the payload size implied by a format string.
 * @param format DataFlash format characters.
 * @param size Output byte count.
 * @return False when the format contains an unknown character.
 */
bool dataflash_format_size(const std::string& format, std::size_t& size);

/**
 * @brief Decodes a DataFlash log held in memory.
 * @param bytes Raw log contents.
 * @param stats Optional decoder counters output.
 * @return Records in decode order. Timestamps are NaN when the log has no GPS time anchor.
 */
FlightRecordStream read_dataflash_bytes(const std::vector<std::uint8_t>& bytes,
                                        DataflashReadStats* stats = nullptr);

/**
 * @brief Decodes a DataFlash log file.
 * @param path Log path.
 * @param stats Optional decoder counters output.
 * @return Records in decode order.
 * @throws std::runtime_error when the file cannot be read.
 */
FlightRecordStream read_dataflash_file(const std::filesystem::path& path,
                                       DataflashReadStats* stats = nullptr);

} // namespace fmet
