#pragma once

#include <filesystem>
#include <istream>
#include <ostream>

#include "observation_table.hpp"

/**
 * @file text_table.hpp
 * @brief Comma-separated observation table output and readback.
 *
 * One header row of column ids followed by one row per observation.
 * Missing values are written as the literal token NaN. Precision per
 * column comes from the column contract.
 */

namespace fmet
{

/**
 * @brief Streams a table in text form.
 */
void format_text_table(const ObservationTable& table, std::ostream& os);

/**
 * @brief Writes a table to a text file.
 * @throws std::runtime_error when the file cannot be written.
 */
void write_text_table(const ObservationTable& table, const std::filesystem::path& path);

/**
 * @brief Parses a table from text form.
 *
 * Columns are matched by header name; unknown columns are ignored and
 * absent ones stay NaN.
 *
 * @throws std::runtime_error on a missing header or a malformed row.
 */
ObservationTable parse_text_table(std::istream& in);

/**
 * @brief Reads a table from a text file.
 * @throws std::runtime_error when the file cannot be opened or parsed.
 */
ObservationTable read_text_table(const std::filesystem::path& path);

} // namespace fmet
