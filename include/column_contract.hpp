#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "observation_table.hpp"

/**
 * @file column_contract.hpp
 * @brief Column metadata contract shared by writers, readers and QA.
 *
 * Captures the identity of every observation column: its text header,
 * NetCDF variable name and attributes, text precision, role and the
 * plausible bounds used by the column quality report.
 */

namespace fmet
{

enum class ColumnRole
{
    Index,
    Coordinate,
    Measured,
    Derived,
    Placeholder,
};

struct ColumnBounds
{
    bool has_min = false;
    bool has_max = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

struct ColumnContract
{
    std::string id;
    std::string netcdf_name;
    std::string units;
    std::string standard_name;
    std::string long_name;
    int text_precision = 6;
    ColumnRole role = ColumnRole::Measured;
    ColumnBounds default_bounds{};
    std::vector<std::string> aliases;
};

/**
 * @brief Returns the observation column table in text column order.
 * @return Immutable list of column contracts.
 */
const std::vector<ColumnContract>& observation_column_contracts();

/**
 * @brief Finds a contract by text id, NetCDF name or alias.
 * @param id_or_alias Column identifier.
 * @return Pointer to matched contract, or null if not found.
 */
const ColumnContract* find_column_contract(std::string_view id_or_alias);

/**
 * @brief Returns the double-valued data variables written to NetCDF.
 *
 * Excludes the two coordinates (time, observation) and the placeholders.
 */
std::vector<const ColumnContract*> netcdf_data_columns();

/**
 * @brief Reads the value of one column from a row.
 * @param row Source row.
 * @param contract Column to read.
 * @return Column value as double (obs and time are widened).
 */
double column_value(const AggregatedRow& row, const ColumnContract& contract);

/**
 * @brief Stores a value into one column of a row.
 * @param row Destination row.
 * @param contract Column to write.
 * @param value Value; obs and time are truncated toward zero.
 * @throws std::runtime_error when an obs or time value does not fit its integer type.
 */
void set_column_value(AggregatedRow& row, const ColumnContract& contract, double value);

/**
 * @brief Extracts a whole column from a table.
 */
std::vector<double> extract_column(const ObservationTable& table, const ColumnContract& contract);

/**
 * @brief Converts column role enum to text.
 */
const char* to_string(ColumnRole value);

} // namespace fmet
