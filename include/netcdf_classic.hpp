#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "observation_table.hpp"

/**
 * @file netcdf_classic.hpp
 * @brief NetCDF classic (CDF-1) observation file writer and reader.
 *
 * The writer emits a single fixed dimension `time` with the coordinate
 * variables `time` and `observation` and one double variable per
 * measured or derived column. The reader parses classic and 64-bit
 * offset headers and fixed-size variable data.
 */

namespace fmet
{

inline constexpr std::int32_t nc_byte = 1;
inline constexpr std::int32_t nc_char = 2;
inline constexpr std::int32_t nc_short = 3;
inline constexpr std::int32_t nc_int = 4;
inline constexpr std::int32_t nc_float = 5;
inline constexpr std::int32_t nc_double = 6;

struct NetcdfAttribute
{
    std::int32_t type = 0;
    std::size_t element_count = 0;
    std::vector<std::uint8_t> raw;
};

struct NetcdfDimension
{
    std::string name;
    std::uint64_t length = 0;
    bool unlimited = false;
};

struct NetcdfVariable
{
    std::string name;
    std::vector<std::int32_t> dim_ids;
    std::map<std::string, NetcdfAttribute> attributes;
    std::int32_t type = 0;
    std::uint32_t vsize = 0;
    std::uint64_t begin = 0;
};

struct NetcdfClassicHeader
{
    int version = 0;
    std::uint64_t num_records = 0;
    std::vector<NetcdfDimension> dimensions;
    std::map<std::string, NetcdfAttribute> global_attributes;
    std::vector<NetcdfVariable> variables;

    const NetcdfVariable* find_variable(const std::string& name) const;
};

struct NetcdfWriteOptions
{
    std::string title = "Flight meteorological observations";
    std::string source;
    std::string history;
};

/**
 * @brief Writes an observation table as a CDF-1 file.
 * @throws std::runtime_error for an empty table or a failed write.
 */
void write_netcdf_classic(const ObservationTable& table,
                          const std::filesystem::path& path,
                          const NetcdfWriteOptions& options);

/**
 * @brief Parses the header of a classic or 64-bit offset file.
 * @throws std::runtime_error on a malformed or unsupported file.
 */
NetcdfClassicHeader read_netcdf_classic_header(const std::filesystem::path& path);

/**
 * @brief Reads a fixed-size numeric variable as doubles.
 * @throws std::runtime_error for record or unsupported variables.
 */
std::vector<double> read_netcdf_variable(const std::filesystem::path& path,
                                         const NetcdfClassicHeader& header,
                                         const NetcdfVariable& variable);

/**
 * @brief Reads an observation table back from a file written by write_netcdf_classic().
 *
 * Placeholder columns are not stored in the file and come back NaN.
 */
ObservationTable read_netcdf_observation_table(const std::filesystem::path& path);

/**
 * @brief Returns a char attribute as text, or empty for other types.
 */
std::string netcdf_attribute_text(const NetcdfAttribute& attribute);

/**
 * @brief Returns a numeric attribute as doubles, or empty for char attributes.
 */
std::vector<double> netcdf_attribute_values(const NetcdfAttribute& attribute);

} // namespace fmet
