#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "conversion.hpp"
#include "runtime_log.hpp"

/**
 * @file runtime_config.hpp
 * @brief Runtime configuration bundle and parsing helpers.
 *
 * Declares the option bundle consumed by the converter runtime and the
 * helpers used while reading YAML-like key/value configuration files.
 * Values that fail to parse are reported and leave the default in place.
 */

namespace fmet
{

struct OutputConfig
{
    bool write_text = true;
    bool write_netcdf = true;
    std::string validation_report_path;
};

struct RuntimeConfig
{
    ConversionConfig conversion{};
    OutputConfig output{};
};

/**
 * @brief Returns a lowercased copy of the input.
 * @param value Input string.
 * @return Lowercased string.
 */
std::string to_lower_copy(std::string value);

/**
 * @brief Parses a strict boolean value.
 * @param value Input string.
 * @param out Parsed boolean output.
 * @return True for 1/true/yes/on or 0/false/no/off (case-insensitive).
 */
bool try_parse_bool_value(const std::string& value, bool& out);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive odd integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse with a positive odd result.
 */
bool try_parse_positive_odd_int_value(const std::string& value, int& out);

/**
 * @brief Parses a floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse of a finite value.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map with dotted section keys.
 * @throws std::runtime_error when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies parsed configuration keys onto a runtime config.
 * @param config Parsed dotted key/value map.
 * @param runtime Configuration to update in place.
 * @return Number of keys that were rejected.
 */
int apply_config_values(const std::unordered_map<std::string, std::string>& config,
                        RuntimeConfig& runtime);

/**
 * @brief Loads runtime configuration from disk.
 * @param config_path Path to configuration file; empty keeps defaults.
 * @param runtime Configuration to update in place.
 */
void load_config(const std::string& config_path, RuntimeConfig& runtime);

} // namespace fmet
