#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "runtime_config.hpp"

/**
 * @file conversion_runtime.hpp
 * @brief File-level driver: decode a flight log, convert, write outputs.
 *
 * Exposes the entry point used by the converter executable. Output files
 * are written beside the input with the same stem.
 */

namespace fmet
{

inline constexpr int exit_success = 0;
inline constexpr int exit_fatal = 1;
inline constexpr int exit_output_errors = 2;

enum class CommandLineStatus
{
    Ok,
    Help,
    Error,
};

struct CommandLineOptions
{
    std::string config_path;
    std::string input_path;
    std::optional<LogProfile> log_profile;
    bool pause = true;
};

/**
 * @brief Parses the converter arguments.
 *
 * Scanning continues past the first error so that a later --no-pause is
 * still honored when the caller reports the error.
 *
 * @param argc Argument count including the program name.
 * @param argv Argument vector.
 * @param out Parsed options.
 * @param error First error message when the result is Error.
 */
CommandLineStatus parse_command_line(int argc, const char* const* argv, CommandLineOptions& out, std::string& error);

struct ConversionOutputPaths
{
    std::filesystem::path text;
    std::filesystem::path netcdf;
};

/**
 * @brief Derives `<dir>/<stem>.txt` and `<dir>/<stem>.nc` from the input path.
 */
ConversionOutputPaths output_paths_for(const std::filesystem::path& input_path);

/**
 * @brief Returns true when the path ends in `.bin` (any case).
 */
bool has_flight_log_extension(const std::filesystem::path& path);

/**
 * @brief Prints the active configuration at normal log level.
 */
void print_configuration_summary(const RuntimeConfig& config);

/**
 * @brief Converts one flight log into the text and NetCDF outputs.
 * @param input_path DataFlash log path.
 * @param config Runtime configuration.
 * @return exit_success, exit_fatal when no table could be produced,
 *         or exit_output_errors when at least one output failed.
 */
int run_conversion(const std::filesystem::path& input_path, const RuntimeConfig& config);

} // namespace fmet
