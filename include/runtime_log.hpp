#pragma once

#include <string>

/**
 * @file runtime_log.hpp
 * @brief Log profile selection shared by the converter, tools and stages.
 *
 * Progress lines go to stdout behind the log_*_enabled() gates.
 * Warnings (suppressed when quiet) and errors go to stderr with a
 * "Warning:" or "Error:" prefix.
 */

namespace fmet
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

extern LogProfile global_log_profile;

/**
 * @brief Returns whether current logging level includes the target level.
 * @param level Minimum desired logging level.
 * @return True when logging at the requested level is enabled.
 */
inline bool log_at_least(LogProfile level)
{
    return static_cast<int>(global_log_profile) >= static_cast<int>(level);
}

/**
 * @brief Returns whether normal logging output is enabled.
 */
inline bool log_normal_enabled()
{
    return log_at_least(LogProfile::normal);
}

/**
 * @brief Returns whether debug logging output is enabled.
 */
inline bool log_debug_enabled()
{
    return log_at_least(LogProfile::debug);
}

/**
 * @brief Returns a string label for a log profile.
 * @param profile Log profile enum value.
 * @return Profile name string.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

/**
 * @brief Applies a profile named by an environment variable, if set.
 * @param variable Environment variable name.
 * @return True when the variable held a valid profile; invalid values are warned about.
 */
bool apply_log_profile_from_env(const char* variable);

/**
 * @brief Prints a warning line to stderr unless the profile is quiet.
 * @param message Warning text without prefix.
 */
void log_warning(const std::string& message);

/**
 * @brief Prints an error line to stderr regardless of profile.
 */
void log_error(const std::string& message);

} // namespace fmet
