/**
 * @file runtime_log.cpp
 * @brief Log profile state and the stderr warning/error sinks.
 */

#include "runtime_log.hpp"
#include "string_utils.hpp"

#include <cstdlib>
#include <iostream>

namespace fmet
{

LogProfile global_log_profile = LogProfile::normal;

namespace
{

struct NamedProfile
{
    const char* name;
    LogProfile profile;
};

constexpr NamedProfile kProfiles[] = {
    {"quiet", LogProfile::quiet},
    {"normal", LogProfile::normal},
    {"debug", LogProfile::debug},
};

} // namespace

const char* log_profile_name(LogProfile profile)
{
    for (const auto& entry : kProfiles)
    {
        if (entry.profile == profile)
        {
            return entry.name;
        }
    }
    return "normal";
}

/**
 * @brief Parses a profile name, case-insensitive and ignoring surrounding blanks.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    for (const auto& entry : kProfiles)
    {
        if (normalized == entry.name)
        {
            if (valid) *valid = true;
            return entry.profile;
        }
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

bool apply_log_profile_from_env(const char* variable)
{
    const char* value = std::getenv(variable);
    if (!value)
    {
        return false;
    }

    bool valid = false;
    const LogProfile parsed = parse_log_profile(value, &valid);
    if (!valid)
    {
        log_warning(std::string("Ignoring invalid ") + variable + "='" + value + "'");
        return false;
    }
    global_log_profile = parsed;
    return true;
}

void log_warning(const std::string& message)
{
    if (global_log_profile == LogProfile::quiet)
    {
        return;
    }
    std::cerr << "Warning: " << message << std::endl;
}

void log_error(const std::string& message)
{
    std::cerr << "Error: " << message << std::endl;
}

} // namespace fmet
