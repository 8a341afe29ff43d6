/**
 * @file runtime_config.cpp
 * @brief Configuration parsing for the flight-log converter.
 *
 * Reads the YAML-like key/value configuration file into dotted keys and
 * maps recognised keys onto the runtime configuration bundle.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "smoothing/factory.hpp"
#include "string_utils.hpp"

namespace fmet
{

namespace
{

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    log_warning("Invalid " + key + " '" + value + "'; expected " + expected +
                ". Keeping previous/default value.");
}

/**
 * @brief Parses the smoothing scheme identifier aliases.
 */
bool parse_smoothing_scheme_id(const std::string& value, std::string& id_out)
{
    std::string normalized = to_lower_copy(strutil::trim_copy(value));
    if (normalized == "moving_average" || normalized == "moving-average" || normalized == "uniform")
    {
        normalized = "boxcar";
    }
    else if (normalized == "off")
    {
        normalized = "none";
    }

    const std::vector<std::string> schemes = get_available_smoothing_schemes();
    if (std::find(schemes.begin(), schemes.end(), normalized) == schemes.end())
    {
        return false;
    }
    id_out = normalized;
    return true;
}

constexpr const char* kKnownKeys[] = {
    "logging.profile",
    "position.range_check",
    "classifier.kelvin_threshold",
    "smoothing.scheme",
    "smoothing.window",
    "output.text",
    "output.netcdf",
    "output.validation_report",
};

bool is_known_key(const std::string& key)
{
    return std::find(std::begin(kKnownKeys), std::end(kKnownKeys), key) != std::end(kKnownKeys);
}

/**
 * @brief Joins the open section names and a key with dots.
 */
std::string dotted_key(const std::vector<std::string>& sections, const std::string& key)
{
    std::string out;
    for (const auto& section : sections)
    {
        out += section;
        out += '.';
    }
    return out + key;
}

} // namespace

/**
 * @brief Returns a lowercase copy of the input string.
 */
std::string to_lower_copy(std::string value)
{
    return strutil::lower_copy(value);
}

/**
 * @brief Parses a strict boolean spelling.
 */
bool try_parse_bool_value(const std::string& value, bool& out)
{
    const std::string normalized = to_lower_copy(strutil::trim_copy(value));
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
    {
        out = true;
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
    {
        out = false;
        return true;
    }
    return false;
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a strictly positive odd integer value.
 */
bool try_parse_positive_odd_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed <= 0 || parsed % 2 == 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a YAML file.
 *
 * Two-space indentation opens nested sections; `key: value` lines under
 * them become dotted keys. Lines that are neither are warned about and
 * skipped.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open config file: " + filename);
    }

    std::unordered_map<std::string, std::string> config;
    std::vector<std::string> sections;
    std::string raw;
    int line_number = 0;

    while (std::getline(file, raw))
    {
        ++line_number;
        const std::string line = raw.substr(0, raw.find('#'));
        const std::string text = strutil::trim_copy(line);
        if (text.empty()) continue;

        const std::size_t indent = line.find_first_not_of(' ');
        const std::size_t depth = indent / 2;
        if (sections.size() > depth)
        {
            sections.resize(depth);
        }

        const std::size_t colon = text.find(':');
        if (colon == std::string::npos || colon == 0)
        {
            log_warning(filename + ":" + std::to_string(line_number) + ": expected 'key: value', ignoring '" +
                        text + "'");
            continue;
        }

        const std::string key = strutil::trim_copy(text.substr(0, colon));
        const std::string value = strutil::trim_copy(text.substr(colon + 1));
        if (value.empty())
        {
            // Section header.
            sections.push_back(key);
            continue;
        }
        config[dotted_key(sections, key)] = strutil::unquote_copy(value);
    }

    return config;
}

int apply_config_values(const std::unordered_map<std::string, std::string>& config,
                        RuntimeConfig& runtime)
{
    int rejected = 0;
    for (const auto& entry : config)
    {
        if (!is_known_key(entry.first))
        {
            log_warning("Unknown config key '" + entry.first + "' ignored");
        }
    }

    auto lookup = [&](const char* key) -> const std::string*
    {
        const auto it = config.find(key);
        return it == config.end() ? nullptr : &it->second;
    };
    auto apply_bool = [&](const char* key, bool& target)
    {
        const std::string* value = lookup(key);
        if (!value)
        {
            return;
        }
        bool parsed = false;
        if (try_parse_bool_value(*value, parsed))
        {
            target = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "true/false, yes/no, on/off or 1/0");
            ++rejected;
        }
    };

    if (const std::string* value = lookup("logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*value, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            warn_invalid_config_value("logging.profile", *value, "quiet, normal or debug");
            ++rejected;
        }
    }

    apply_bool("position.range_check", runtime.conversion.aggregation.position_range_check);

    if (const std::string* value = lookup("classifier.kelvin_threshold"))
    {
        double parsed = 0.0;
        if (try_parse_double_value(*value, parsed))
        {
            runtime.conversion.classifier.kelvin_threshold = parsed;
        }
        else
        {
            warn_invalid_config_value("classifier.kelvin_threshold", *value, "a finite number");
            ++rejected;
        }
    }

    if (const std::string* value = lookup("smoothing.scheme"))
    {
        std::string id;
        if (parse_smoothing_scheme_id(*value, id))
        {
            runtime.conversion.smoothing.scheme_id = id;
        }
        else
        {
            std::string expected;
            for (const std::string& scheme : get_available_smoothing_schemes())
            {
                expected += (expected.empty() ? "" : ", ") + scheme;
            }
            warn_invalid_config_value("smoothing.scheme", *value, ("one of " + expected).c_str());
            ++rejected;
        }
    }

    if (const std::string* value = lookup("smoothing.window"))
    {
        int parsed = 0;
        if (try_parse_positive_odd_int_value(*value, parsed))
        {
            runtime.conversion.smoothing.window = parsed;
        }
        else
        {
            warn_invalid_config_value("smoothing.window", *value, "a positive odd integer");
            ++rejected;
        }
    }

    apply_bool("output.text", runtime.output.write_text);
    apply_bool("output.netcdf", runtime.output.write_netcdf);
    if (const std::string* value = lookup("output.validation_report"))
    {
        runtime.output.validation_report_path = *value;
    }

    return rejected;
}

/**
 * @brief Loads the configuration from a YAML file.
 */
void load_config(const std::string& config_path, RuntimeConfig& runtime)
{
    if (config_path.empty())
    {
        return;
    }

    const auto config = parse_yaml_simple(config_path);
    const int rejected = apply_config_values(config, runtime);

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << config.size() << " keys";
        if (rejected > 0)
        {
            std::cout << " (" << rejected << " rejected)";
        }
        std::cout << std::endl;
    }
    if (log_debug_enabled())
    {
        std::cout << "  position.range_check: "
                  << (runtime.conversion.aggregation.position_range_check ? "on" : "off") << std::endl;
        std::cout << "  classifier.kelvin_threshold: "
                  << runtime.conversion.classifier.kelvin_threshold << std::endl;
        std::cout << "  smoothing: " << runtime.conversion.smoothing.scheme_id
                  << " (window " << runtime.conversion.smoothing.window << ")" << std::endl;
    }
}

} // namespace fmet
