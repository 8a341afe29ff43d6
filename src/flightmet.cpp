/**
 * @file flightmet.cpp
 * @brief Entry point of the flight-log to observation table converter.
 *
 * Usage: flightmet [--config=PATH] [--log-profile=LEVEL] [--no-pause] [input.bin]
 */

#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>

#include "conversion_runtime.hpp"
#include "runtime_config.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

using namespace fmet;

namespace
{

void print_usage()
{
    std::cout << "Usage: flightmet [options] [input.bin]\n"
              << "Converts an ArduPilot DataFlash log into <stem>.txt and <stem>.nc beside it.\n\n"
              << "Options:\n"
              << "  --config=PATH          YAML-like configuration file\n"
              << "  --log-profile=LEVEL    quiet, normal or debug\n"
              << "  --no-pause             do not wait for Enter before exiting\n"
              << "  --help                 show this message\n";
}

void wait_for_enter(bool pause)
{
    if (!pause)
    {
        return;
    }
    std::cout << "Press Enter to exit..." << std::flush;
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

/**
 * @brief Asks for the log path on stdin. Surrounding quotes are removed.
 */
std::string prompt_for_input_path()
{
    std::cout << "Path to ArduPilot DataFlash log (.bin): " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line))
    {
        return {};
    }
    return strutil::unquote_copy(strutil::trim_copy(line));
}

} // namespace

int main(int argc, char** argv)
{
    apply_log_profile_from_env("FLIGHTMET_LOG_PROFILE");

    CommandLineOptions options;
    std::string error;
    const CommandLineStatus status = parse_command_line(argc, argv, options, error);
    if (status == CommandLineStatus::Help)
    {
        print_usage();
        return exit_success;
    }
    const bool pause = options.pause;
    if (status == CommandLineStatus::Error)
    {
        log_error(error);
        print_usage();
        wait_for_enter(pause);
        return exit_fatal;
    }

    RuntimeConfig config;
    try
    {
        load_config(options.config_path, config);
    }
    catch (const std::exception& e)
    {
        log_error(e.what());
        wait_for_enter(pause);
        return exit_fatal;
    }

    // Command line wins over the environment and the config file.
    if (options.log_profile)
    {
        global_log_profile = *options.log_profile;
    }

    if (log_normal_enabled())
    {
        std::cout << "ArduPilot DataFlash -> TXT/NetCDF" << std::endl;
    }
    print_configuration_summary(config);

    std::string input_arg = options.input_path;
    if (input_arg.empty())
    {
        input_arg = prompt_for_input_path();
    }
    if (input_arg.empty())
    {
        log_error("no input file selected");
        wait_for_enter(pause);
        return exit_fatal;
    }

    const std::filesystem::path input_path(input_arg);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input_path, ec))
    {
        log_error("input file not found: " + input_path.string());
        wait_for_enter(pause);
        return exit_fatal;
    }
    if (!has_flight_log_extension(input_path))
    {
        log_error("expected a .bin DataFlash log, got " + input_path.filename().string());
        wait_for_enter(pause);
        return exit_fatal;
    }

    const int result = run_conversion(input_path, config);
    wait_for_enter(pause);
    return result;
}
