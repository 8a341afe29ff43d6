/**
 * @file conversion_runtime.cpp
 * @brief Conversion driver for the flightmet executable.
 *
 * Orchestrates decoding, the conversion engine and the output writers.
 * The text and NetCDF writers are independent: a failure in one is
 * reported and the other still runs.
 */

#include "conversion_runtime.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "column_validation.hpp"
#include "conversion.hpp"
#include "dataflash_reader.hpp"
#include "netcdf_classic.hpp"
#include "string_utils.hpp"
#include "text_table.hpp"

namespace fmet
{
namespace
{

std::string utc_now_iso8601()
{
    const std::time_t now = std::time(nullptr);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

double elapsed_s(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void print_conversion_summary(const ConversionSummary& summary)
{
    std::cout << "Decoded records: " << summary.records_in << " (" << summary.records_dropped
              << " not classified)" << std::endl;
    std::cout << "  GPS=" << summary.position_samples
              << " pressure=" << summary.pressure_samples
              << " temperature=" << summary.temperature_samples
              << " humidity=" << summary.humidity_samples
              << " imu=" << summary.inertial_samples << std::endl;
    std::cout << "Observations: " << summary.rows
              << (summary.smoothed ? " (temperature smoothed)" : "") << std::endl;
}

} // namespace

CommandLineStatus parse_command_line(int argc, const char* const* argv, CommandLineOptions& out, std::string& error)
{
    error.clear();
    auto fail = [&error](const std::string& message)
    {
        if (error.empty())
        {
            error = message;
        }
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            return CommandLineStatus::Help;
        }
        else if (arg == "--no-pause") out.pause = false;
        else if (arg.rfind("--config=", 0) == 0)
        {
            out.config_path = arg.substr(9);
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            out.config_path = argv[++i];
        }
        else if (arg.rfind("--log-profile=", 0) == 0)
        {
            const std::string value = arg.substr(14);
            bool valid = false;
            const LogProfile parsed = parse_log_profile(value, &valid);
            if (valid)
            {
                out.log_profile = parsed;
            }
            else
            {
                fail("invalid --log-profile '" + value + "' (use quiet, normal or debug)");
            }
        }
        else if (arg.rfind("--", 0) == 0)
        {
            fail("unknown option " + arg);
        }
        else if (out.input_path.empty())
        {
            out.input_path = arg;
        }
        else
        {
            fail("only one input log may be given");
        }
    }
    return error.empty() ? CommandLineStatus::Ok : CommandLineStatus::Error;
}

ConversionOutputPaths output_paths_for(const std::filesystem::path& input_path)
{
    ConversionOutputPaths paths;
    const std::filesystem::path base = input_path.parent_path() / input_path.stem();
    paths.text = base;
    paths.text += ".txt";
    paths.netcdf = base;
    paths.netcdf += ".nc";
    return paths;
}

bool has_flight_log_extension(const std::filesystem::path& path)
{
    return strutil::lower_copy(path.extension().string()) == ".bin";
}

void print_configuration_summary(const RuntimeConfig& config)
{
    if (!log_normal_enabled())
    {
        return;
    }
    const ConversionConfig& c = config.conversion;
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "CONFIGURATION" << std::endl;
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "  Log profile: " << log_profile_name(global_log_profile) << std::endl;
    std::cout << "  Kelvin threshold: " << c.classifier.kelvin_threshold << std::endl;
    std::cout << "  Position range check: " << (c.aggregation.position_range_check ? "on" : "off") << std::endl;
    std::cout << "  Smoothing: " << c.smoothing.scheme_id << " (window " << c.smoothing.window << ")" << std::endl;
    std::cout << "  Outputs: text=" << (config.output.write_text ? "on" : "off")
              << ", netcdf=" << (config.output.write_netcdf ? "on" : "off") << std::endl;
    if (!config.output.validation_report_path.empty())
    {
        std::cout << "  Validation report: " << config.output.validation_report_path << std::endl;
    }
    std::cout << std::string(60, '=') << "\n" << std::endl;
}

int run_conversion(const std::filesystem::path& input_path, const RuntimeConfig& config)
{
    const auto run_start = std::chrono::steady_clock::now();

    FlightRecordStream records;
    try
    {
        records = read_dataflash_file(input_path);
    }
    catch (const std::exception& e)
    {
        log_error(e.what());
        return exit_fatal;
    }
    const double decode_s = elapsed_s(run_start);

    ConversionSummary summary;
    ObservationTable table;
    const auto convert_start = std::chrono::steady_clock::now();
    try
    {
        table = convert_records(records, config.conversion, &summary);
    }
    catch (const std::exception& e)
    {
        log_error(e.what());
        return exit_fatal;
    }
    const double convert_s = elapsed_s(convert_start);

    if (log_normal_enabled())
    {
        print_conversion_summary(summary);
    }

    const ConversionOutputPaths paths = output_paths_for(input_path);
    bool output_errors = false;

    if (config.output.write_text)
    {
        try
        {
            write_text_table(table, paths.text);
            if (log_normal_enabled())
            {
                std::cout << "Written: " << paths.text.string() << std::endl;
            }
        }
        catch (const std::exception& e)
        {
            std::cerr << "[OUTPUT] Error writing text table: " << e.what() << std::endl;
            output_errors = true;
        }
    }

    if (config.output.write_netcdf)
    {
        NetcdfWriteOptions nc_options;
        nc_options.source = "ArduPilot DataFlash log " + input_path.filename().string();
        nc_options.history = utc_now_iso8601() + " flightmet: converted " + input_path.filename().string();
        try
        {
            write_netcdf_classic(table, paths.netcdf, nc_options);
            if (log_normal_enabled())
            {
                std::cout << "Written: " << paths.netcdf.string() << std::endl;
            }
        }
        catch (const std::exception& e)
        {
            std::cerr << "[OUTPUT] Error writing NetCDF: " << e.what() << std::endl;
            output_errors = true;
        }
    }

    if (log_debug_enabled() || !config.output.validation_report_path.empty())
    {
        const ColumnQualityReport report = build_column_quality_report(table, input_path.string());
        if (log_debug_enabled())
        {
            print_column_quality_summary(report, std::cout);
        }
        if (!config.output.validation_report_path.empty())
        {
            std::string error;
            if (!write_column_quality_report_json(report, config.output.validation_report_path, error))
            {
                std::cerr << "[VALIDATION] " << error << std::endl;
                output_errors = true;
            }
        }
    }

    if (log_debug_enabled())
    {
        std::cout << "[PERF] decode_s=" << decode_s << ", convert_s=" << convert_s
                  << ", total_s=" << elapsed_s(run_start) << std::endl;
    }

    if (output_errors)
    {
        std::cout << "Processing completed with output errors" << std::endl;
        return exit_output_errors;
    }
    std::cout << "Processing completed successfully" << std::endl;
    return exit_success;
}

} // namespace fmet
