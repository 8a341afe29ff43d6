/**
 * @file flightmet_inspect.cpp
 * @brief Reads a produced observation file and reports column quality.
 *
 * Accepts either output format. Exit status is 1 when the file cannot be
 * read or its rows break the ordering invariants.
 */

#include "column_validation.hpp"
#include "netcdf_classic.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"
#include "text_table.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

struct Options {
    std::string input_path;
    std::string json_path;
};

enum class ParseArgsResult {
    Ok,
    Help,
    Error,
};

void print_usage() {
    std::cout << "Observation File Inspector\n"
              << "Usage:\n"
              << "  flightmet_inspect <file.txt|file.nc> [--json <path>]\n";
}

ParseArgsResult parse_args(int argc, char** argv, Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return ParseArgsResult::Help;
        }
        if (arg == "--json") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return ParseArgsResult::Error;
            }
            out.json_path = argv[++i];
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown argument: " << arg << "\n";
            return ParseArgsResult::Error;
        }
        if (!out.input_path.empty()) {
            std::cerr << "Only one input file may be given\n";
            return ParseArgsResult::Error;
        }
        out.input_path = arg;
    }

    if (out.input_path.empty()) {
        std::cerr << "An input file is required\n";
        return ParseArgsResult::Error;
    }
    return ParseArgsResult::Ok;
}

/**
 * @brief Prints dimensions, global attributes and variables of a NetCDF header.
 */
void print_netcdf_header(const fmet::NetcdfClassicHeader& header) {
    std::cout << "NetCDF CDF-" << header.version << "\n";
    for (const auto& dim : header.dimensions) {
        std::cout << "  dimension " << dim.name << " = " << dim.length
                  << (dim.unlimited ? " (unlimited)" : "") << "\n";
    }
    for (const auto& [name, attr] : header.global_attributes) {
        const std::string text = fmet::netcdf_attribute_text(attr);
        if (!text.empty()) {
            std::cout << "  :" << name << " = \"" << text << "\"\n";
        }
    }
    for (const auto& var : header.variables) {
        std::cout << "  variable " << var.name;
        const auto units = var.attributes.find("units");
        if (units != var.attributes.end()) {
            std::cout << " [" << fmet::netcdf_attribute_text(units->second) << "]";
        }
        std::cout << "\n";
    }
}

}

int main(int argc, char** argv) {
    Options options;
    const ParseArgsResult parse_result = parse_args(argc, argv, options);
    if (parse_result == ParseArgsResult::Help) {
        return 0;
    }
    if (parse_result == ParseArgsResult::Error) {
        print_usage();
        return 1;
    }

    const std::filesystem::path input(options.input_path);
    const std::string extension = fmet::strutil::lower_copy(input.extension().string());

    fmet::ObservationTable table;
    try {
        if (extension == ".nc") {
            print_netcdf_header(fmet::read_netcdf_classic_header(input));
            table = fmet::read_netcdf_observation_table(input);
        } else if (extension == ".txt" || extension == ".csv") {
            table = fmet::read_text_table(input);
        } else {
            std::cerr << "Unsupported file type: " << options.input_path << " (expected .txt or .nc)\n";
            return 1;
        }
    } catch (const std::exception& e) {
        fmet::log_error(e.what());
        return 1;
    }

    const fmet::ColumnQualityReport report = fmet::build_column_quality_report(table, options.input_path);
    fmet::print_column_quality_summary(report, std::cout);

    const bool ordered = table.is_valid();
    if (!ordered) {
        std::cerr << "[inspect] rows are not strictly ordered by time with obs 1..N\n";
    }

    if (!options.json_path.empty()) {
        std::string error;
        if (!fmet::write_column_quality_report_json(report, options.json_path, error)) {
            std::cerr << "[inspect] " << error << "\n";
            return 1;
        }
    }

    return ordered ? 0 : 1;
}
