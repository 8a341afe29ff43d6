#include "netcdf_classic.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fmet;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[netcdf-classic] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

ObservationTable sample_table()
{
    ObservationTable table;
    for (int i = 0; i < 3; ++i)
    {
        AggregatedRow row;
        row.obs = i + 1;
        row.time_s = 1700000000 + i;
        row.latitude_deg = 46.0 + 0.001 * i;
        row.longitude_deg = 7.0;
        row.altitude_m = 600.0 + 10.0 * i;
        row.air_temperature_c = 12.5;
        row.dew_point_c = (i == 1) ? std::nan("") : 5.25;
        row.relative_humidity_pct = 61.0;
        row.air_pressure = 950.0 - i;
        table.rows.push_back(row);
    }
    return table;
}

std::string text_attr(const NetcdfVariable& var, const std::string& name)
{
    const auto it = var.attributes.find(name);
    return it == var.attributes.end() ? std::string() : netcdf_attribute_text(it->second);
}

int test_header_layout()
{
    int failures = 0;
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flightmet_netcdf_test.nc";

    NetcdfWriteOptions options;
    options.source = "unit test";
    options.history = "written by test_netcdf_classic";
    write_netcdf_classic(sample_table(), path, options);

    const NetcdfClassicHeader header = read_netcdf_classic_header(path);
    failures += expect_true(header.version == 1, "CDF-1 signature");
    failures += expect_true(header.dimensions.size() == 1, "one dimension");
    failures += expect_true(!header.dimensions.empty() && header.dimensions[0].name == "time" &&
                            header.dimensions[0].length == 3 && !header.dimensions[0].unlimited,
                            "fixed time dimension of length 3");

    const std::vector<std::string> expected_names = {
        "time", "observation", "latitude", "longitude", "altitude", "air_temperature",
        "dew_point_temperature", "relative_humidity", "air_pressure",
    };
    failures += expect_true(header.variables.size() == expected_names.size(), "nine variables");
    for (std::size_t i = 0; i < header.variables.size() && i < expected_names.size(); ++i)
    {
        failures += expect_true(header.variables[i].name == expected_names[i],
                                "variable order at " + std::to_string(i) + ": " + header.variables[i].name);
    }

    const auto conventions = header.global_attributes.find("Conventions");
    failures += expect_true(conventions != header.global_attributes.end(), "Conventions attribute");
    const auto source = header.global_attributes.find("source");
    failures += expect_true(source != header.global_attributes.end() &&
                            netcdf_attribute_text(source->second) == "unit test", "source attribute");
    failures += expect_true(header.global_attributes.count("title") == 1, "title attribute");
    failures += expect_true(header.global_attributes.count("history") == 1, "history attribute");

    const NetcdfVariable* time = header.find_variable("time");
    failures += expect_true(time && time->type == nc_double, "time is double");
    failures += expect_true(time && text_attr(*time, "units") == "seconds since 1970-01-01 00:00:00", "time units");
    failures += expect_true(time && time->attributes.count("_FillValue") == 0, "time has no fill value");

    const NetcdfVariable* obs = header.find_variable("observation");
    failures += expect_true(obs && obs->type == nc_int, "observation is int");

    const NetcdfVariable* altitude = header.find_variable("altitude");
    failures += expect_true(altitude && text_attr(*altitude, "positive") == "up", "altitude positive up");
    failures += expect_true(altitude && text_attr(*altitude, "units") == "meters", "altitude units");

    const NetcdfVariable* pressure = header.find_variable("air_pressure");
    failures += expect_true(pressure && text_attr(*pressure, "units") == "hPa", "pressure units");
    failures += expect_true(pressure && text_attr(*pressure, "coordinates") == "observation", "coordinates attribute");
    if (pressure && pressure->attributes.count("_FillValue") == 1)
    {
        const std::vector<double> fill = netcdf_attribute_values(pressure->attributes.at("_FillValue"));
        failures += expect_true(fill.size() == 1 && std::isnan(fill[0]), "fill value is NaN");
    }
    else
    {
        failures += expect_true(false, "pressure has a fill value");
    }

    const NetcdfVariable* temperature = header.find_variable("air_temperature");
    failures += expect_true(temperature && text_attr(*temperature, "units") == "degree_Celsius", "temperature units");
    failures += expect_true(temperature && text_attr(*temperature, "standard_name") == "air_temperature",
                            "temperature standard_name");

    // Variables are laid out back to back after the header.
    std::uint64_t expected_begin = header.variables.empty() ? 0 : header.variables[0].begin;
    for (const NetcdfVariable& var : header.variables)
    {
        failures += expect_true(var.begin == expected_begin, "contiguous begin offset for " + var.name);
        expected_begin += var.vsize;
    }
    failures += expect_true(time && time->vsize == 24, "time vsize is 3 doubles");
    failures += expect_true(obs && obs->vsize == 12, "observation vsize is 3 ints");
    failures += expect_true(std::filesystem::file_size(path) == expected_begin, "file ends after last variable");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    return failures;
}

int test_data_round_trip()
{
    int failures = 0;
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flightmet_netcdf_data_test.nc";
    const ObservationTable written = sample_table();
    write_netcdf_classic(written, path, NetcdfWriteOptions{});

    const ObservationTable back = read_netcdf_observation_table(path);
    failures += expect_true(back.size() == 3, "three rows read back");
    failures += expect_true(back.is_valid(), "rows ordered");
    for (std::size_t i = 0; i < back.size() && i < written.size(); ++i)
    {
        failures += expect_true(back.rows[i].time_s == written.rows[i].time_s, "time preserved");
        failures += expect_true(back.rows[i].obs == written.rows[i].obs, "obs preserved");
        failures += expect_true(back.rows[i].latitude_deg == written.rows[i].latitude_deg, "latitude bit-exact");
        failures += expect_true(back.rows[i].air_pressure == written.rows[i].air_pressure, "pressure bit-exact");
        failures += expect_true(std::isnan(back.rows[i].wind_dir), "placeholders come back NaN");
    }
    if (back.size() == 3)
    {
        failures += expect_true(std::isnan(back.rows[1].dew_point_c), "NaN data preserved");
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    return failures;
}

int test_rejections()
{
    int failures = 0;
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flightmet_netcdf_bad.nc";

    bool threw = false;
    try
    {
        write_netcdf_classic(ObservationTable{}, path, NetcdfWriteOptions{});
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "empty table must not be written");

    {
        std::ofstream out(path, std::ios::binary);
        out << "HDF5 not classic";
    }
    threw = false;
    try
    {
        (void)read_netcdf_classic_header(path);
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "bad signature must throw");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_header_layout();
    failures += test_data_round_trip();
    failures += test_rejections();

    if (failures > 0)
    {
        std::cerr << "[netcdf-classic] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[netcdf-classic] all checks passed" << std::endl;
    return 0;
}
