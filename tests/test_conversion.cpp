#include "conversion.hpp"
#include "conversion_runtime.hpp"
#include "runtime_log.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

using namespace fmet;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[conversion] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[conversion] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

FlightRecord gps(double t, double lat)
{
    FlightRecord r;
    r.timestamp = t;
    r.type = "GPS";
    r.fields = {{"Lat", lat}, {"Lng", 8.5}, {"Alt", 450.0}};
    return r;
}

FlightRecord record(double t, const std::string& type, std::map<std::string, double> fields)
{
    FlightRecord r;
    r.timestamp = t;
    r.type = type;
    r.fields = std::move(fields);
    return r;
}

int test_two_bucket_session()
{
    int failures = 0;

    const FlightRecordStream records = {
        gps(10.1, 47.1),
        record(10.2, "HUM", {{"Humidity", 60.0}, {"Temp", 22.0}}),
        record(10.5, "BARO", {{"Press", 1013.25}}),
        gps(10.9, 47.2),
        gps(11.4, 47.3),
        record(11.5, "ATT", {{"Roll", 0.0}}),
    };

    ConversionSummary summary;
    const ObservationTable table = convert_records(records, ConversionConfig{}, &summary);
    failures += expect_true(table.size() == 2, "master index {10, 11}");
    failures += expect_true(table.is_valid(), "ordering invariants hold");
    if (table.size() != 2)
    {
        return failures;
    }

    const AggregatedRow& first = table.rows[0];
    failures += expect_true(first.obs == 1 && first.time_s == 10, "first row key");
    failures += expect_close(first.latitude_deg, 47.1, "first GPS sample of bucket 10 wins");
    failures += expect_close(first.air_pressure, 1013.25, "pressure bucket 10");
    failures += expect_close(first.relative_humidity_pct, 60.0, "humidity bucket 10");
    failures += expect_close(first.air_temperature_c, 22.0, "temperature bucket 10");
    failures += expect_close(first.dew_point_c, 13.9, "dew point bucket 10", 0.05);

    const AggregatedRow& second = table.rows[1];
    failures += expect_true(second.obs == 2 && second.time_s == 11, "second row key");
    failures += expect_close(second.latitude_deg, 47.3, "position bucket 11");
    failures += expect_true(std::isnan(second.air_pressure), "pressure bucket 11 NaN");
    failures += expect_true(std::isnan(second.relative_humidity_pct), "humidity bucket 11 NaN");
    failures += expect_true(std::isnan(second.air_temperature_c), "temperature bucket 11 NaN");
    failures += expect_true(std::isnan(second.dew_point_c), "dew point bucket 11 NaN");

    for (const AggregatedRow& row : table.rows)
    {
        failures += expect_true(std::isnan(row.gpt) && std::isnan(row.gpt_height) &&
                                std::isnan(row.wind_speed) && std::isnan(row.wind_dir),
                                "placeholder columns stay NaN");
    }

    failures += expect_true(summary.records_in == 6, "summary records_in");
    failures += expect_true(summary.records_dropped == 1, "summary records_dropped");
    failures += expect_true(summary.position_samples == 3, "summary position samples");
    failures += expect_true(summary.rows == 2, "summary rows");
    failures += expect_true(!summary.smoothed, "two rows are not smoothed");
    return failures;
}

int test_no_position_is_fatal()
{
    int failures = 0;

    const FlightRecordStream no_gps = {
        record(10.0, "BARO", {{"Press", 1000.0}}),
        record(10.5, "IMU", {{"Temp", 30.0}}),
    };
    bool threw = false;
    try
    {
        (void)convert_records(no_gps, ConversionConfig{});
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "session without position must throw");

    FlightRecordStream unanchored = {gps(std::numeric_limits<double>::quiet_NaN(), 47.0)};
    threw = false;
    try
    {
        (void)convert_records(unanchored, ConversionConfig{});
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "position samples without valid time must throw");
    return failures;
}

int test_dew_point_uses_smoothed_temperature()
{
    int failures = 0;

    // Twelve seconds, IMU temperature 1..12 C, saturated air.
    FlightRecordStream records;
    for (int s = 0; s < 12; ++s)
    {
        const double t = 100.0 + s + 0.25;
        records.push_back(gps(t, 45.0));
        records.push_back(record(t + 0.1, "IMU", {{"Temp", static_cast<double>(s + 1)}}));
        records.push_back(record(t + 0.2, "HUM", {{"Humidity", 100.0}, {"Temp", std::nan("")}}));
    }

    ConversionSummary summary;
    const ObservationTable smoothed = convert_records(records, ConversionConfig{}, &summary);
    failures += expect_true(smoothed.size() == 12, "twelve rows");
    failures += expect_true(summary.smoothed, "twelve rows are smoothed");
    if (smoothed.size() == 12)
    {
        failures += expect_close(smoothed.rows[0].air_temperature_c, 19.0 / 9.0, "smoothed temperature row 0");
        failures += expect_close(smoothed.rows[0].dew_point_c, 19.0 / 9.0, "dew point from smoothed temperature");
        failures += expect_close(smoothed.rows[11].air_temperature_c, 98.0 / 9.0, "smoothed temperature row 11");
        failures += expect_close(smoothed.rows[11].relative_humidity_pct, 100.0, "humidity is not smoothed");
    }

    ConversionConfig raw_config;
    raw_config.smoothing.scheme_id = "none";
    const ObservationTable raw = convert_records(records, raw_config);
    if (raw.size() == 12)
    {
        failures += expect_close(raw.rows[0].air_temperature_c, 1.0, "smoothing disabled keeps raw temperature");
        failures += expect_close(raw.rows[0].dew_point_c, 1.0, "dew point follows raw temperature");
    }
    return failures;
}

int test_command_line()
{
    int failures = 0;
    std::string error;

    {
        const char* argv[] = {"flightmet", "--config=site.yaml", "--log-profile=Debug", "--no-pause", "flight.bin"};
        CommandLineOptions options;
        const CommandLineStatus status = parse_command_line(5, argv, options, error);
        failures += expect_true(status == CommandLineStatus::Ok && error.empty(), "valid arguments parse");
        failures += expect_true(options.config_path == "site.yaml", "config path");
        failures += expect_true(options.log_profile == LogProfile::debug, "log profile");
        failures += expect_true(!options.pause, "pause disabled");
        failures += expect_true(options.input_path == "flight.bin", "input path");
    }

    // Every early error must still know whether to pause.
    {
        const char* argv[] = {"flightmet", "--bogus", "a.bin"};
        CommandLineOptions options;
        failures += expect_true(parse_command_line(3, argv, options, error) == CommandLineStatus::Error,
                                "unknown option is an error");
        failures += expect_true(error == "unknown option --bogus", "unknown option message");
        failures += expect_true(options.pause, "pause stays on by default after an error");
    }
    {
        const char* argv[] = {"flightmet", "--log-profile=loud", "--no-pause"};
        CommandLineOptions options;
        failures += expect_true(parse_command_line(3, argv, options, error) == CommandLineStatus::Error,
                                "invalid log profile is an error");
        failures += expect_true(!options.pause, "--no-pause after the bad profile is honored");
        failures += expect_true(!options.log_profile.has_value(), "invalid profile not applied");
    }
    {
        const char* argv[] = {"flightmet", "a.bin", "b.bin", "--nope"};
        CommandLineOptions options;
        failures += expect_true(parse_command_line(4, argv, options, error) == CommandLineStatus::Error,
                                "second input is an error");
        failures += expect_true(error == "only one input log may be given", "first error is reported");
    }
    {
        const char* argv[] = {"flightmet", "--bogus", "-h"};
        CommandLineOptions options;
        failures += expect_true(parse_command_line(3, argv, options, error) == CommandLineStatus::Help,
                                "help wins");
    }
    return failures;
}

} // namespace

int main()
{
    global_log_profile = LogProfile::quiet;

    int failures = 0;
    failures += test_two_bucket_session();
    failures += test_no_position_is_fatal();
    failures += test_dew_point_uses_smoothed_temperature();
    failures += test_command_line();

    if (failures > 0)
    {
        std::cerr << "[conversion] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[conversion] all checks passed" << std::endl;
    return 0;
}
