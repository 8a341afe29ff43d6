#include "classifier/channel_classifier.hpp"
#include "runtime_log.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <variant>

using namespace fmet;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[channel-classifier] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[channel-classifier] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

FlightRecord make_record(double timestamp, const std::string& type, std::map<std::string, double> fields)
{
    FlightRecord record;
    record.timestamp = timestamp;
    record.type = type;
    record.fields = std::move(fields);
    return record;
}

int test_position_requires_all_coordinates()
{
    int failures = 0;
    const ClassifierConfig config;

    const auto full = classify_record(make_record(100.25, "GPS", {{"Lat", 47.5}, {"Lng", 8.25}, {"Alt", 512.0}}), config);
    failures += expect_true(full.has_value(), "GPS with Lat/Lng/Alt must classify");
    if (full)
    {
        failures += expect_true(channel_of(*full) == Channel::Position, "GPS must route to position");
        const auto& sample = std::get<PositionSample>(*full);
        failures += expect_close(sample.timestamp, 100.25, "position timestamp");
        failures += expect_close(sample.latitude_deg, 47.5, "latitude");
        failures += expect_close(sample.longitude_deg, 8.25, "longitude");
        failures += expect_close(sample.altitude_m, 512.0, "altitude");
    }

    const auto missing_alt = classify_record(make_record(100.0, "GPS", {{"Lat", 47.5}, {"Lng", 8.25}}), config);
    failures += expect_true(!missing_alt.has_value(), "GPS without Alt must be dropped");
    return failures;
}

int test_pressure_temperature_conversion()
{
    int failures = 0;
    const ClassifierConfig config;

    const auto baro = classify_record(make_record(1.0, "BARO", {{"Press", 101325.0}, {"Temp", 25.0}}), config);
    failures += expect_true(baro.has_value(), "BARO must classify");
    if (baro)
    {
        const auto& sample = std::get<PressureSample>(*baro);
        failures += expect_close(sample.pressure, 101325.0, "BARO pressure kept in logged units");
        failures += expect_true(sample.temperature_c.has_value(), "BARO temperature present");
        failures += expect_close(sample.temperature_c.value_or(0.0), 25.0, "Celsius temperature unchanged");
    }

    const auto scaled = classify_record(
        make_record(1.0, "SCALED_PRESSURE", {{"press_abs", 1013.25}, {"temperature", 298.15}}), config);
    failures += expect_true(scaled.has_value(), "SCALED_PRESSURE must classify");
    if (scaled)
    {
        const auto& sample = std::get<PressureSample>(*scaled);
        failures += expect_close(sample.pressure, 1013.25, "press_abs");
        failures += expect_close(sample.temperature_c.value_or(0.0), 25.0, "Kelvin temperature converted", 1.0e-9);
    }

    const auto no_temp = classify_record(make_record(1.0, "BARO", {{"Press", 1000.0}}), config);
    failures += expect_true(no_temp.has_value(), "BARO without Temp still classifies");
    if (no_temp)
    {
        failures += expect_true(!std::get<PressureSample>(*no_temp).temperature_c.has_value(),
                                "absent temperature must stay absent");
    }

    const auto no_press = classify_record(make_record(1.0, "BARO", {{"Temp", 20.0}}), config);
    failures += expect_true(!no_press.has_value(), "BARO without pressure must be dropped");
    return failures;
}

int test_kelvin_threshold()
{
    int failures = 0;
    failures += expect_close(kelvin_to_celsius_if_kelvin(273.15, 200.0), 0.0, "273.15 K -> 0 C");
    failures += expect_close(kelvin_to_celsius_if_kelvin(200.0, 200.0), 200.0, "threshold itself is not Kelvin");
    failures += expect_close(kelvin_to_celsius_if_kelvin(-5.0, 200.0), -5.0, "Celsius passes through");
    failures += expect_true(std::isnan(kelvin_to_celsius_if_kelvin(std::nan(""), 200.0)), "NaN passes through");

    ClassifierConfig raised;
    raised.kelvin_threshold = 300.0;
    const auto hum = classify_record(make_record(1.0, "HUM", {{"Humidity", 40.0}, {"Temp", 298.15}}), raised);
    failures += expect_true(hum.has_value(), "HUM must classify");
    if (hum)
    {
        failures += expect_close(std::get<HumiditySample>(*hum).temperature_c, 298.15,
                                 "configured threshold keeps 298.15 unconverted");
    }
    return failures;
}

int test_temperature_sub_readings()
{
    int failures = 0;
    const ClassifierConfig config;

    const auto temp = classify_record(make_record(2.0, "TEMP", {{"Temp1", 18.5}, {"Temp3", 19.5}}), config);
    failures += expect_true(temp.has_value(), "TEMP with Temp1 must classify");
    if (temp)
    {
        const auto& sample = std::get<TemperatureSample>(*temp);
        failures += expect_close(sample.readings_c[0].value_or(0.0), 18.5, "Temp1");
        failures += expect_true(!sample.readings_c[1].has_value(), "missing Temp2 stays absent");
        failures += expect_close(sample.readings_c[2].value_or(0.0), 19.5, "Temp3");
    }

    const auto no_first = classify_record(make_record(2.0, "TEMPERATURE", {{"Temp2", 18.0}}), config);
    failures += expect_true(no_first.has_value(), "TEMPERATURE with only Temp2 must classify");
    if (no_first)
    {
        const auto& sample = std::get<TemperatureSample>(*no_first);
        failures += expect_true(!sample.readings_c[0].has_value(), "absent Temp1 stays absent");
        failures += expect_close(sample.readings_c[1].value_or(0.0), 18.0, "Temp2 kept");
    }
    const auto only_third = classify_record(make_record(2.0, "TEMP", {{"Temp3", 21.0}}), config);
    failures += expect_true(only_third.has_value(), "TEMP with only Temp3 must classify");

    const auto none = classify_record(make_record(2.0, "TEMP", {{"Temp", 21.0}}), config);
    failures += expect_true(!none.has_value(), "TEMP without any TempN must be dropped");

    const auto wxtp = classify_record(make_record(2.0, "WXTP", {{"t0", 293.15}, {"t2", 10.0}}), config);
    failures += expect_true(wxtp.has_value(), "WXTP must classify");
    if (wxtp)
    {
        const auto& sample = std::get<TemperatureSample>(*wxtp);
        failures += expect_close(sample.readings_c[0].value_or(0.0), 20.0, "WXTP t0 converted", 1.0e-9);
        failures += expect_true(!sample.readings_c[1].has_value(), "WXTP t1 absent");
        failures += expect_close(sample.readings_c[2].value_or(0.0), 10.0, "WXTP t2 already Celsius");
    }
    return failures;
}

int test_humidity_sub_sensor_average()
{
    int failures = 0;
    const ClassifierConfig config;

    const auto wxrh = classify_record(
        make_record(3.0, "WXRH",
                    {{"rh0", 50.0}, {"rh1", std::nan("")}, {"rh2", 70.0}, {"t0", 293.15}, {"t1", 295.15}}),
        config);
    failures += expect_true(wxrh.has_value(), "WXRH must classify");
    if (wxrh)
    {
        const auto& sample = std::get<HumiditySample>(*wxrh);
        failures += expect_close(sample.relative_humidity_pct, 60.0, "NaN-ignoring humidity mean");
        failures += expect_close(sample.temperature_c, 21.0, "converted temperature mean", 1.0e-9);
    }

    const auto no_temp = classify_record(make_record(3.0, "WXRH", {{"rh0", 50.0}}), config);
    failures += expect_true(!no_temp.has_value(), "WXRH without temperature must be dropped");

    const auto imu = classify_record(make_record(3.0, "IMU", {{"Temp", 35.0}, {"GyrX", 0.1}}), config);
    failures += expect_true(imu.has_value() && channel_of(*imu) == Channel::InertialTemperature,
                            "IMU with Temp routes to inertial temperature");
    return failures;
}

int test_rejections_and_stream_order()
{
    int failures = 0;
    const ClassifierConfig config;

    const double nan = std::numeric_limits<double>::quiet_NaN();
    failures += expect_true(!classify_record(make_record(nan, "IMU", {{"Temp", 30.0}}), config).has_value(),
                            "non-finite timestamp must be dropped");
    failures += expect_true(!classify_record(make_record(1.0e20, "GPS", {{"Lat", 1.0}, {"Lng", 2.0}, {"Alt", 3.0}}),
                                             config).has_value(),
                            "timestamp beyond the bucket key range must be dropped");
    failures += expect_true(!classify_record(make_record(1.0, "ATT", {{"Roll", 1.0}}), config).has_value(),
                            "unknown type must be dropped");

    FlightRecordStream stream = {
        make_record(5.0, "GPS", {{"Lat", 1.0}, {"Lng", 2.0}, {"Alt", 3.0}}),
        make_record(5.1, "ATT", {{"Roll", 1.0}}),
        make_record(4.0, "GPS", {{"Lat", 4.0}, {"Lng", 5.0}, {"Alt", 6.0}}),
        make_record(5.2, "IMU", {{"Temp", 30.0}}),
        make_record(nan, "BARO", {{"Press", 1000.0}}),
    };

    std::size_t dropped = 0;
    const ChannelSet channels = classify_records(stream, config, &dropped);
    failures += expect_true(dropped == 2, "two records dropped");
    failures += expect_true(channels.total_samples() == 3, "three samples classified");
    failures += expect_true(channels.position.size() == 2, "two position samples");
    if (channels.position.size() == 2)
    {
        failures += expect_close(channels.position[0].latitude_deg, 1.0, "decode order preserved (first)");
        failures += expect_close(channels.position[1].latitude_deg, 4.0, "decode order preserved (second)");
    }
    failures += expect_true(channels.inertial_temperature.size() == 1, "one inertial sample");
    failures += expect_true(channels.pressure.empty(), "NaN-timestamped pressure dropped");
    failures += expect_true(std::string(to_string(Channel::InertialTemperature)) == "inertial_temperature",
                            "channel name");
    return failures;
}

} // namespace

int main()
{
    global_log_profile = LogProfile::quiet;

    int failures = 0;
    failures += test_position_requires_all_coordinates();
    failures += test_pressure_temperature_conversion();
    failures += test_kelvin_threshold();
    failures += test_temperature_sub_readings();
    failures += test_humidity_sub_sensor_average();
    failures += test_rejections_and_stream_order();

    if (failures > 0)
    {
        std::cerr << "[channel-classifier] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[channel-classifier] all checks passed" << std::endl;
    return 0;
}
