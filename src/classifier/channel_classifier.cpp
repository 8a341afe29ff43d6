/**
 * @file channel_classifier.cpp
 * @brief Implementation of record-to-channel routing.
 *
 * Message type names cover the DataFlash records written by ArduPilot
 * (GPS, BARO, TEMP, IMU, HUM and the WXTP/WXRH weather payload records)
 * and the MAVLink SCALED_PRESSURE/TEMPERATURE telemetry names.
 */

#include "channel_classifier.hpp"
#include "aggregation/time_bucketing.hpp"
#include "numeric_utils.hpp"
#include "physical_constants.hpp"

#include <array>
#include <cmath>
#include <initializer_list>
#include <string>

namespace fmet
{

namespace
{

/**
 * @brief Returns the first present field among candidate names.
 */
std::optional<double> first_field(const FlightRecord& record,
                                  std::initializer_list<const char*> names)
{
    for (const char* name : names)
    {
        if (auto value = record.field(name))
        {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<ChannelSample> classify_position(const FlightRecord& record)
{
    const auto lat = record.field("Lat");
    const auto lng = record.field("Lng");
    const auto alt = record.field("Alt");
    if (!lat || !lng || !alt)
    {
        return std::nullopt;
    }

    PositionSample sample;
    sample.timestamp = record.timestamp;
    sample.latitude_deg = *lat;
    sample.longitude_deg = *lng;
    sample.altitude_m = *alt;
    return sample;
}

std::optional<ChannelSample> classify_pressure(const FlightRecord& record,
                                               const ClassifierConfig& config)
{
    const auto pressure = first_field(record, {"press_abs", "Press"});
    if (!pressure)
    {
        return std::nullopt;
    }

    PressureSample sample;
    sample.timestamp = record.timestamp;
    sample.pressure = *pressure;
    if (const auto temperature = first_field(record, {"temperature", "Temp"}))
    {
        sample.temperature_c = kelvin_to_celsius_if_kelvin(*temperature, config.kelvin_threshold);
    }
    return sample;
}

std::optional<ChannelSample> classify_temperature(const FlightRecord& record)
{
    static const std::array<const char*, 3> kNames = {"Temp1", "Temp2", "Temp3"};

    TemperatureSample sample;
    sample.timestamp = record.timestamp;
    bool any = false;
    for (std::size_t i = 0; i < kNames.size(); ++i)
    {
        sample.readings_c[i] = record.field(kNames[i]);
        any = any || sample.readings_c[i].has_value();
    }
    if (!any)
    {
        return std::nullopt;
    }
    return sample;
}

// WXTP carries sensor temperatures in Kelvin.
std::optional<ChannelSample> classify_weather_temperature(const FlightRecord& record,
                                                          const ClassifierConfig& config)
{
    static const std::array<const char*, 3> kNames = {"t0", "t1", "t2"};

    TemperatureSample sample;
    sample.timestamp = record.timestamp;
    bool any = false;
    for (std::size_t i = 0; i < kNames.size(); ++i)
    {
        if (const auto value = record.field(kNames[i]))
        {
            sample.readings_c[i] = kelvin_to_celsius_if_kelvin(*value, config.kelvin_threshold);
            any = true;
        }
    }
    if (!any)
    {
        return std::nullopt;
    }
    return sample;
}

std::optional<ChannelSample> classify_weather_humidity(const FlightRecord& record,
                                                       const ClassifierConfig& config)
{
    static const std::array<const char*, 3> kHumidityNames = {"rh0", "rh1", "rh2"};
    static const std::array<const char*, 3> kTemperatureNames = {"t0", "t1", "t2"};

    numeric::NanMean humidity;
    numeric::NanMean temperature;
    bool has_humidity = false;
    bool has_temperature = false;

    for (const char* name : kHumidityNames)
    {
        if (const auto value = record.field(name))
        {
            humidity.add(*value);
            has_humidity = true;
        }
    }
    for (const char* name : kTemperatureNames)
    {
        if (const auto value = record.field(name))
        {
            temperature.add(kelvin_to_celsius_if_kelvin(*value, config.kelvin_threshold));
            has_temperature = true;
        }
    }
    if (!has_humidity || !has_temperature)
    {
        return std::nullopt;
    }

    HumiditySample sample;
    sample.timestamp = record.timestamp;
    sample.relative_humidity_pct = humidity.mean();
    sample.temperature_c = temperature.mean();
    return sample;
}

std::optional<ChannelSample> classify_humidity(const FlightRecord& record,
                                               const ClassifierConfig& config)
{
    const auto humidity = record.field("Humidity");
    const auto temperature = record.field("Temp");
    if (!humidity || !temperature)
    {
        return std::nullopt;
    }

    HumiditySample sample;
    sample.timestamp = record.timestamp;
    sample.relative_humidity_pct = *humidity;
    sample.temperature_c = kelvin_to_celsius_if_kelvin(*temperature, config.kelvin_threshold);
    return sample;
}

std::optional<ChannelSample> classify_inertial(const FlightRecord& record)
{
    const auto temperature = record.field("Temp");
    if (!temperature)
    {
        return std::nullopt;
    }

    InertialTemperatureSample sample;
    sample.timestamp = record.timestamp;
    sample.temperature_c = *temperature;
    return sample;
}

} // namespace

const char* to_string(Channel channel)
{
    switch (channel)
    {
        case Channel::Position: return "position";
        case Channel::Pressure: return "pressure";
        case Channel::Temperature: return "temperature";
        case Channel::Humidity: return "humidity";
        case Channel::InertialTemperature: return "inertial_temperature";
    }
    return "unknown";
}

Channel channel_of(const ChannelSample& sample)
{
    // Variant alternatives are declared in Channel enum order.
    return static_cast<Channel>(sample.index());
}

double kelvin_to_celsius_if_kelvin(double value, double threshold)
{
    if (value > threshold)
    {
        return value - physical_constants::freezing_temperature_k;
    }
    return value;
}

std::optional<ChannelSample> classify_record(const FlightRecord& record,
                                             const ClassifierConfig& config)
{
    if (!is_bucketable(record.timestamp))
    {
        return std::nullopt;
    }

    const std::string& type = record.type;
    if (type == "GPS")
    {
        return classify_position(record);
    }
    if (type == "BARO" || type == "SCALED_PRESSURE")
    {
        return classify_pressure(record, config);
    }
    if (type == "TEMP" || type == "TEMPERATURE")
    {
        return classify_temperature(record);
    }
    if (type == "WXTP")
    {
        return classify_weather_temperature(record, config);
    }
    if (type == "WXRH")
    {
        return classify_weather_humidity(record, config);
    }
    if (type == "HUM")
    {
        return classify_humidity(record, config);
    }
    if (type == "IMU")
    {
        return classify_inertial(record);
    }
    return std::nullopt;
}

ChannelSet classify_records(const FlightRecordStream& records,
                            const ClassifierConfig& config,
                            std::size_t* dropped)
{
    ChannelSet channels;
    std::size_t dropped_count = 0;

    for (const FlightRecord& record : records)
    {
        std::optional<ChannelSample> sample = classify_record(record, config);
        if (!sample)
        {
            ++dropped_count;
            continue;
        }

        switch (channel_of(*sample))
        {
            case Channel::Position:
                channels.position.push_back(std::get<PositionSample>(*sample));
                break;
            case Channel::Pressure:
                channels.pressure.push_back(std::get<PressureSample>(*sample));
                break;
            case Channel::Temperature:
                channels.temperature.push_back(std::get<TemperatureSample>(*sample));
                break;
            case Channel::Humidity:
                channels.humidity.push_back(std::get<HumiditySample>(*sample));
                break;
            case Channel::InertialTemperature:
                channels.inertial_temperature.push_back(std::get<InertialTemperatureSample>(*sample));
                break;
        }
    }

    if (dropped)
    {
        *dropped = dropped_count;
    }
    return channels;
}

} // namespace fmet
