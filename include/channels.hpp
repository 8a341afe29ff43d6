#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

/**
 * @file channels.hpp
 * @brief Typed sensor channels produced by the channel classifier.
 *
 * Each channel keeps its samples in decode order. Optional
 * readings are std::optional so an absent field stays distinct from a
 * field that was logged as NaN.
 */

namespace fmet
{

enum class Channel
{
    Position,
    Pressure,
    Temperature,
    Humidity,
    InertialTemperature,
};

struct PositionSample
{
    double timestamp = 0.0;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double altitude_m = 0.0;
};

struct PressureSample
{
    double timestamp = 0.0;
    double pressure = 0.0;
    std::optional<double> temperature_c;
};

struct TemperatureSample
{
    double timestamp = 0.0;
    std::array<std::optional<double>, 3> readings_c;
};

struct HumiditySample
{
    double timestamp = 0.0;
    double relative_humidity_pct = 0.0;
    double temperature_c = 0.0;
};

struct InertialTemperatureSample
{
    double timestamp = 0.0;
    double temperature_c = 0.0;
};

/**
 * @brief All classified samples of one conversion run, grouped by channel.
 */
struct ChannelSet
{
    std::vector<PositionSample> position;
    std::vector<PressureSample> pressure;
    std::vector<TemperatureSample> temperature;
    std::vector<HumiditySample> humidity;
    std::vector<InertialTemperatureSample> inertial_temperature;

    std::size_t total_samples() const
    {
        return position.size() + pressure.size() + temperature.size() +
               humidity.size() + inertial_temperature.size();
    }
};

/**
 * @brief Converts a channel enum to its display name.
 */
const char* to_string(Channel channel);

} // namespace fmet
