/**
 * @file channel_classifier.hpp
 * @brief Routing of decoded records into typed sensor channels.
 *
 * Each record maps to at most one channel sample. Records of unknown
 * type, records missing a required field and records without a finite
 * timestamp produce no sample.
 */

#pragma once

#include "channels.hpp"
#include "conversion.hpp"
#include "flight_record.hpp"

#include <cstddef>
#include <optional>
#include <variant>

namespace fmet
{

using ChannelSample = std::variant<PositionSample,
                                   PressureSample,
                                   TemperatureSample,
                                   HumiditySample,
                                   InertialTemperatureSample>;

/**
 * @brief Returns the channel a classified sample belongs to.
 */
Channel channel_of(const ChannelSample& sample);

/**
 * @brief Converts a temperature to Celsius when it looks like Kelvin.
 * @param value Temperature reading, Kelvin or Celsius.
 * @param threshold Values strictly above this are treated as Kelvin.
 * @return Celsius value; NaN passes through unchanged.
 */
double kelvin_to_celsius_if_kelvin(double value, double threshold);

/**
 * @brief Classifies one decoded record.
 * @param record Decoded record with absolute UTC timestamp.
 * @param config Classifier configuration.
 * @return Sample for the matching channel, or empty when the record is dropped.
 */
std::optional<ChannelSample> classify_record(const FlightRecord& record,
                                             const ClassifierConfig& config);

/**
 * @brief Classifies a record stream, preserving decode order per channel.
 * @param records Decoded records in decode order.
 * @param config Classifier configuration.
 * @param dropped Optional count of records that produced no sample.
 * @return Channel set owning all samples of the run.
 */
ChannelSet classify_records(const FlightRecordStream& records,
                            const ClassifierConfig& config,
                            std::size_t* dropped = nullptr);

} // namespace fmet
