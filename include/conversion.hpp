#pragma once

#include "channels.hpp"
#include "flight_record.hpp"
#include "observation_table.hpp"
#include "physical_constants.hpp"
#include "smoothing_base.hpp"

#include <cstddef>

/**
 * @file conversion.hpp
 * @brief Public API of the alignment and aggregation engine.
 *
 * convert_records() is a pure function from a decoded record stream to
 * an ObservationTable: classify, bucket on the position channel,
 * aggregate each channel per bucket, smooth temperature, derive dew
 * point, assemble. It holds no state between calls.
 */

namespace fmet
{

struct ClassifierConfig
{
    double kelvin_threshold = physical_constants::kelvin_detection_threshold;
};

struct AggregationConfig
{
    bool position_range_check = false;
};

struct ConversionConfig
{
    ClassifierConfig classifier{};
    AggregationConfig aggregation{};
    SmoothingConfig smoothing{};
};

/**
 * @brief Counters describing one conversion run, reported by the CLI.
 */
struct ConversionSummary
{
    std::size_t records_in = 0;
    std::size_t records_dropped = 0;
    std::size_t position_samples = 0;
    std::size_t pressure_samples = 0;
    std::size_t temperature_samples = 0;
    std::size_t humidity_samples = 0;
    std::size_t inertial_samples = 0;
    std::size_t rows = 0;
    bool smoothed = false;
};

/**
 * @brief Converts a decoded session into per-second observations.
 * @param records Decoded records in decode order.
 * @param config Engine configuration.
 * @param summary Optional run counters output.
 * @return Assembled observation table.
 * @throws std::runtime_error when the session holds no position samples.
 */
ObservationTable convert_records(const FlightRecordStream& records,
                                 const ConversionConfig& config,
                                 ConversionSummary* summary = nullptr);

/**
 * @brief Runs the engine stages on an already-classified channel set.
 * @param channels Classified samples in decode order.
 * @param config Engine configuration.
 * @param summary Optional run counters output.
 * @return Assembled observation table.
 * @throws std::runtime_error when the position channel is empty.
 */
ObservationTable assemble_observation_table(const ChannelSet& channels,
                                            const ConversionConfig& config,
                                            ConversionSummary* summary = nullptr);

} // namespace fmet
