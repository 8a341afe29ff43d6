/**
 * @file channel_aggregator.hpp
 * @brief Per-bucket reduction of each channel onto the master index.
 *
 * Every function returns or fills values for exactly the rows of the
 * master index. Samples whose bucket is not in the index are ignored.
 * A row with no qualifying sample is NaN.
 */

#pragma once

#include "channels.hpp"
#include "conversion.hpp"
#include "observation_table.hpp"

#include <vector>

namespace fmet
{

/**
 * @brief Creates one empty row per bucket key with obs and time set.
 * @param master_index Ascending master index.
 * @return Rows with every measured field NaN.
 */
std::vector<AggregatedRow> create_rows(const std::vector<BucketKey>& master_index);

/**
 * @brief Fills latitude, longitude and altitude, first sample per bucket wins.
 *
 * "First" is decode order. With the range check enabled, a
 * first sample outside [-90,90] / [-180,180] leaves the row's position
 * fields NaN; later samples of the same bucket are not consulted.
 */
void aggregate_position(const std::vector<PositionSample>& position,
                        const std::vector<BucketKey>& master_index,
                        const AggregationConfig& config,
                        std::vector<AggregatedRow>& rows);

/**
 * @brief NaN-ignoring mean pressure per bucket.
 */
std::vector<double> aggregate_pressure(const std::vector<PressureSample>& pressure,
                                       const std::vector<BucketKey>& master_index);

/**
 * @brief NaN-ignoring mean relative humidity per bucket.
 */
std::vector<double> aggregate_humidity(const std::vector<HumiditySample>& humidity,
                                       const std::vector<BucketKey>& master_index);

/**
 * @brief NaN-ignoring mean over the pooled temperature readings per bucket.
 *
 * The pool holds the first reading of each temperature-sensor sample,
 * every inertial temperature, every pressure-channel temperature that is
 * present and every humidity-channel temperature. All sources weigh
 * equally.
 */
std::vector<double> aggregate_combined_temperature(const ChannelSet& channels,
                                                   const std::vector<BucketKey>& master_index);

} // namespace fmet
