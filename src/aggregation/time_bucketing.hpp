/**
 * @file time_bucketing.hpp
 * @brief Whole-second bucket keys and the position-derived master index.
 */

#pragma once

#include "channels.hpp"
#include "observation_table.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace fmet
{

/**
 * @brief True when a timestamp is finite and its whole second fits a BucketKey.
 */
bool is_bucketable(double timestamp);

/**
 * @brief Returns the bucket key of a timestamp, floor to whole seconds.
 * @param timestamp Absolute time in seconds.
 * @throws std::out_of_range when the timestamp is not bucketable.
 */
BucketKey bucket_of(double timestamp);

/**
 * @brief Builds the sorted, de-duplicated bucket keys of the position channel.
 * @param position Position samples in any order.
 * @return Ascending master index; empty when there are no samples.
 */
std::vector<BucketKey> build_master_index(const std::vector<PositionSample>& position);

/**
 * @brief Finds the row of a bucket key in the master index.
 * @param master_index Ascending master index.
 * @param key Bucket key to look up.
 * @return Zero-based row, or empty when the key is not in the index.
 */
std::optional<std::size_t> row_of_bucket(const std::vector<BucketKey>& master_index, BucketKey key);

} // namespace fmet
