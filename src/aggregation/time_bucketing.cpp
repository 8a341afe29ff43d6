/**
 * @file time_bucketing.cpp
 * @brief Implementation of bucket keys and master index construction.
 */

#include "time_bucketing.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace fmet
{

bool is_bucketable(double timestamp)
{
    // [-2^63, 2^63) is exactly representable as double bounds.
    const double limit = std::ldexp(1.0, std::numeric_limits<BucketKey>::digits);
    const double second = std::floor(timestamp);
    return std::isfinite(second) && second >= -limit && second < limit;
}

BucketKey bucket_of(double timestamp)
{
    if (!is_bucketable(timestamp))
    {
        throw std::out_of_range("timestamp " + std::to_string(timestamp) + " has no whole-second bucket");
    }
    return static_cast<BucketKey>(std::floor(timestamp));
}

std::vector<BucketKey> build_master_index(const std::vector<PositionSample>& position)
{
    std::vector<BucketKey> keys;
    keys.reserve(position.size());
    for (const PositionSample& sample : position)
    {
        keys.push_back(bucket_of(sample.timestamp));
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

std::optional<std::size_t> row_of_bucket(const std::vector<BucketKey>& master_index, BucketKey key)
{
    const auto it = std::lower_bound(master_index.begin(), master_index.end(), key);
    if (it == master_index.end() || *it != key)
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - master_index.begin());
}

} // namespace fmet
