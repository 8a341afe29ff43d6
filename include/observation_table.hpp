#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

/**
 * @file observation_table.hpp
 * @brief Per-second observation rows produced by a conversion run.
 *
 * One row per bucket key (whole UTC second) present in the position
 * channel, ordered by ascending key with a 1-based observation index.
 * Missing values are quiet NaN. The wind and geopotential columns are
 * reserved and always NaN.
 */

namespace fmet
{

using BucketKey = std::int64_t;

struct AggregatedRow
{
    int obs = 0;
    BucketKey time_s = 0;
    double latitude_deg = std::numeric_limits<double>::quiet_NaN();
    double longitude_deg = std::numeric_limits<double>::quiet_NaN();
    double altitude_m = std::numeric_limits<double>::quiet_NaN();
    double air_temperature_c = std::numeric_limits<double>::quiet_NaN();
    double dew_point_c = std::numeric_limits<double>::quiet_NaN();
    double relative_humidity_pct = std::numeric_limits<double>::quiet_NaN();
    double air_pressure = std::numeric_limits<double>::quiet_NaN();
    double gpt = std::numeric_limits<double>::quiet_NaN();
    double gpt_height = std::numeric_limits<double>::quiet_NaN();
    double wind_speed = std::numeric_limits<double>::quiet_NaN();
    double wind_dir = std::numeric_limits<double>::quiet_NaN();
};

struct ObservationTable
{
    std::vector<AggregatedRow> rows;

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    /**
     * @brief Checks ordering and indexing invariants of the table.
     * @return True when keys strictly increase and obs runs 1..N.
     */
    bool is_valid() const
    {
        for (std::size_t i = 0; i < rows.size(); ++i)
        {
            if (rows[i].obs != static_cast<int>(i + 1))
            {
                return false;
            }
            if (i > 0 && rows[i].time_s <= rows[i - 1].time_s)
            {
                return false;
            }
        }
        return true;
    }
};

} // namespace fmet
