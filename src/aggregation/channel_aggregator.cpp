/**
 * @file channel_aggregator.cpp
 * @brief Implementation of per-bucket channel reductions.
 */

#include "channel_aggregator.hpp"
#include "time_bucketing.hpp"
#include "numeric_utils.hpp"
#include "physical_constants.hpp"

#include <cmath>

namespace fmet
{

namespace
{

/**
 * @brief Adds a value to the accumulator of its bucket row, if the bucket is indexed.
 */
void accumulate(std::vector<numeric::NanMean>& acc,
                const std::vector<BucketKey>& master_index,
                double timestamp,
                double value)
{
    if (const auto row = row_of_bucket(master_index, bucket_of(timestamp)))
    {
        acc[*row].add(value);
    }
}

std::vector<double> means_of(const std::vector<numeric::NanMean>& acc)
{
    std::vector<double> out;
    out.reserve(acc.size());
    for (const numeric::NanMean& mean : acc)
    {
        out.push_back(mean.mean());
    }
    return out;
}

bool position_in_range(const PositionSample& sample)
{
    using namespace physical_constants;
    return sample.latitude_deg >= -latitude_abs_max_deg && sample.latitude_deg <= latitude_abs_max_deg &&
           sample.longitude_deg >= -longitude_abs_max_deg && sample.longitude_deg <= longitude_abs_max_deg;
}

} // namespace

std::vector<AggregatedRow> create_rows(const std::vector<BucketKey>& master_index)
{
    std::vector<AggregatedRow> rows(master_index.size());
    for (std::size_t i = 0; i < master_index.size(); ++i)
    {
        rows[i].obs = static_cast<int>(i + 1);
        rows[i].time_s = master_index[i];
    }
    return rows;
}

void aggregate_position(const std::vector<PositionSample>& position,
                        const std::vector<BucketKey>& master_index,
                        const AggregationConfig& config,
                        std::vector<AggregatedRow>& rows)
{
    std::vector<bool> taken(rows.size(), false);
    for (const PositionSample& sample : position)
    {
        const auto row = row_of_bucket(master_index, bucket_of(sample.timestamp));
        if (!row || taken[*row])
        {
            continue;
        }
        taken[*row] = true;

        if (config.position_range_check && !position_in_range(sample))
        {
            continue;
        }
        rows[*row].latitude_deg = sample.latitude_deg;
        rows[*row].longitude_deg = sample.longitude_deg;
        rows[*row].altitude_m = sample.altitude_m;
    }
}

std::vector<double> aggregate_pressure(const std::vector<PressureSample>& pressure,
                                       const std::vector<BucketKey>& master_index)
{
    std::vector<numeric::NanMean> acc(master_index.size());
    for (const PressureSample& sample : pressure)
    {
        accumulate(acc, master_index, sample.timestamp, sample.pressure);
    }
    return means_of(acc);
}

std::vector<double> aggregate_humidity(const std::vector<HumiditySample>& humidity,
                                       const std::vector<BucketKey>& master_index)
{
    std::vector<numeric::NanMean> acc(master_index.size());
    for (const HumiditySample& sample : humidity)
    {
        accumulate(acc, master_index, sample.timestamp, sample.relative_humidity_pct);
    }
    return means_of(acc);
}

std::vector<double> aggregate_combined_temperature(const ChannelSet& channels,
                                                   const std::vector<BucketKey>& master_index)
{
    std::vector<numeric::NanMean> acc(master_index.size());

    for (const TemperatureSample& sample : channels.temperature)
    {
        accumulate(acc, master_index, sample.timestamp,
                   sample.readings_c[0].value_or(numeric::quiet_nan()));
    }
    for (const InertialTemperatureSample& sample : channels.inertial_temperature)
    {
        accumulate(acc, master_index, sample.timestamp, sample.temperature_c);
    }
    for (const PressureSample& sample : channels.pressure)
    {
        if (sample.temperature_c)
        {
            accumulate(acc, master_index, sample.timestamp, *sample.temperature_c);
        }
    }
    for (const HumiditySample& sample : channels.humidity)
    {
        accumulate(acc, master_index, sample.timestamp, sample.temperature_c);
    }

    return means_of(acc);
}

} // namespace fmet
