/**
 * @file conversion.cpp
 * @brief Table assembly: runs the engine stages in order.
 *
 * classify -> master index -> per-channel aggregation -> temperature
 * smoothing -> dew point from smoothed temperature and raw humidity.
 */

#include "conversion.hpp"

#include "aggregation/channel_aggregator.hpp"
#include "aggregation/time_bucketing.hpp"
#include "classifier/channel_classifier.hpp"
#include "runtime_log.hpp"
#include "thermo/dewpoint.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fmet
{

ObservationTable assemble_observation_table(const ChannelSet& channels,
                                            const ConversionConfig& config,
                                            ConversionSummary* summary)
{
    const std::vector<BucketKey> master_index = build_master_index(channels.position);
    if (master_index.empty())
    {
        throw std::runtime_error("No valid GPS position data found; nothing to convert");
    }

    std::vector<AggregatedRow> rows = create_rows(master_index);
    aggregate_position(channels.position, master_index, config.aggregation, rows);

    const std::vector<double> pressure = aggregate_pressure(channels.pressure, master_index);
    const std::vector<double> humidity = aggregate_humidity(channels.humidity, master_index);
    std::vector<double> temperature = aggregate_combined_temperature(channels, master_index);

    bool smoothed = false;
    std::unique_ptr<SmoothingScheme> smoother = create_smoothing_scheme(config.smoothing.scheme_id);
    if (smoother)
    {
        smoother->initialize(config.smoothing);
        smoothed = temperature.size() > static_cast<std::size_t>(config.smoothing.window);
        temperature = smoother->apply(temperature);
    }

    const std::vector<double> dew_point = thermo::dewpoint_column(temperature, humidity);

    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        rows[i].air_pressure = pressure[i];
        rows[i].relative_humidity_pct = humidity[i];
        rows[i].air_temperature_c = temperature[i];
        rows[i].dew_point_c = dew_point[i];
    }

    if (log_debug_enabled())
    {
        std::cout << "Master index: " << master_index.size() << " seconds ["
                  << master_index.front() << ", " << master_index.back() << "]" << std::endl;
        std::cout << "Temperature smoothing: "
                  << (smoothed ? smoother->name() : "not applied") << std::endl;
    }

    if (summary)
    {
        summary->position_samples = channels.position.size();
        summary->pressure_samples = channels.pressure.size();
        summary->temperature_samples = channels.temperature.size();
        summary->humidity_samples = channels.humidity.size();
        summary->inertial_samples = channels.inertial_temperature.size();
        summary->rows = rows.size();
        summary->smoothed = smoothed;
    }

    ObservationTable table;
    table.rows = std::move(rows);
    return table;
}

ObservationTable convert_records(const FlightRecordStream& records,
                                 const ConversionConfig& config,
                                 ConversionSummary* summary)
{
    std::size_t dropped = 0;
    const ChannelSet channels = classify_records(records, config.classifier, &dropped);

    if (log_debug_enabled())
    {
        std::cout << "Classified " << channels.total_samples() << " of " << records.size()
                  << " records (" << dropped << " dropped)" << std::endl;
        const std::pair<Channel, std::size_t> counts[] = {
            {Channel::Position, channels.position.size()},
            {Channel::Pressure, channels.pressure.size()},
            {Channel::Temperature, channels.temperature.size()},
            {Channel::Humidity, channels.humidity.size()},
            {Channel::InertialTemperature, channels.inertial_temperature.size()},
        };
        for (const auto& [channel, count] : counts)
        {
            std::cout << "  " << to_string(channel) << ": " << count << std::endl;
        }
    }

    ObservationTable table = assemble_observation_table(channels, config, summary);
    if (summary)
    {
        summary->records_in = records.size();
        summary->records_dropped = dropped;
    }
    return table;
}

} // namespace fmet
