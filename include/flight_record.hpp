#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file flight_record.hpp
 * @brief Decoded flight-log record handed from a log decoder to the engine.
 *
 * A record is one timestamped message with its numeric fields by name.
 * The timestamp is absolute UTC Unix seconds; producing it is the
 * decoder's job (see dataflash_reader.hpp) and the classifier rejects
 * records whose timestamp is not finite.
 */

namespace fmet
{

struct FlightRecord
{
    double timestamp = 0.0;
    std::string type;
    std::map<std::string, double> fields;

    /**
     * @brief Looks up a numeric field by name.
     * @param name Field name as written by the decoder.
     * @return Field value, or empty when the record does not carry it.
     */
    std::optional<double> field(const std::string& name) const
    {
        const auto it = fields.find(name);
        if (it == fields.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool has_field(const std::string& name) const { return fields.count(name) != 0; }
};

using FlightRecordStream = std::vector<FlightRecord>;

} // namespace fmet
