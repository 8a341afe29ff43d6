/**
 * @file column_contract.cpp
 * @brief Observation column table and row accessors.
 */

#include "column_contract.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace fmet {
namespace {

/**
 * @brief Truncates a finite value toward zero, throwing when it does not fit T.
 */
template <typename T>
T checked_integer(const ColumnContract& contract, double value) {
    const double truncated = std::trunc(value);
    const double limit = std::ldexp(1.0, std::numeric_limits<T>::digits);
    if (truncated < -limit || truncated >= limit) {
        throw std::runtime_error("value " + std::to_string(value) + " out of range for column " + contract.id);
    }
    return static_cast<T>(truncated);
}

/**
 * @brief Builds an inclusive min/max bounds descriptor.
 */
ColumnBounds bounds(double min_value, double max_value) {
    ColumnBounds out;
    out.has_min = true;
    out.has_max = true;
    out.min_value = min_value;
    out.max_value = max_value;
    return out;
}

ColumnBounds lower_bound_only(double min_value) {
    ColumnBounds out;
    out.has_min = true;
    out.min_value = min_value;
    return out;
}

const std::vector<ColumnContract> kColumns = {
    {"obs", "observation", "1", "", "Observation index", 0, ColumnRole::Index,
     lower_bound_only(1.0), {"observation"}},
    {"lat", "latitude", "degrees_north", "latitude", "Latitude", 7, ColumnRole::Coordinate,
     bounds(-90.0, 90.0), {"latitude_deg"}},
    {"lon", "longitude", "degrees_east", "longitude", "Longitude", 7, ColumnRole::Coordinate,
     bounds(-180.0, 180.0), {"longitude_deg"}},
    {"altitude", "altitude", "meters", "altitude", "Altitude above mean sea level", 2,
     ColumnRole::Coordinate, bounds(-500.0, 40000.0), {"alt"}},
    {"time", "time", "seconds since 1970-01-01 00:00:00", "time", "Time", 2, ColumnRole::Index,
     lower_bound_only(0.0), {"time_s"}},
    {"air_temp", "air_temperature", "degree_Celsius", "air_temperature", "Air temperature", 6,
     ColumnRole::Measured, bounds(-90.0, 60.0), {"temperature"}},
    {"dew_point", "dew_point_temperature", "degree_Celsius", "dew_point_temperature",
     "Dew point temperature", 6, ColumnRole::Derived, bounds(-120.0, 60.0), {"dewpoint", "td"}},
    {"rel_hum", "relative_humidity", "percent", "relative_humidity", "Relative humidity", 6,
     ColumnRole::Measured, bounds(0.0, 100.0), {"rh"}},
    {"air_press", "air_pressure", "hPa", "air_pressure", "Air pressure", 6, ColumnRole::Measured,
     lower_bound_only(0.0), {"pressure"}},
    {"gpt", "", "", "", "Geopotential", 6, ColumnRole::Placeholder, {}, {}},
    {"gpt_height", "", "", "", "Geopotential height", 6, ColumnRole::Placeholder, {}, {}},
    {"wind_speed", "", "", "", "Wind speed", 6, ColumnRole::Placeholder, {}, {}},
    {"wind_dir", "", "", "", "Wind direction", 6, ColumnRole::Placeholder, {}, {}},
};

using DoubleMember = double AggregatedRow::*;

const std::unordered_map<std::string, DoubleMember> kDoubleMembers = {
    {"lat", &AggregatedRow::latitude_deg},
    {"lon", &AggregatedRow::longitude_deg},
    {"altitude", &AggregatedRow::altitude_m},
    {"air_temp", &AggregatedRow::air_temperature_c},
    {"dew_point", &AggregatedRow::dew_point_c},
    {"rel_hum", &AggregatedRow::relative_humidity_pct},
    {"air_press", &AggregatedRow::air_pressure},
    {"gpt", &AggregatedRow::gpt},
    {"gpt_height", &AggregatedRow::gpt_height},
    {"wind_speed", &AggregatedRow::wind_speed},
    {"wind_dir", &AggregatedRow::wind_dir},
};

DoubleMember double_member(const ColumnContract& contract) {
    const auto it = kDoubleMembers.find(contract.id);
    if (it == kDoubleMembers.end()) {
        throw std::invalid_argument("Column has no double storage: " + contract.id);
    }
    return it->second;
}

}

/**
 * @brief Returns the static column table.
 */
const std::vector<ColumnContract>& observation_column_contracts() {
    return kColumns;
}

/**
 * @brief Looks up a column by id, NetCDF name or alias (case-insensitive).
 */
const ColumnContract* find_column_contract(std::string_view id_or_alias) {
    const std::string needle = strutil::lower_copy(std::string(id_or_alias));
    for (const auto& contract : kColumns) {
        if (contract.id == needle || (!contract.netcdf_name.empty() && contract.netcdf_name == needle)) {
            return &contract;
        }
        const auto hit = std::find(contract.aliases.begin(), contract.aliases.end(), needle);
        if (hit != contract.aliases.end()) {
            return &contract;
        }
    }
    return nullptr;
}

std::vector<const ColumnContract*> netcdf_data_columns() {
    std::vector<const ColumnContract*> out;
    for (const auto& contract : kColumns) {
        if (contract.role == ColumnRole::Index || contract.role == ColumnRole::Placeholder) {
            continue;
        }
        out.push_back(&contract);
    }
    return out;
}

double column_value(const AggregatedRow& row, const ColumnContract& contract) {
    if (contract.id == "obs") {
        return static_cast<double>(row.obs);
    }
    if (contract.id == "time") {
        return static_cast<double>(row.time_s);
    }
    return row.*double_member(contract);
}

void set_column_value(AggregatedRow& row, const ColumnContract& contract, double value) {
    if (contract.id == "obs") {
        row.obs = std::isfinite(value) ? checked_integer<int>(contract, value) : 0;
        return;
    }
    if (contract.id == "time") {
        row.time_s = std::isfinite(value) ? checked_integer<BucketKey>(contract, value) : 0;
        return;
    }
    row.*double_member(contract) = value;
}

std::vector<double> extract_column(const ObservationTable& table, const ColumnContract& contract) {
    std::vector<double> out;
    out.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        out.push_back(column_value(row, contract));
    }
    return out;
}

/**
 * @brief Converts column role enum to stable string id.
 */
const char* to_string(ColumnRole value) {
    switch (value) {
        case ColumnRole::Index:
            return "index";
        case ColumnRole::Coordinate:
            return "coordinate";
        case ColumnRole::Measured:
            return "measured";
        case ColumnRole::Derived:
            return "derived";
        case ColumnRole::Placeholder:
            return "placeholder";
        default:
            return "unknown";
    }
}

}
