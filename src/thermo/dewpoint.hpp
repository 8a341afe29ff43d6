/**
 * @file dewpoint.hpp
 * @brief Dew point from air temperature and relative humidity.
 */

#pragma once

#include <vector>

namespace fmet
{
namespace thermo
{

/**
 * @brief Magnus-approximation dew point.
 *
 * Relative humidity is clamped to [0.1, 100] percent before the
 * logarithm; temperature is not clamped. NaN in either input gives NaN.
 *
 * @param temperature_c Air temperature in degrees Celsius.
 * @param relative_humidity_pct Relative humidity in percent.
 * @return Dew point in degrees Celsius.
 */
double dewpoint_magnus(double temperature_c, double relative_humidity_pct);

/**
 * @brief Element-wise dew point over aligned columns.
 * @param temperature_c Temperature column.
 * @param relative_humidity_pct Humidity column of the same length.
 * @return Dew point column.
 * @throws std::invalid_argument when the column lengths differ.
 */
std::vector<double> dewpoint_column(const std::vector<double>& temperature_c,
                                    const std::vector<double>& relative_humidity_pct);

} // namespace thermo
} // namespace fmet
