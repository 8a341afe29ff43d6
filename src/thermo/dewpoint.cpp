/**
 * @file dewpoint.cpp
 * @brief Implementation of the Magnus dew point diagnostics.
 */

#include "dewpoint.hpp"
#include "numeric_utils.hpp"
#include "physical_constants.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fmet
{
namespace thermo
{

double dewpoint_magnus(double temperature_c, double relative_humidity_pct)
{
    using namespace physical_constants;

    if (std::isnan(temperature_c) || std::isnan(relative_humidity_pct))
    {
        return numeric::quiet_nan();
    }

    const double rh = std::clamp(relative_humidity_pct,
                                 relative_humidity_floor_pct,
                                 relative_humidity_ceiling_pct);
    const double alpha = (magnus_a * temperature_c) / (magnus_b_c + temperature_c) +
                         std::log(rh / 100.0);
    return (magnus_b_c * alpha) / (magnus_a - alpha);
}

std::vector<double> dewpoint_column(const std::vector<double>& temperature_c,
                                    const std::vector<double>& relative_humidity_pct)
{
    if (temperature_c.size() != relative_humidity_pct.size())
    {
        throw std::invalid_argument("dewpoint_column: temperature and humidity lengths differ");
    }

    const long n = static_cast<long>(temperature_c.size());
    std::vector<double> out(temperature_c.size());

    #pragma omp parallel for
    for (long i = 0; i < n; ++i)
    {
        out[i] = dewpoint_magnus(temperature_c[i], relative_humidity_pct[i]);
    }
    return out;
}

} // namespace thermo
} // namespace fmet
