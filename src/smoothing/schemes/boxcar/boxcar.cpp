/**
 * @file boxcar.cpp
 * @brief Implementation of the centered boxcar smoothing scheme.
 */

#include "boxcar.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fmet
{

void BoxcarSmoothingScheme::initialize(const SmoothingConfig& config)
{
    if (config.window <= 0 || config.window % 2 == 0)
    {
        throw std::runtime_error("Boxcar smoothing window must be a positive odd integer, got " +
                                 std::to_string(config.window));
    }
    window_ = config.window;
}

std::vector<double> BoxcarSmoothingScheme::apply(const std::vector<double>& values) const
{
    const long n = static_cast<long>(values.size());
    if (n <= window_)
    {
        return values;
    }

    const long half = window_ / 2;
    const double width = static_cast<double>(window_);
    std::vector<double> out(values.size());

    #pragma omp parallel for
    for (long i = 0; i < n; ++i)
    {
        double sum = 0.0;
        for (long k = i - half; k <= i + half; ++k)
        {
            sum += values[static_cast<std::size_t>(std::clamp(k, 0L, n - 1))];
        }
        out[i] = sum / width;
    }
    return out;
}

} // namespace fmet
