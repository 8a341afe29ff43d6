#pragma once

#include <cmath>
#include <cstddef>
#include <limits>

/**
 * @file numeric_utils.hpp
 * @brief NaN-aware reductions shared by the classifier and aggregator.
 */

namespace fmet
{
namespace numeric
{

inline double quiet_nan()
{
    return std::numeric_limits<double>::quiet_NaN();
}

/**
 * @brief Running mean that skips NaN inputs.
 *
 * mean() is NaN when nothing finite-or-infinite was added, matching a
 * NaN-ignoring mean over an empty or all-NaN selection.
 */
class NanMean
{
public:
    void add(double value)
    {
        if (std::isnan(value))
        {
            return;
        }
        sum_ += value;
        ++count_;
    }

    double mean() const
    {
        return count_ == 0 ? quiet_nan() : sum_ / static_cast<double>(count_);
    }

private:
    double sum_ = 0.0;
    std::size_t count_ = 0;
};

} // namespace numeric
} // namespace fmet
