/**
 * @file boxcar.hpp
 * @brief Centered moving-average smoothing with nearest-value edge padding.
 */

#pragma once

#include "smoothing_base.hpp"

namespace fmet
{

/**
 * @brief Centered boxcar (uniform) filter.
 *
 * Output i is the plain mean of the window [i - w/2, i + w/2] where
 * indices outside the column are replaced by the nearest edge index.
 * Columns no longer than the window pass through unchanged. A NaN
 * inside a window makes that window's output NaN; windows that do not
 * contain it are unaffected.
 */
class BoxcarSmoothingScheme : public SmoothingScheme
{
public:
    BoxcarSmoothingScheme() = default;
    ~BoxcarSmoothingScheme() override = default;

    void initialize(const SmoothingConfig& config) override;

    std::vector<double> apply(const std::vector<double>& values) const override;

    const char* name() const override { return "boxcar"; }

    int window() const { return window_; }

private:
    int window_ = 9;
};

} // namespace fmet
