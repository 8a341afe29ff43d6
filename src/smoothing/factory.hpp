/**
 * @file factory.hpp
 * @brief Factory declarations for smoothing schemes.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "smoothing_base.hpp"

namespace fmet
{

/**
 * @brief Creates the boxcar smoothing scheme.
 * @return Unique pointer to a boxcar scheme instance.
 */
std::unique_ptr<SmoothingScheme> create_boxcar_smoothing_scheme();

/**
 * @brief Returns names of available smoothing schemes.
 */
std::vector<std::string> get_available_smoothing_schemes();

} // namespace fmet
