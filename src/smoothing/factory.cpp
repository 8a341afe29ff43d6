/**
 * @file factory.cpp
 * @brief Smoothing scheme construction by identifier.
 */

#include "factory.hpp"
#include "schemes/boxcar/boxcar.hpp"
#include "string_utils.hpp"

#include <stdexcept>

namespace fmet
{

std::unique_ptr<SmoothingScheme> create_boxcar_smoothing_scheme()
{
    return std::make_unique<BoxcarSmoothingScheme>();
}

std::vector<std::string> get_available_smoothing_schemes()
{
    return {"boxcar", "none"};
}

std::unique_ptr<SmoothingScheme> create_smoothing_scheme(const std::string& scheme_id)
{
    const std::string normalized_id = strutil::lower_copy(strutil::trim_copy(scheme_id));

    if (normalized_id == "boxcar")
    {
        return create_boxcar_smoothing_scheme();
    }
    else if (normalized_id == "none" || normalized_id.empty())
    {
        return nullptr;
    }
    else
    {
        std::string available;
        for (const std::string& name : get_available_smoothing_schemes())
        {
            available += (available.empty() ? "'" : ", '") + name + "'";
        }
        throw std::runtime_error("Unknown smoothing scheme: " + scheme_id + ". Available schemes: " + available);
    }
}

} // namespace fmet
