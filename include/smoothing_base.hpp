#pragma once

#include <memory>
#include <string>
#include <vector>

/**
 * @file smoothing_base.hpp
 * @brief Base interface and configuration for column smoothing schemes.
 *
 * A smoothing scheme maps one aggregated column to a column of the same
 * length and index alignment. Factory construction selects the scheme by
 * identifier; the identifier "none" yields no scheme (pass-through).
 */

namespace fmet
{

struct SmoothingConfig
{
    std::string scheme_id = "boxcar";
    int window = 9;
};

class SmoothingScheme
{
public:
    /**
     * @brief Virtual destructor for polymorphic cleanup.
     */
    virtual ~SmoothingScheme() = default;

    /**
     * @brief Initializes the scheme from configuration.
     * @param config Smoothing configuration.
     * @throws std::runtime_error when the configuration is not usable.
     */
    virtual void initialize(const SmoothingConfig& config) = 0;

    /**
     * @brief Smooths a column.
     * @param values Input column in index order.
     * @return Smoothed column with the same length as the input.
     */
    virtual std::vector<double> apply(const std::vector<double>& values) const = 0;

    /**
     * @brief Returns the scheme identifier.
     */
    virtual const char* name() const = 0;
};

/**
 * @brief Creates a smoothing scheme by identifier.
 * @param scheme_id Scheme identifier ("boxcar", "none").
 * @return Owning pointer to a scheme instance, or null for "none".
 * @throws std::runtime_error if scheme_id is not recognized.
 */
std::unique_ptr<SmoothingScheme> create_smoothing_scheme(const std::string& scheme_id);

} // namespace fmet
