#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical and time-base constants used across conversion stages.
 *
 * Centralizes thermodynamic constants for the moisture diagnostics and
 * the GPS/Unix epoch relationship used when anchoring flight-log clocks,
 * so classifier, decoder and derived-quantity code agree on values.
 */

namespace fmet
{
namespace physical_constants
{
inline constexpr double freezing_temperature_k = 273.15;

// Magnus coefficients over water (Sonntag 1990 / WMO).
inline constexpr double magnus_a = 17.62;
inline constexpr double magnus_b_c = 243.12;
inline constexpr double relative_humidity_floor_pct = 0.1;
inline constexpr double relative_humidity_ceiling_pct = 100.0;

inline constexpr double kelvin_detection_threshold = 200.0;

inline constexpr double seconds_per_gps_week = 604800.0;
inline constexpr double gps_to_unix_offset_s = 315964800.0;
inline constexpr double gps_leap_seconds = 18.0;

inline constexpr double latitude_abs_max_deg = 90.0;
inline constexpr double longitude_abs_max_deg = 180.0;
} // namespace physical_constants
} // namespace fmet
