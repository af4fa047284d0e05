// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// library (time primitives, geographic points, earth constants).

#pragma once

#include <chrono>

namespace geo_query {

/**
 * @brief Alias for the steady clock used by the tracker simulation.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Latitude/longitude pair in decimal degrees.
 *
 * Plain value type; validity is checked by the entities derived from it
 * (GeoHash, LiveQuery, LocationStore) rather than on construction.
 */
struct GeoPoint final {
    double latitude_deg{};   /**< Latitude in decimal degrees, [-90, 90]. */
    double longitude_deg{};  /**< Longitude in decimal degrees, [-180, 180]. */

    friend bool operator==(const GeoPoint& lhs, const GeoPoint& rhs) noexcept {
        return lhs.latitude_deg == rhs.latitude_deg && lhs.longitude_deg == rhs.longitude_deg;
    }
};

/** @brief Earth model constants shared by the encoder and the planner. */
namespace earth {

inline constexpr double k_meters_per_degree_latitude{110'574.0};        /**< Length of a degree of latitude at the equator. */
inline constexpr double k_meridional_circumference_m{40'007'860.0};     /**< Meridional circumference in metres. */
inline constexpr double k_equatorial_radius_m{6'378'137.0};             /**< Equatorial radius in metres. */
inline constexpr double k_polar_radius_m{6'357'852.3};                  /**< Polar radius in metres. */
inline constexpr double k_eccentricity_squared{0.00669447819799};       /**< WGS84 e^2 = (re^2 - rp^2) / re^2. */
inline constexpr double k_epsilon{1e-12};                               /**< Cutoff for degenerate floating point results. */
inline constexpr double k_max_supported_radius_m{8'587'000.0};          /**< Radii above this are clamped. */

}  // namespace earth

}  // namespace geo_query
