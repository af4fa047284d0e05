// === Geo Utilities ===========================================================
//
// Distance and degree conversions shared by the range planner, the live query
// membership test, and the tracker simulation.

#pragma once

#include "geo_query/types.hpp"

namespace geo_query {

/** @brief Haversine distance in metres using the mean of the equatorial and polar radii. */
[[nodiscard]] double distance_m(const GeoPoint& from, const GeoPoint& to);

/** @brief Latitude span in degrees covered by @p distance_m metres. */
[[nodiscard]] double distance_to_latitude_degrees(double distance_m);

/**
 * @brief Longitude span in degrees covered by @p distance_m metres at @p latitude_deg.
 *
 * Uses the WGS84 ellipsoid. Near the poles, where a degree of longitude has no
 * length, any positive distance spans the full 360 degrees. The result never
 * exceeds 360.
 */
[[nodiscard]] double distance_to_longitude_degrees(double distance_m, double latitude_deg);

/** @brief Wrap @p longitude_deg into [-180, 180]. */
[[nodiscard]] double wrap_longitude(double longitude_deg);

/** @brief Clamp @p radius_m to the largest radius the planner supports. */
[[nodiscard]] double cap_radius(double radius_m);

[[nodiscard]] bool coordinates_valid(double latitude_deg, double longitude_deg) noexcept;
[[nodiscard]] bool coordinates_valid(const GeoPoint& point) noexcept;

/** @brief Throw GeoQueryError(InvalidCoordinate) unless @p point is valid. */
void require_valid_coordinates(const GeoPoint& point);

/** @brief Destination reached travelling @p distance_m along @p bearing_deg on a great circle. */
[[nodiscard]] GeoPoint offset_coordinate(const GeoPoint& origin, double bearing_deg, double distance_m);

/** @brief Initial great-circle bearing in degrees [0, 360) from @p from towards @p to. */
[[nodiscard]] double initial_bearing_deg(const GeoPoint& from, const GeoPoint& to);

}  // namespace geo_query
