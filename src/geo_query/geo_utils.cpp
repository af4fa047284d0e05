#include "geo_query/geo_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <fmt/format.h>

#include "geo_query/errors.hpp"

namespace geo_query {

namespace {

constexpr double k_mean_radius_m{(earth::k_equatorial_radius_m + earth::k_polar_radius_m) / 2.0};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

}  // namespace

double distance_m(const GeoPoint& from, const GeoPoint& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = degrees_to_radians(from.latitude_deg - to.latitude_deg);
    const double delta_lon = degrees_to_radians(from.longitude_deg - to.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_mean_radius_m * c;
}

double distance_to_latitude_degrees(double distance_m) {
    return distance_m / earth::k_meters_per_degree_latitude;
}

double distance_to_longitude_degrees(double distance_m, double latitude_deg) {
    const double radians = degrees_to_radians(latitude_deg);
    const double numerator = std::cos(radians) * earth::k_equatorial_radius_m * std::numbers::pi / 180.0;
    const double denominator = 1.0 / std::sqrt(1.0 - earth::k_eccentricity_squared * std::sin(radians) * std::sin(radians));
    const double delta_degrees = numerator * denominator;
    if (delta_degrees < earth::k_epsilon) {
        return distance_m > 0.0 ? 360.0 : distance_m;
    }
    return std::min(360.0, distance_m / delta_degrees);
}

double wrap_longitude(double longitude_deg) {
    if (longitude_deg >= -180.0 && longitude_deg <= 180.0) {
        return longitude_deg;
    }
    const double adjusted = longitude_deg + 180.0;
    if (adjusted > 0.0) {
        return std::fmod(adjusted, 360.0) - 180.0;
    }
    return 180.0 - std::fmod(-adjusted, 360.0);
}

double cap_radius(double radius_m) {
    return std::min(radius_m, earth::k_max_supported_radius_m);
}

bool coordinates_valid(double latitude_deg, double longitude_deg) noexcept {
    return latitude_deg >= -90.0 && latitude_deg <= 90.0 && longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

bool coordinates_valid(const GeoPoint& point) noexcept {
    return coordinates_valid(point.latitude_deg, point.longitude_deg);
}

void require_valid_coordinates(const GeoPoint& point) {
    if (!coordinates_valid(point)) {
        throw GeoQueryError(
            ErrorCode::InvalidCoordinate,
            fmt::format("Not valid location coordinates: [{}, {}]", point.latitude_deg, point.longitude_deg)
        );
    }
}

GeoPoint offset_coordinate(const GeoPoint& origin, double bearing_deg, double distance_m) {
    const double angular_distance = distance_m / k_mean_radius_m;
    const double bearing_rad = degrees_to_radians(bearing_deg);
    const double lat_rad = degrees_to_radians(origin.latitude_deg);
    const double lon_rad = degrees_to_radians(origin.longitude_deg);

    const double new_lat = std::asin(
        std::sin(lat_rad) * std::cos(angular_distance) + std::cos(lat_rad) * std::sin(angular_distance) * std::cos(bearing_rad)
    );

    const double new_lon = lon_rad
        + std::atan2(
            std::sin(bearing_rad) * std::sin(angular_distance) * std::cos(lat_rad),
            std::cos(angular_distance) - std::sin(lat_rad) * std::sin(new_lat)
        );

    return GeoPoint{
        std::clamp(radians_to_degrees(new_lat), -90.0, 90.0),
        wrap_longitude(radians_to_degrees(new_lon))
    };
}

double initial_bearing_deg(const GeoPoint& from, const GeoPoint& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double y = std::sin(delta_lon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);
    const double bearing_rad = std::atan2(y, x);
    return std::fmod(radians_to_degrees(bearing_rad) + 360.0, 360.0);
}

}  // namespace geo_query
