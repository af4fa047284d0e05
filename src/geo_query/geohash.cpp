#include "geo_query/geohash.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"

namespace geo_query {

GeoHash::GeoHash(const GeoPoint& location, int precision)
    : GeoHash(location.latitude_deg, location.longitude_deg, precision) {}

GeoHash::GeoHash(double latitude_deg, double longitude_deg, int precision) {
    if (precision < 1) {
        throw GeoQueryError(ErrorCode::InvalidPrecision, "Precision of GeoHash must be larger than zero");
    }
    if (precision > k_max_precision) {
        throw GeoQueryError(
            ErrorCode::InvalidPrecision,
            fmt::format("Precision of a GeoHash must be less than {}", k_max_precision + 1)
        );
    }
    const GeoPoint location{latitude_deg, longitude_deg};
    require_valid_coordinates(location);

    std::array<double, 2> longitude_range{-180.0, 180.0};
    std::array<double, 2> latitude_range{-90.0, 90.0};

    str_hash_.reserve(static_cast<std::size_t>(precision));
    for (int index = 0; index < precision; ++index) {
        int hash_value = 0;
        for (int bit = 0; bit < base32::k_bits_per_char; ++bit) {
            const bool even = (index * base32::k_bits_per_char + bit) % 2 == 0;
            const double value = even ? longitude_deg : latitude_deg;
            std::array<double, 2>& range = even ? longitude_range : latitude_range;
            const double mid = (range[0] + range[1]) / 2.0;
            if (value > mid) {
                hash_value = (hash_value << 1) + 1;
                range[0] = mid;
            } else {
                hash_value <<= 1;
                range[1] = mid;
            }
        }
        str_hash_.push_back(base32::value_to_char(hash_value));
    }
    location_ = location;
}

GeoHash::GeoHash(std::string hash)
    : str_hash_(std::move(hash)) {}

GeoHash GeoHash::parse(std::string hash) {
    if (hash.empty() || !base32::is_valid_string(hash)) {
        throw GeoQueryError(ErrorCode::InvalidGeohash, fmt::format("Not a valid geohash: '{}'", hash));
    }
    return GeoHash(std::move(hash));
}

const std::string& GeoHash::str() const noexcept {
    return str_hash_;
}

const std::optional<GeoPoint>& GeoHash::location() const noexcept {
    return location_;
}

std::size_t GeoHash::precision() const noexcept {
    return str_hash_.size();
}

}  // namespace geo_query
