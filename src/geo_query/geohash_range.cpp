#include "geo_query/geohash_range.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "geo_query/base32.hpp"
#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"

namespace geo_query {

GeoHashRange::GeoHashRange(std::string start_value, std::string end_value)
    : str_start_(std::move(start_value)),
      str_end_(std::move(end_value)) {}

const std::string& GeoHashRange::start_value() const noexcept {
    return str_start_;
}

const std::string& GeoHashRange::end_value() const noexcept {
    return str_end_;
}

bool GeoHashRange::is_prefix(const GeoHashRange& other) const noexcept {
    return other.str_end_ >= str_start_
        && other.str_start_ < str_start_
        && other.str_end_ < str_end_;
}

bool GeoHashRange::is_super_query(const GeoHashRange& other) const noexcept {
    return other.str_start_ <= str_start_ && other.str_end_ >= str_end_;
}

bool GeoHashRange::can_join_with(const GeoHashRange& other) const noexcept {
    return is_prefix(other) || other.is_prefix(*this) || is_super_query(other) || other.is_super_query(*this);
}

GeoHashRange GeoHashRange::join_with(const GeoHashRange& other) const {
    if (other.is_prefix(*this)) {
        return GeoHashRange(str_start_, other.str_end_);
    }
    if (is_prefix(other)) {
        return GeoHashRange(other.str_start_, str_end_);
    }
    if (is_super_query(other)) {
        return other;
    }
    if (other.is_super_query(*this)) {
        return *this;
    }
    throw UnjoinableRangesError(fmt::format("Can't join these 2 ranges: {}, {}", to_string(), other.to_string()));
}

bool GeoHashRange::contains(const GeoHash& hash) const noexcept {
    return contains(std::string_view{hash.str()});
}

bool GeoHashRange::contains(std::string_view hash) const noexcept {
    return std::string_view{str_start_} <= hash && std::string_view{str_end_} > hash;
}

std::string GeoHashRange::to_string() const {
    return fmt::format("[{}, {})", str_start_, str_end_);
}

namespace planner {

namespace {

using RangeIterator = CoveringSet::const_iterator;

std::optional<std::pair<RangeIterator, RangeIterator>> find_joinable_pair(const CoveringSet& ranges) {
    for (auto first = ranges.begin(); first != ranges.end(); ++first) {
        for (auto second = std::next(first); second != ranges.end(); ++second) {
            if (first->can_join_with(*second)) {
                return std::make_pair(first, second);
            }
        }
    }
    return std::nullopt;
}

}  // namespace

double bits_latitude(double resolution_m) {
    return std::min(
        std::log2(earth::k_meridional_circumference_m / 2.0 / resolution_m),
        static_cast<double>(GeoHash::k_max_precision_bits)
    );
}

double bits_longitude(double resolution_m, double latitude_deg) {
    const double degrees = distance_to_longitude_degrees(resolution_m, latitude_deg);
    return std::abs(degrees) > 0.0 ? std::max(1.0, std::log2(360.0 / degrees)) : 1.0;
}

int bits_for_bounding_box(const GeoPoint& center, double radius_m) {
    const double latitude_delta = distance_to_latitude_degrees(radius_m);
    const double latitude_north = std::min(90.0, center.latitude_deg + latitude_delta);
    const double latitude_south = std::max(-90.0, center.latitude_deg - latitude_delta);
    const int bits_lat = static_cast<int>(std::floor(bits_latitude(radius_m))) * 2;
    const int bits_lon_north = static_cast<int>(std::floor(bits_longitude(radius_m, latitude_north))) * 2 - 1;
    const int bits_lon_south = static_cast<int>(std::floor(bits_longitude(radius_m, latitude_south))) * 2 - 1;
    return std::min({bits_lat, bits_lon_north, bits_lon_south});
}

GeoHashRange query_for_geohash(const GeoHash& geohash, int bits) {
    const std::string& hash = geohash.str();
    const int precision = precision_for_bits(bits);
    if (hash.size() < static_cast<std::size_t>(precision)) {
        return GeoHashRange(hash, hash + k_range_sentinel);
    }
    const std::string hash_base = hash.substr(0, static_cast<std::size_t>(precision) - 1);
    const int last_value = base32::char_to_value(hash[static_cast<std::size_t>(precision) - 1]);
    const int significant_bits = bits - static_cast<int>(hash_base.size()) * base32::k_bits_per_char;
    const int unused_bits = base32::k_bits_per_char - significant_bits;

    const int start_value = (last_value >> unused_bits) << unused_bits;
    const int end_value = start_value + (1 << unused_bits);
    std::string str_start = hash_base + base32::value_to_char(start_value);
    std::string str_end = end_value > base32::k_max_value
        ? hash_base + k_range_sentinel
        : hash_base + base32::value_to_char(end_value);
    return GeoHashRange(std::move(str_start), std::move(str_end));
}

int query_bits(const GeoPoint& center, double radius_m) {
    return std::max(1, bits_for_bounding_box(center, radius_m));
}

int precision_for_bits(int bits) {
    return (bits + base32::k_bits_per_char - 1) / base32::k_bits_per_char;
}

std::vector<GeoPoint> probe_points(const GeoPoint& center, double radius_m) {
    const double latitude_delta = distance_to_latitude_degrees(radius_m);
    const double latitude_north = std::min(90.0, center.latitude_deg + latitude_delta);
    const double latitude_south = std::max(-90.0, center.latitude_deg - latitude_delta);
    const double longitude_delta = std::max(
        distance_to_longitude_degrees(radius_m, latitude_north),
        distance_to_longitude_degrees(radius_m, latitude_south)
    );
    const double longitude_west = wrap_longitude(center.longitude_deg - longitude_delta);
    const double longitude_east = wrap_longitude(center.longitude_deg + longitude_delta);

    return {
        GeoPoint{center.latitude_deg, center.longitude_deg},
        GeoPoint{center.latitude_deg, longitude_east},
        GeoPoint{center.latitude_deg, longitude_west},
        GeoPoint{latitude_north, center.longitude_deg},
        GeoPoint{latitude_north, longitude_east},
        GeoPoint{latitude_north, longitude_west},
        GeoPoint{latitude_south, center.longitude_deg},
        GeoPoint{latitude_south, longitude_east},
        GeoPoint{latitude_south, longitude_west},
    };
}

CoveringSet plan_region(const GeoPoint& center, double radius_m) {
    require_valid_coordinates(center);
    const int bits = query_bits(center, radius_m);
    const int precision = precision_for_bits(bits);

    CoveringSet ranges{};
    for (const GeoPoint& point : probe_points(center, radius_m)) {
        ranges.insert(query_for_geohash(GeoHash(point, precision), bits));
    }
    return join_ranges(std::move(ranges));
}

CoveringSet join_ranges(CoveringSet ranges) {
    while (true) {
        const auto joinable_pair = find_joinable_pair(ranges);
        if (!joinable_pair.has_value()) {
            break;
        }
        const auto [first, second] = joinable_pair.value();
        GeoHashRange joined = first->join_with(*second);
        ranges.erase(second);
        ranges.erase(first);
        ranges.insert(std::move(joined));
    }
    return ranges;
}

bool covering_contains(const CoveringSet& ranges, const GeoHash& hash) noexcept {
    return std::any_of(ranges.begin(), ranges.end(), [&hash](const GeoHashRange& range) {
        return range.contains(hash);
    });
}

}  // namespace planner

}  // namespace geo_query
