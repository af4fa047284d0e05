// === GeoHash Range Planner ===================================================
//
// Turns a circle (center + radius) into the smallest set of half-open
// lexicographic ranges [start, end) over geohash strings whose union covers
// every point of the circle. The planner picks a bit precision from the
// weakest axis of the circle's bounding box, encodes nine probe points (center,
// cardinal, diagonal), converts each to the range of its masked cell, and
// greedily merges adjacent or nested ranges until no pair can be joined.
//
// The sentinel `~` sorts after every base32 symbol and marks a range that is
// open above its prefix.

#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "geo_query/geohash.hpp"
#include "geo_query/types.hpp"

namespace geo_query {

inline constexpr char k_range_sentinel{'~'};

/** @brief Half-open lexicographic interval [start, end) over geohash strings. */
class GeoHashRange final {
  public:
    GeoHashRange(std::string start_value, std::string end_value);

    [[nodiscard]] const std::string& start_value() const noexcept;
    [[nodiscard]] const std::string& end_value() const noexcept;

    /** @brief True when the two ranges touch, overlap, or nest. */
    [[nodiscard]] bool can_join_with(const GeoHashRange& other) const noexcept;
    /**
     * @brief Union of two joinable ranges.
     *
     * @throws UnjoinableRangesError if can_join_with(other) is false.
     */
    [[nodiscard]] GeoHashRange join_with(const GeoHashRange& other) const;

    [[nodiscard]] bool contains(const GeoHash& hash) const noexcept;
    [[nodiscard]] bool contains(std::string_view hash) const noexcept;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const GeoHashRange& lhs, const GeoHashRange& rhs) noexcept {
        return lhs.str_start_ == rhs.str_start_ && lhs.str_end_ == rhs.str_end_;
    }
    friend bool operator<(const GeoHashRange& lhs, const GeoHashRange& rhs) noexcept {
        if (lhs.str_start_ != rhs.str_start_) {
            return lhs.str_start_ < rhs.str_start_;
        }
        return lhs.str_end_ < rhs.str_end_;
    }

  private:
    /** @brief @p other starts before this range and reaches at least its start. */
    [[nodiscard]] bool is_prefix(const GeoHashRange& other) const noexcept;
    /** @brief @p other fully contains this range. */
    [[nodiscard]] bool is_super_query(const GeoHashRange& other) const noexcept;

    std::string str_start_;
    std::string str_end_;
};

/** @brief Pairwise non-joinable ranges covering one query circle. */
using CoveringSet = std::set<GeoHashRange>;

namespace planner {

/** @brief Bits of latitude needed to resolve @p resolution_m, capped at the max hash bits. */
[[nodiscard]] double bits_latitude(double resolution_m);

/** @brief Bits of longitude needed to resolve @p resolution_m at @p latitude_deg (at least 1). */
[[nodiscard]] double bits_longitude(double resolution_m, double latitude_deg);

/** @brief Interleaved bits that fit a box of half-size @p radius_m around @p center. */
[[nodiscard]] int bits_for_bounding_box(const GeoPoint& center, double radius_m);

/** @brief Range of all hashes sharing the first @p bits bits of @p geohash. */
[[nodiscard]] GeoHashRange query_for_geohash(const GeoHash& geohash, int bits);

/** @brief Bits used for a query of @p radius_m around @p center (at least 1). */
[[nodiscard]] int query_bits(const GeoPoint& center, double radius_m);

/** @brief Geohash precision in symbols for @p bits, rounded up. */
[[nodiscard]] int precision_for_bits(int bits);

/** @brief Nine probe points (center, cardinal, diagonal) of the circle, wrapped and clamped. */
[[nodiscard]] std::vector<GeoPoint> probe_points(const GeoPoint& center, double radius_m);

/**
 * @brief Minimal covering set for the circle around @p center with @p radius_m.
 *
 * @throws GeoQueryError InvalidCoordinate when @p center is out of range.
 */
[[nodiscard]] CoveringSet plan_region(const GeoPoint& center, double radius_m);

/** @brief Merge joinable ranges of @p ranges until none remain. */
[[nodiscard]] CoveringSet join_ranges(CoveringSet ranges);

/** @brief True if any range of @p ranges contains @p hash. */
[[nodiscard]] bool covering_contains(const CoveringSet& ranges, const GeoHash& hash) noexcept;

}  // namespace planner

}  // namespace geo_query
