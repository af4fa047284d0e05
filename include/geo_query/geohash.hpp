// === GeoHash =================================================================
//
// Immutable geohash value. Encoding interleaves longitude (even bits) and
// latitude (odd bits) bisections and packs every five bits into one base32
// symbol, so geohashes that share a prefix share a cell. A hash built from a
// coordinate remembers that coordinate; a parsed hash carries none.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "geo_query/base32.hpp"
#include "geo_query/types.hpp"

namespace geo_query {

class GeoHash final {
  public:
    static constexpr int k_default_precision{10};
    static constexpr int k_max_precision{22};
    static constexpr int k_max_precision_bits{k_max_precision * base32::k_bits_per_char};

    /**
     * @brief Encode @p location with @p precision symbols.
     *
     * @throws GeoQueryError InvalidPrecision when precision is outside [1, 22],
     *         InvalidCoordinate when the location is out of range.
     */
    explicit GeoHash(const GeoPoint& location, int precision = k_default_precision);
    GeoHash(double latitude_deg, double longitude_deg, int precision = k_default_precision);

    /** @brief Wrap an existing hash string; throws GeoQueryError(InvalidGeohash) if malformed. */
    [[nodiscard]] static GeoHash parse(std::string hash);

    [[nodiscard]] const std::string& str() const noexcept;
    /** @brief Coordinate the hash was encoded from, empty for parsed hashes. */
    [[nodiscard]] const std::optional<GeoPoint>& location() const noexcept;
    [[nodiscard]] std::size_t precision() const noexcept;

    friend bool operator==(const GeoHash& lhs, const GeoHash& rhs) noexcept {
        return lhs.str_hash_ == rhs.str_hash_;
    }
    friend bool operator<(const GeoHash& lhs, const GeoHash& rhs) noexcept {
        return lhs.str_hash_ < rhs.str_hash_;
    }

  private:
    explicit GeoHash(std::string hash);

    std::string str_hash_;
    std::optional<GeoPoint> location_;
};

}  // namespace geo_query
