// === Base32 Codec ============================================================
//
// Maps 5-bit values onto the geohash alphabet and back. The alphabet omits
// `a`, `i`, `l`, and `o`, and its ordering matches the numeric order of the
// values so that lexicographic string order follows geohash bit order.

#pragma once

#include <string_view>

namespace geo_query::base32 {

inline constexpr int k_bits_per_char{5};
inline constexpr std::string_view k_alphabet{"0123456789bcdefghjkmnpqrstuvwxyz"};
inline constexpr int k_max_value{static_cast<int>(k_alphabet.size()) - 1};

/** @brief Symbol for @p value; throws GeoQueryError(InvalidValue) outside [0, 31]. */
[[nodiscard]] char value_to_char(int value);

/** @brief Value of @p symbol; throws GeoQueryError(InvalidChar) for foreign symbols. */
[[nodiscard]] int char_to_value(char symbol);

/** @brief True when every character of @p str is in the alphabet. */
[[nodiscard]] bool is_valid_string(std::string_view str) noexcept;

}  // namespace geo_query::base32
