#include "geo_query/base32.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "geo_query/errors.hpp"

namespace geo_query::base32 {

char value_to_char(int value) {
    if (value < 0 || value > k_max_value) {
        throw GeoQueryError(ErrorCode::InvalidValue, fmt::format("Not a valid base32 value: {}", value));
    }
    return k_alphabet[static_cast<std::size_t>(value)];
}

int char_to_value(char symbol) {
    const std::size_t position = k_alphabet.find(symbol);
    if (position == std::string_view::npos) {
        throw GeoQueryError(ErrorCode::InvalidChar, fmt::format("Not a valid base32 char: '{}'", symbol));
    }
    return static_cast<int>(position);
}

bool is_valid_string(std::string_view str) noexcept {
    return std::all_of(str.begin(), str.end(), [](char symbol) {
        return k_alphabet.find(symbol) != std::string_view::npos;
    });
}

}  // namespace geo_query::base32
