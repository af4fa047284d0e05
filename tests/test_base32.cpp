#include <catch2/catch.hpp>

#include "geo_query/base32.hpp"
#include "geo_query/errors.hpp"

using namespace geo_query;

TEST_CASE("base32 maps every value to a symbol and back") {
    for (int value = 0; value <= base32::k_max_value; ++value) {
        REQUIRE(base32::char_to_value(base32::value_to_char(value)) == value);
    }
    REQUIRE(base32::value_to_char(0) == '0');
    REQUIRE(base32::value_to_char(10) == 'b');
    REQUIRE(base32::char_to_value('z') == 31);
}

TEST_CASE("base32 rejects out of range values and foreign symbols") {
    REQUIRE_THROWS_AS(base32::value_to_char(-1), GeoQueryError);
    REQUIRE_THROWS_AS(base32::value_to_char(32), GeoQueryError);

    try {
        (void)base32::char_to_value('a');
        FAIL("expected InvalidChar");
    } catch (const GeoQueryError& exc) {
        REQUIRE(exc.code() == ErrorCode::InvalidChar);
    }

    try {
        (void)base32::value_to_char(99);
        FAIL("expected InvalidValue");
    } catch (const GeoQueryError& exc) {
        REQUIRE(exc.code() == ErrorCode::InvalidValue);
    }
}

TEST_CASE("base32 string validation") {
    REQUIRE(base32::is_valid_string(""));
    REQUIRE(base32::is_valid_string("9q8yywdgue"));
    REQUIRE_FALSE(base32::is_valid_string("9q8yyw dg"));
    REQUIRE_FALSE(base32::is_valid_string("abc"));
    REQUIRE_FALSE(base32::is_valid_string("9Q8"));
    REQUIRE_FALSE(base32::is_valid_string("~"));
}
