#include <tuple>
#include <vector>

#include <catch2/catch.hpp>

#include "geo_query/errors.hpp"
#include "geo_query/geohash_range.hpp"

using namespace geo_query;

namespace {

const GeoPoint k_union_square{37.7853889, -122.4056973};

void require_pairwise_unjoinable(const CoveringSet& ranges) {
    for (auto first = ranges.begin(); first != ranges.end(); ++first) {
        for (auto second = std::next(first); second != ranges.end(); ++second) {
            INFO(first->to_string() << " vs " << second->to_string());
            REQUIRE_FALSE(first->can_join_with(*second));
        }
    }
}

}  // namespace

TEST_CASE("adjacent ranges join into their union") {
    const GeoHashRange first("abc", "abd");
    const GeoHashRange second("abd", "abe");
    REQUIRE(first.can_join_with(second));
    REQUIRE(first.join_with(second) == GeoHashRange("abc", "abe"));
    REQUIRE(second.join_with(first) == GeoHashRange("abc", "abe"));
}

TEST_CASE("a super range absorbs the range it contains") {
    const GeoHashRange inner("abc", "abd");
    const GeoHashRange outer("ab", "ab~");
    REQUIRE(inner.can_join_with(outer));
    REQUIRE(inner.join_with(outer) == outer);
    REQUIRE(outer.join_with(inner) == outer);
}

TEST_CASE("disjoint ranges cannot be joined") {
    const GeoHashRange first("abc", "abd");
    const GeoHashRange second("abf", "abg");
    REQUIRE_FALSE(first.can_join_with(second));
    REQUIRE_THROWS_AS(first.join_with(second), UnjoinableRangesError);
}

TEST_CASE("range containment is half open") {
    const GeoHashRange range("9q8yyh", "9q8yy~");
    REQUIRE(range.contains(GeoHash::parse("9q8yyh")));
    REQUIRE(range.contains(GeoHash::parse("9q8yywdgue")));
    REQUIRE(range.contains(GeoHash::parse("9q8yyzzzzz")));
    REQUIRE_FALSE(range.contains(GeoHash::parse("9q8yygzzzz")));
    REQUIRE_FALSE(range.contains(GeoHash::parse("9q8z")));

    const GeoHashRange bounded("9q8yyw", "9q8yyx");
    REQUIRE_FALSE(bounded.contains(GeoHash::parse("9q8yyx")));
    REQUIRE(bounded.contains(GeoHash::parse("9q8yyw")));
}

TEST_CASE("bit precision follows the weaker axis") {
    REQUIRE(planner::bits_latitude(1000.0) == Approx(14.288).epsilon(1e-3));
    REQUIRE(planner::bits_longitude(1000.0, 0.0) == Approx(15.2904).epsilon(1e-3));
    REQUIRE(planner::bits_longitude(1000.0, 90.0) == Approx(1.0));
    REQUIRE(planner::bits_latitude(1e-30) == Approx(GeoHash::k_max_precision_bits));

    REQUIRE(planner::bits_for_bounding_box(k_union_square, 1000.0) == 27);
    REQUIRE(planner::bits_for_bounding_box(GeoPoint{0.0, 0.0}, 1000.0) == 28);
    REQUIRE(planner::bits_for_bounding_box(GeoPoint{90.0, 0.0}, 1000.0) == 1);
    REQUIRE(planner::precision_for_bits(27) == 6);
    REQUIRE(planner::precision_for_bits(25) == 5);
    REQUIRE(planner::precision_for_bits(1) == 1);
}

TEST_CASE("query_for_geohash masks the unused bits of the last symbol") {
    const GeoHash center(k_union_square);
    REQUIRE(planner::query_for_geohash(center, 27) == GeoHashRange("9q8yys", "9q8yy~"));
    REQUIRE(planner::query_for_geohash(center, 25) == GeoHashRange("9q8yy", "9q8yz"));
    REQUIRE(planner::query_for_geohash(center, 26) == GeoHashRange("9q8yyh", "9q8yy~"));
    REQUIRE(planner::query_for_geohash(center, 30) == GeoHashRange("9q8yyw", "9q8yyx"));
    REQUIRE(planner::query_for_geohash(center, 1) == GeoHashRange("0", "h"));
}

TEST_CASE("query_for_geohash opens a short hash above its prefix") {
    REQUIRE(planner::query_for_geohash(GeoHash::parse("9q8yy"), 27) == GeoHashRange("9q8yy", "9q8yy~"));
}

TEST_CASE("plan_region produces the merged covering set") {
    const CoveringSet ranges = planner::plan_region(k_union_square, 1000.0);
    const CoveringSet expected{GeoHashRange("9q8yyh", "9q8yy~"), GeoHashRange("9q8zn0", "9q8znh")};
    REQUIRE(ranges == expected);
}

TEST_CASE("plan_region covers every probe point exactly once") {
    const std::vector<std::tuple<GeoPoint, double>> list_cases{
        {k_union_square, 1000.0},
        {k_union_square, 1.0},
        {GeoPoint{0.0, 0.0}, 1.0},
        {GeoPoint{10.0, 10.0}, 1.0},
        {GeoPoint{51.5, -0.12}, 5000.0},
        {GeoPoint{0.0, 179.99}, 10'000.0},
        {GeoPoint{-33.8688, 151.2093}, 250'000.0},
        {GeoPoint{89.9, 0.0}, 10'000.0},
        {GeoPoint{-60.0, -179.5}, 80'000.0},
    };

    for (const auto& [center, radius_m] : list_cases) {
        INFO("center " << center.latitude_deg << "," << center.longitude_deg << " radius " << radius_m);
        const CoveringSet ranges = planner::plan_region(center, radius_m);
        REQUIRE_FALSE(ranges.empty());
        require_pairwise_unjoinable(ranges);

        const int precision = planner::precision_for_bits(planner::query_bits(center, radius_m));
        for (const GeoPoint& point : planner::probe_points(center, radius_m)) {
            const GeoHash hash(point, precision);
            std::size_t containing = 0;
            for (const GeoHashRange& range : ranges) {
                if (range.contains(hash)) {
                    ++containing;
                }
            }
            REQUIRE(containing == 1);
        }
    }
}

TEST_CASE("plan_region collapses to one range for a tiny radius") {
    const CoveringSet ranges = planner::plan_region(k_union_square, 1.0);
    REQUIRE(ranges.size() == 1);
    REQUIRE(*ranges.begin() == GeoHashRange("9q8yywdgu0", "9q8yywdgu~"));
}

TEST_CASE("plan_region splits across the antimeridian") {
    const CoveringSet ranges = planner::plan_region(GeoPoint{0.0, 179.99}, 10'000.0);
    const CoveringSet expected{
        GeoHashRange("2pbp", "2pbq"),
        GeoHashRange("8000", "8001"),
        GeoHashRange("rzzz", "rzz~"),
        GeoHashRange("xbpb", "xbpc"),
    };
    REQUIRE(ranges == expected);
}

TEST_CASE("join_ranges merges chains and duplicates") {
    CoveringSet ranges{
        GeoHashRange("ab0", "ab4"),
        GeoHashRange("ab4", "ab8"),
        GeoHashRange("ab8", "abd"),
        GeoHashRange("ab1", "ab2"),
        GeoHashRange("zz", "zz~"),
    };
    const CoveringSet joined = planner::join_ranges(ranges);
    const CoveringSet expected{GeoHashRange("ab0", "abd"), GeoHashRange("zz", "zz~")};
    REQUIRE(joined == expected);
}

TEST_CASE("plan_region rejects an invalid center") {
    REQUIRE_THROWS_AS(planner::plan_region(GeoPoint{95.0, 0.0}, 10.0), GeoQueryError);
}
