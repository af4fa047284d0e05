#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"
#include "geo_query/in_memory_store.hpp"
#include "geo_query/location_store.hpp"
#include "logging_test_fixture.hpp"
#include "query_test_support.hpp"

using namespace geo_query;
using geo_query::test::RecordingSink;

namespace {

[[maybe_unused]] const bool logger_initialized = []() {
    geo_query::test::ensure_logger_initialized();
    return true;
}();

using Summary = std::vector<std::pair<QueryEventKind, std::string>>;

const GeoPoint k_center{37.7853889, -122.4056973};
const GeoPoint k_out_north{37.7988889, -122.4056973};
const GeoPoint k_in_north{37.7863889, -122.4056973};
const GeoPoint k_in_south{37.7843889, -122.4056973};
const GeoPoint k_out_east{37.7853889, -122.3856973};

}  // namespace

TEST_CASE("set_location writes both index fields together") {
    InMemoryDocumentStore document_store;
    LocationStore store(document_store, document_store);

    store.set_location("tracker-1", k_in_north);
    const auto document = document_store.get("tracker-1");
    REQUIRE(document.has_value());
    REQUIRE(std::get<std::string>(document->fields.at(std::string{k_geohash_field})) == GeoHash(k_in_north).str());
    REQUIRE(std::get<GeoPoint>(document->fields.at(std::string{k_location_field})) == k_in_north);
    REQUIRE(store.get_location("tracker-1") == std::optional<GeoPoint>{k_in_north});
}

TEST_CASE("set_location keeps unrelated fields") {
    InMemoryDocumentStore document_store;
    FieldMap fields{};
    fields.emplace("label", std::string{"courier"});
    document_store.set("tracker-1", fields, false);

    LocationStore store(document_store, document_store, 6);
    store.set_location("tracker-1", k_in_north);
    const auto document = document_store.get("tracker-1");
    REQUIRE(document->fields.size() == 3);
    REQUIRE(std::get<std::string>(document->fields.at(std::string{k_geohash_field})).size() == 6);

    store.remove_location("tracker-1");
    REQUIRE_FALSE(store.get_location("tracker-1").has_value());
    REQUIRE(document_store.get("tracker-1")->fields.size() == 1);
}

TEST_CASE("location store validates its inputs") {
    InMemoryDocumentStore document_store;
    REQUIRE_THROWS_AS(LocationStore(document_store, document_store, 0), GeoQueryError);
    REQUIRE_THROWS_AS(LocationStore(document_store, document_store, 23), GeoQueryError);

    LocationStore store(document_store, document_store);
    REQUIRE(store.geohash_precision() == GeoHash::k_default_precision);
    REQUIRE_THROWS_AS(store.set_location("", k_center), GeoQueryError);
    REQUIRE_THROWS_AS(store.set_location("a", GeoPoint{91.0, 0.0}), GeoQueryError);
    REQUIRE_FALSE(store.get_location("missing").has_value());

    const LiveQueryPtr query = store.query_at_location(k_center, 20'000'000.0);
    REQUIRE(query->radius_m() == earth::k_max_supported_radius_m);
}

TEST_CASE("store writes drive live query events end to end") {
    InMemoryDocumentStore document_store;
    LocationStore store(document_store, document_store);
    store.set_location("walker", k_out_north);
    store.set_location("resident", k_in_north);
    store.set_location("stranger", k_out_east);

    const LiveQueryPtr query = store.query_at_location(k_center, 1000.0);
    auto sink = std::make_shared<RecordingSink>();
    (void)query->add_sink(sink);
    REQUIRE(document_store.dispatch_pending() == 2);
    REQUIRE(sink->count(QueryEventKind::Entered) == 1);
    REQUIRE(sink->count(QueryEventKind::Ready) == 1);
    REQUIRE(query->state() == QueryState::Ready);
    REQUIRE(query->cached_location_count() == 2);
    sink->clear();

    store.set_location("walker", k_in_south);
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Entered, "walker"}});
    sink->clear();

    store.set_location("resident", k_in_south);
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Moved, "resident"}, {QueryEventKind::Changed, "resident"}});
    sink->clear();

    store.set_location("resident", k_out_east);
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Exited, "resident"}});
    REQUIRE_FALSE(query->location_info("resident").has_value());
    sink->clear();

    store.remove_location("walker");
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Exited, "walker"}});
    REQUIRE(query->cached_location_count() == 0);
    sink->clear();

    query->dispose();
    REQUIRE(document_store.subscription_count() == 0);
    store.set_location("walker", k_in_north);
    REQUIRE(document_store.dispatch_pending() == 0);
    REQUIRE(sink->events().empty());
}

TEST_CASE("re-centering over the store replays the new ranges") {
    InMemoryDocumentStore document_store;
    LocationStore store(document_store, document_store);
    store.set_location("a", k_in_north);

    const LiveQueryPtr query = store.query_at_location(GeoPoint{37.8303889, -122.4056973}, 1000.0);
    auto sink = std::make_shared<RecordingSink>();
    (void)query->add_sink(sink);
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Ready, ""}});
    sink->clear();

    query->set_region(k_center, 1000.0);
    REQUIRE(document_store.subscription_count() == 2);
    document_store.dispatch_pending();
    REQUIRE(sink->summary() == Summary{{QueryEventKind::Entered, "a"}, {QueryEventKind::Ready, ""}});
}

TEST_CASE("concurrent writes, deliveries, and re-centers leave a consistent cache") {
    constexpr int k_key_count = 6;
    constexpr int k_write_rounds = 300;
    constexpr int k_recenter_rounds = 60;
    const GeoPoint shifted_center = offset_coordinate(k_center, 45.0, 600.0);

    InMemoryDocumentStore document_store;
    LocationStore store(document_store, document_store);
    const LiveQueryPtr query = store.query_at_location(k_center, 1000.0);
    auto sink = std::make_shared<RecordingSink>();
    (void)query->add_sink(sink);

    std::atomic<bool> flag_writing{true};
    std::thread dispatcher([&document_store, &flag_writing]() {
        while (flag_writing.load()) {
            document_store.dispatch_pending();
            std::this_thread::yield();
        }
    });
    std::thread writer([&store]() {
        for (int round = 0; round < k_write_rounds; ++round) {
            for (int index = 0; index < k_key_count; ++index) {
                const double bearing_deg = static_cast<double>((index * 37 + round * 53) % 360);
                const double distance = static_cast<double>((index * 211 + round * 97) % 2000);
                store.set_location("key-" + std::to_string(index), offset_coordinate(k_center, bearing_deg, distance));
            }
        }
    });
    std::thread recenterer([&query, &shifted_center]() {
        for (int round = 0; round < k_recenter_rounds; ++round) {
            if (round % 2 == 0) {
                query->set_region(shifted_center, 1500.0);
            } else {
                query->set_region(k_center, 1000.0);
            }
        }
    });

    writer.join();
    recenterer.join();
    flag_writing.store(false);
    dispatcher.join();
    while (document_store.dispatch_pending() > 0) {
    }

    REQUIRE(sink->count(QueryEventKind::Error) == 0);
    REQUIRE(query->center() == k_center);
    REQUIRE(query->state() == QueryState::Ready);
    const CoveringSet ranges = query->covering_set();
    for (int index = 0; index < k_key_count; ++index) {
        const std::string key = "key-" + std::to_string(index);
        INFO(key);
        const auto info = query->location_info(key);
        if (info.has_value()) {
            REQUIRE(planner::covering_contains(ranges, info->geohash));
            REQUIRE(info->in_query == (distance_m(info->location, k_center) <= 1000.0));
        }
    }
}
