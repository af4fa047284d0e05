// === Location Store ==========================================================
//
// Thin facade that persists key locations through an injected DocumentStore
// and creates live queries over an injected RangeSubscriptionProvider. Every
// write sets or clears the geohash and coordinate fields together.

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "geo_query/document_store.hpp"
#include "geo_query/geohash.hpp"
#include "geo_query/live_query.hpp"
#include "geo_query/logging.hpp"
#include "geo_query/types.hpp"

namespace geo_query {

class LocationStore final {
  public:
    /**
     * @param document_store Store holding one document per key.
     * @param subscription_provider Range subscriptions over the geohash field.
     * @param geohash_precision Precision of the persisted geohash field.
     * @throws GeoQueryError InvalidPrecision when the precision is outside [1, 22].
     */
    LocationStore(
        DocumentStore& document_store,
        RangeSubscriptionProvider& subscription_provider,
        int geohash_precision = GeoHash::k_default_precision
    );

    /** @brief Persist @p location for @p key, merging into any existing document. */
    void set_location(const std::string& key, const GeoPoint& location);
    /** @brief Delete the location fields of @p key; other fields are kept. */
    void remove_location(const std::string& key);
    /** @brief Stored location of @p key, empty when the key has none. */
    [[nodiscard]] std::optional<GeoPoint> get_location(const std::string& key);

    /** @brief New live query for the circle; the radius is capped to the supported maximum. */
    [[nodiscard]] LiveQueryPtr query_at_location(const GeoPoint& center, double radius_m);

    [[nodiscard]] int geohash_precision() const noexcept;

  private:
    DocumentStore& document_store_;
    RangeSubscriptionProvider& subscription_provider_;
    int geohash_precision_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_query
