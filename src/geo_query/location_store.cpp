#include "geo_query/location_store.hpp"

#include <fmt/format.h>

#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"

namespace geo_query {

namespace {

void require_key(const std::string& key) {
    if (key.empty()) {
        throw GeoQueryError(ErrorCode::InvalidArgument, "Location key cannot be empty");
    }
}

}  // namespace

LocationStore::LocationStore(
    DocumentStore& document_store,
    RangeSubscriptionProvider& subscription_provider,
    int geohash_precision
)
    : document_store_(document_store),
      subscription_provider_(subscription_provider),
      geohash_precision_(geohash_precision),
      logger_(get_logger()) {
    if (geohash_precision_ < 1 || geohash_precision_ > GeoHash::k_max_precision) {
        throw GeoQueryError(
            ErrorCode::InvalidPrecision,
            fmt::format("Stored geohash precision must be in [1, {}], got {}", GeoHash::k_max_precision, geohash_precision_)
        );
    }
}

void LocationStore::set_location(const std::string& key, const GeoPoint& location) {
    require_key(key);
    const GeoHash geohash(location, geohash_precision_);

    FieldMap fields{};
    fields.emplace(std::string{k_geohash_field}, geohash.str());
    fields.emplace(std::string{k_location_field}, location);
    document_store_.set(key, fields, true);
    logger_->debug("Stored location for {} at {}", key, geohash.str());
}

void LocationStore::remove_location(const std::string& key) {
    require_key(key);
    document_store_.update(key, {std::string{k_geohash_field}, std::string{k_location_field}});
    logger_->debug("Removed location for {}", key);
}

std::optional<GeoPoint> LocationStore::get_location(const std::string& key) {
    require_key(key);
    const std::optional<Document> document = document_store_.get(key);
    if (!document.has_value() || !has_location(document.value())) {
        return std::nullopt;
    }
    return location_value(document.value());
}

LiveQueryPtr LocationStore::query_at_location(const GeoPoint& center, double radius_m) {
    return LiveQuery::create(subscription_provider_, center, cap_radius(radius_m));
}

int LocationStore::geohash_precision() const noexcept {
    return geohash_precision_;
}

}  // namespace geo_query
