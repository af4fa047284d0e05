#include "geo_query/document_store.hpp"

#include <fmt/format.h>

#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"

namespace geo_query {

GeoPoint location_value(const Document& document) {
    const auto iterator_field = document.fields.find(k_location_field);
    if (iterator_field == document.fields.end()) {
        throw GeoQueryError(
            ErrorCode::MissingLocationField,
            fmt::format("Document {} has no location field", document.key)
        );
    }
    const auto* point = std::get_if<GeoPoint>(&iterator_field->second);
    if (point == nullptr) {
        throw GeoQueryError(
            ErrorCode::MissingLocationField,
            fmt::format("Location field of document {} is not a point", document.key)
        );
    }
    if (!coordinates_valid(*point)) {
        throw GeoQueryError(
            ErrorCode::InvalidCoordinate,
            fmt::format("Check {}. Point [lat: {}, lon: {}] is invalid", document.key, point->latitude_deg, point->longitude_deg)
        );
    }
    return *point;
}

bool has_location(const Document& document) noexcept {
    const auto iterator_field = document.fields.find(k_location_field);
    return iterator_field != document.fields.end() && std::holds_alternative<GeoPoint>(iterator_field->second);
}

}  // namespace geo_query
