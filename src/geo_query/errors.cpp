#include "geo_query/errors.hpp"

namespace geo_query {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidCoordinate:
            return "invalid_coordinate";
        case ErrorCode::InvalidPrecision:
            return "invalid_precision";
        case ErrorCode::InvalidGeohash:
            return "invalid_geohash";
        case ErrorCode::InvalidChar:
            return "invalid_char";
        case ErrorCode::InvalidValue:
            return "invalid_value";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::MissingLocationField:
            return "missing_location_field";
        case ErrorCode::SubscriptionError:
            return "subscription_error";
    }
    return "unknown";
}

GeoQueryError::GeoQueryError(ErrorCode code, const std::string& message)
    : std::runtime_error(message),
      code_(code) {}

ErrorCode GeoQueryError::code() const noexcept {
    return code_;
}

}  // namespace geo_query
