// === Errors ==================================================================
//
// Exception types raised by the encoder, planner, store facade, and live query.
// Precondition failures surface as GeoQueryError with a distinguishing code;
// planner invariant breaks are programmer errors and use std::logic_error.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace geo_query {

/** @brief Distinguishes the recoverable failure categories. */
enum class ErrorCode {
    InvalidCoordinate,     /**< Latitude/longitude outside the valid range. */
    InvalidPrecision,      /**< Geohash precision outside [1, 22]. */
    InvalidGeohash,        /**< Empty string or string with illegal symbols. */
    InvalidChar,           /**< Character not part of the base32 alphabet. */
    InvalidValue,          /**< Integer outside [0, 31] passed to the codec. */
    InvalidArgument,       /**< Any other rejected argument (empty key, bad radius). */
    MissingLocationField,  /**< Document without the coordinate field. */
    SubscriptionError      /**< Failure reported by the range subscription provider. */
};

/** @brief Stable, lowercase name of @p code used in log records. */
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/** @brief Exception carrying an ErrorCode alongside the message. */
class GeoQueryError : public std::runtime_error {
  public:
    GeoQueryError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept;

  private:
    ErrorCode code_;
};

/** @brief Raised when two ranges that cannot be merged are joined. */
class UnjoinableRangesError final : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

}  // namespace geo_query
