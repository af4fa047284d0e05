// === Document Store Interfaces ===============================================
//
// Collaborators the library consumes but does not implement for production:
// a key/value document store used by LocationStore, and a range subscription
// provider used by LiveQuery. Both are injected at construction.
//
// Indexed documents carry two fields written and removed together:
//   `g`  geohash string at the store's precision (ordered range key)
//   `l`  exact coordinate as a GeoPoint

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "geo_query/types.hpp"

namespace geo_query {

inline constexpr std::string_view k_geohash_field{"g"};
inline constexpr std::string_view k_location_field{"l"};

using FieldValue = std::variant<std::string, double, std::int64_t, bool, GeoPoint>;
using FieldMap = std::map<std::string, FieldValue, std::less<>>;

/** @brief Snapshot of a stored record. */
struct Document final {
    std::string key{};   /**< Document identifier within the collection. */
    FieldMap fields{};   /**< Field values; empty for records reported without data. */
};

/**
 * @brief Extract and validate the coordinate field of @p document.
 *
 * @throws GeoQueryError MissingLocationField when `l` is absent or not a point,
 *         InvalidCoordinate when the stored point is out of range.
 */
[[nodiscard]] GeoPoint location_value(const Document& document);

/** @brief Whether @p document carries a coordinate field. */
[[nodiscard]] bool has_location(const Document& document) noexcept;

/** @brief Minimal document store contract. */
class DocumentStore {
  public:
    virtual ~DocumentStore() = default;

    /** @brief Current document for @p key, empty when not found. */
    [[nodiscard]] virtual std::optional<Document> get(const std::string& key) = 0;
    /** @brief Write @p fields atomically; merge into existing fields when @p merge is set. */
    virtual void set(const std::string& key, const FieldMap& fields, bool merge) = 0;
    /** @brief Delete @p field_deletions from an existing document atomically. */
    virtual void update(const std::string& key, const std::vector<std::string>& field_deletions) = 0;
    /** @brief Delete the document for @p key. */
    virtual void remove(const std::string& key) = 0;
};

enum class ChangeKind {
    Added,
    Modified,
    Removed
};

/** @brief One change reported by a range subscription. */
struct DocumentChange final {
    ChangeKind kind{ChangeKind::Added};
    Document document{};  /**< Latest known data; fields may be empty for Removed. */
};

/** @brief Delivery for a single subscription: a batch of changes or an error. */
struct SubscriptionResult final {
    std::vector<DocumentChange> changes{};
    std::optional<std::string> error{};
};

using SubscriptionHandle = std::uint64_t;
using SubscriptionCallback = std::function<void(const SubscriptionResult&)>;

/**
 * @brief Delivers changes for documents whose geohash field lies in [start, end).
 *
 * Results may arrive on any thread, concurrently across handles. Within one
 * handle, batches and the changes inside each batch keep store order. The
 * callback must not be invoked from inside subscribe() on the calling thread,
 * and subscribe() must not wait for in-flight callbacks. cancel() may wait for
 * callbacks of the cancelled handle to drain.
 */
class RangeSubscriptionProvider {
  public:
    virtual ~RangeSubscriptionProvider() = default;

    [[nodiscard]] virtual SubscriptionHandle subscribe(
        const std::string& start_key,
        const std::string& end_key,
        SubscriptionCallback callback
    ) = 0;
    /** @brief Stop further deliveries for @p handle; unknown handles are ignored. */
    virtual void cancel(SubscriptionHandle handle) = 0;
};

}  // namespace geo_query
