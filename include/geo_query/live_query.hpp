// === Live Query ==============================================================
//
// Keeps one circular region's result set live. The query plans a covering set
// of geohash ranges for the circle, holds one subscription per range, caches
// the last known location of every key those ranges report, and turns the raw
// add/modify/remove notifications into per-key Entered, Exited, Moved, and
// Changed events plus Error and an edge-triggered Ready.
//
// Lifecycle: Idle -> Planning -> Subscribed -> Ready. Planning starts when the
// first sink is registered and re-runs on every set_region() while sinks are
// registered. Removing the last sink or calling dispose() returns to Idle.
//
// Threading: one mutex guards all state. Public calls and subscription
// callbacks take it for their whole critical section and sinks run inside it.
// subscribe() runs under the lock; cancel() runs after it is released, so a
// provider may wait for in-flight callbacks inside cancel(). Callbacks hold
// only a weak reference and a per-subscription generation, so late deliveries
// for cancelled ranges or a destroyed query are dropped.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "geo_query/document_store.hpp"
#include "geo_query/geohash.hpp"
#include "geo_query/geohash_range.hpp"
#include "geo_query/logging.hpp"
#include "geo_query/query_events.hpp"
#include "geo_query/types.hpp"

namespace geo_query {

enum class QueryState {
    Idle,        /**< No ranges planned; no subscriptions held. */
    Planning,    /**< Covering set being recomputed. */
    Subscribed,  /**< At least one subscription has not delivered yet. */
    Ready        /**< Every subscription has delivered its first result. */
};

[[nodiscard]] std::string_view to_string(QueryState state) noexcept;

/** @brief Cached view of one key reported by the subscriptions. */
struct LocationInfo final {
    GeoPoint location{};      /**< Last observed coordinate. */
    GeoHash geohash;          /**< Full-precision hash of location. */
    bool in_query{};          /**< True-circle membership at the last evaluation. */
    Document document{};      /**< Last delivered document. */
};

using ListenerId = std::uint64_t;

class LiveQuery final : public std::enable_shared_from_this<LiveQuery> {
    struct PrivateTag final {
        explicit PrivateTag() = default;
    };

  public:
    /**
     * @brief Create a query for the circle around @p center.
     *
     * @param provider Range subscription provider; must outlive the query.
     * @param center Circle center.
     * @param radius_m Radius in metres, clamped to the supported maximum.
     * @throws GeoQueryError InvalidCoordinate or InvalidArgument for bad input.
     */
    [[nodiscard]] static std::shared_ptr<LiveQuery> create(
        RangeSubscriptionProvider& provider,
        const GeoPoint& center,
        double radius_m
    );

    LiveQuery(PrivateTag, RangeSubscriptionProvider& provider, const GeoPoint& center, double radius_m);
    ~LiveQuery();

    LiveQuery(const LiveQuery&) = delete;
    LiveQuery& operator=(const LiveQuery&) = delete;

    /** @brief Move/resize the circle and re-plan when sinks are registered. */
    void set_region(const GeoPoint& center, double radius_m);

    /**
     * @brief Register @p sink for the kinds in @p kinds.
     *
     * The first registration plans the query. A sink added to an already
     * planned query immediately receives Entered for every key inside the
     * circle, then Ready if the query is quiescent.
     */
    ListenerId add_sink(QueryEventSinkPtr sink, EventKindMask kinds = k_all_event_kinds);
    /** @brief Register @p callback for a single event kind. */
    ListenerId add_listener(QueryEventKind kind, CallbackSink::Callback callback);
    /** @brief Unregister a sink; removing the last one resets the query. */
    void remove_listener(ListenerId listener_id);

    /** @brief Cancel every subscription and drop all cached state. Idempotent. */
    void dispose();

    [[nodiscard]] GeoPoint center() const;
    [[nodiscard]] double radius_m() const;
    [[nodiscard]] QueryState state() const;
    [[nodiscard]] CoveringSet covering_set() const;
    [[nodiscard]] std::size_t subscription_count() const;
    [[nodiscard]] std::size_t outstanding_count() const;
    [[nodiscard]] std::size_t listener_count() const;
    [[nodiscard]] std::optional<LocationInfo> location_info(const std::string& key) const;
    [[nodiscard]] std::size_t cached_location_count() const;

  private:
    struct Subscription final {
        SubscriptionHandle handle{};
        std::uint64_t generation{};
        bool outstanding{true};
    };

    struct Listener final {
        QueryEventSinkPtr sink{};
        EventKindMask kinds{};
    };

    /** @brief Entry point for provider deliveries. */
    void handle_result(const GeoHashRange& range, std::uint64_t generation, const SubscriptionResult& result);

    /** @brief Re-plan and diff subscriptions; stale handles are appended to @p list_cancelled. */
    void setup_queries_locked(std::vector<SubscriptionHandle>& list_cancelled);
    void reset_locked(std::vector<SubscriptionHandle>& list_cancelled);
    /** @brief Cancel @p list_cancelled with the lock released. */
    void cancel_subscriptions(const std::vector<SubscriptionHandle>& list_cancelled);
    void child_changed_locked(const Document& document);
    void child_removed_locked(const Document& document);
    void update_location_info_locked(const Document& document, const GeoPoint& location);
    void reevaluate_membership_locked();
    void check_and_fire_ready_locked();
    void refresh_state_locked();
    [[nodiscard]] bool location_is_in_query_locked(const GeoPoint& location) const;
    [[nodiscard]] bool has_outstanding_locked() const;
    void emit_locked(const QueryEvent& event);
    void emit_to_locked(const Listener& listener, const QueryEvent& event);

    RangeSubscriptionProvider& provider_;
    mutable std::mutex mutex_;
    GeoPoint center_;
    double radius_m_;
    QueryState state_{QueryState::Idle};
    CoveringSet set_ranges_;
    std::map<GeoHashRange, Subscription> map_subscriptions_;
    std::unordered_map<std::string, LocationInfo> map_location_infos_;
    std::map<ListenerId, Listener> map_listeners_;
    ListenerId next_listener_id_{1};
    std::uint64_t next_generation_{1};
    bool flag_ready_fired_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

using LiveQueryPtr = std::shared_ptr<LiveQuery>;

}  // namespace geo_query
