// === In-Memory Document Store ================================================
//
// Process-local implementation of both collaborator interfaces, used by the
// tests and the demo. Writes are applied immediately; the resulting range
// notifications are queued per subscription and delivered by
// `dispatch_pending()` outside the store lock, on whichever thread calls it.

#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "geo_query/document_store.hpp"

namespace geo_query {

class InMemoryDocumentStore final : public DocumentStore, public RangeSubscriptionProvider {
  public:
    [[nodiscard]] std::optional<Document> get(const std::string& key) override;
    void set(const std::string& key, const FieldMap& fields, bool merge) override;
    void update(const std::string& key, const std::vector<std::string>& field_deletions) override;
    void remove(const std::string& key) override;

    /** @brief Register a range; its initial snapshot is queued as one Added batch. */
    [[nodiscard]] SubscriptionHandle subscribe(
        const std::string& start_key,
        const std::string& end_key,
        SubscriptionCallback callback
    ) override;
    void cancel(SubscriptionHandle handle) override;

    /** @brief Deliver every queued batch in FIFO order; returns the number delivered. */
    std::size_t dispatch_pending();
    /** @brief Queue an error delivery for @p handle. */
    void inject_error(SubscriptionHandle handle, std::string message);

    [[nodiscard]] std::size_t document_count() const;
    [[nodiscard]] std::size_t subscription_count() const;
    [[nodiscard]] std::size_t pending_count() const;

  private:
    struct RangeSubscription final {
        std::string str_start{};
        std::string str_end{};
        SubscriptionCallback callback{};
    };

    struct PendingDelivery final {
        SubscriptionHandle handle{};
        SubscriptionResult result{};
    };

    /** @brief Queue per-subscription changes for a write of @p key; caller holds the lock. */
    void record_transition(const std::string& key, const std::optional<FieldMap>& before, const std::optional<FieldMap>& after);
    [[nodiscard]] static bool matches(const RangeSubscription& subscription, const std::optional<FieldMap>& fields);

    mutable std::mutex mutex_;
    std::map<std::string, FieldMap> map_documents_;
    std::map<SubscriptionHandle, RangeSubscription> map_subscriptions_;
    std::deque<PendingDelivery> queue_deliveries_;
    SubscriptionHandle next_handle_{1};
};

}  // namespace geo_query
