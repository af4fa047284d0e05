#include "geo_query/in_memory_store.hpp"

#include <stdexcept>
#include <utility>

namespace geo_query {

std::optional<Document> InMemoryDocumentStore::get(const std::string& key) {
    std::scoped_lock lock(mutex_);
    const auto iterator_document = map_documents_.find(key);
    if (iterator_document == map_documents_.end()) {
        return std::nullopt;
    }
    return Document{key, iterator_document->second};
}

void InMemoryDocumentStore::set(const std::string& key, const FieldMap& fields, bool merge) {
    if (key.empty()) {
        throw std::invalid_argument("Document key cannot be empty");
    }
    std::scoped_lock lock(mutex_);
    std::optional<FieldMap> before{};
    const auto iterator_document = map_documents_.find(key);
    if (iterator_document != map_documents_.end()) {
        before = iterator_document->second;
    }

    FieldMap after = merge && before.has_value() ? before.value() : FieldMap{};
    for (const auto& [name, value] : fields) {
        after.insert_or_assign(name, value);
    }
    map_documents_[key] = after;
    record_transition(key, before, after);
}

void InMemoryDocumentStore::update(const std::string& key, const std::vector<std::string>& field_deletions) {
    std::scoped_lock lock(mutex_);
    const auto iterator_document = map_documents_.find(key);
    if (iterator_document == map_documents_.end()) {
        throw std::out_of_range("No document to update for key " + key);
    }
    const FieldMap before = iterator_document->second;
    for (const std::string& field_name : field_deletions) {
        iterator_document->second.erase(field_name);
    }
    record_transition(key, before, iterator_document->second);
}

void InMemoryDocumentStore::remove(const std::string& key) {
    std::scoped_lock lock(mutex_);
    const auto iterator_document = map_documents_.find(key);
    if (iterator_document == map_documents_.end()) {
        return;
    }
    const FieldMap before = iterator_document->second;
    map_documents_.erase(iterator_document);
    record_transition(key, before, std::nullopt);
}

SubscriptionHandle InMemoryDocumentStore::subscribe(
    const std::string& start_key,
    const std::string& end_key,
    SubscriptionCallback callback
) {
    if (!callback) {
        throw std::invalid_argument("Subscription requires a callback");
    }
    std::scoped_lock lock(mutex_);
    const SubscriptionHandle handle = next_handle_++;
    RangeSubscription subscription{start_key, end_key, std::move(callback)};

    PendingDelivery initial{};
    initial.handle = handle;
    for (const auto& [key, fields] : map_documents_) {
        if (matches(subscription, fields)) {
            initial.result.changes.push_back(DocumentChange{ChangeKind::Added, Document{key, fields}});
        }
    }
    map_subscriptions_.emplace(handle, std::move(subscription));
    queue_deliveries_.push_back(std::move(initial));
    return handle;
}

void InMemoryDocumentStore::cancel(SubscriptionHandle handle) {
    std::scoped_lock lock(mutex_);
    map_subscriptions_.erase(handle);
}

std::size_t InMemoryDocumentStore::dispatch_pending() {
    std::size_t delivered_count = 0;
    while (true) {
        SubscriptionCallback callback{};
        PendingDelivery delivery{};
        {
            std::scoped_lock lock(mutex_);
            if (queue_deliveries_.empty()) {
                break;
            }
            delivery = std::move(queue_deliveries_.front());
            queue_deliveries_.pop_front();
            const auto iterator_subscription = map_subscriptions_.find(delivery.handle);
            if (iterator_subscription == map_subscriptions_.end()) {
                continue;
            }
            callback = iterator_subscription->second.callback;
        }
        callback(delivery.result);
        ++delivered_count;
    }
    return delivered_count;
}

void InMemoryDocumentStore::inject_error(SubscriptionHandle handle, std::string message) {
    std::scoped_lock lock(mutex_);
    PendingDelivery delivery{};
    delivery.handle = handle;
    delivery.result.error = std::move(message);
    queue_deliveries_.push_back(std::move(delivery));
}

std::size_t InMemoryDocumentStore::document_count() const {
    std::scoped_lock lock(mutex_);
    return map_documents_.size();
}

std::size_t InMemoryDocumentStore::subscription_count() const {
    std::scoped_lock lock(mutex_);
    return map_subscriptions_.size();
}

std::size_t InMemoryDocumentStore::pending_count() const {
    std::scoped_lock lock(mutex_);
    return queue_deliveries_.size();
}

void InMemoryDocumentStore::record_transition(
    const std::string& key,
    const std::optional<FieldMap>& before,
    const std::optional<FieldMap>& after
) {
    for (const auto& [handle, subscription] : map_subscriptions_) {
        const bool matched_before = matches(subscription, before);
        const bool matches_after = matches(subscription, after);
        if (!matched_before && !matches_after) {
            continue;
        }

        DocumentChange change{};
        change.document.key = key;
        if (after.has_value()) {
            change.document.fields = after.value();
        }
        if (!matched_before) {
            change.kind = ChangeKind::Added;
        } else if (matches_after) {
            change.kind = ChangeKind::Modified;
        } else {
            change.kind = ChangeKind::Removed;
        }

        PendingDelivery delivery{};
        delivery.handle = handle;
        delivery.result.changes.push_back(std::move(change));
        queue_deliveries_.push_back(std::move(delivery));
    }
}

bool InMemoryDocumentStore::matches(const RangeSubscription& subscription, const std::optional<FieldMap>& fields) {
    if (!fields.has_value()) {
        return false;
    }
    const auto iterator_field = fields->find(k_geohash_field);
    if (iterator_field == fields->end()) {
        return false;
    }
    const auto* geohash = std::get_if<std::string>(&iterator_field->second);
    if (geohash == nullptr) {
        return false;
    }
    return subscription.str_start <= *geohash && *geohash < subscription.str_end;
}

}  // namespace geo_query
