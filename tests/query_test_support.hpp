// Shared doubles for live query tests: a subscription provider that lets the
// test deliver results by hand, and a sink that records every event.

#pragma once

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geo_query/document_store.hpp"
#include "geo_query/geohash.hpp"
#include "geo_query/query_events.hpp"

namespace geo_query::test {

class ManualSubscriptionProvider final : public RangeSubscriptionProvider {
  public:
    struct Entry final {
        std::string str_start{};
        std::string str_end{};
        SubscriptionCallback callback{};
        bool active{true};
    };

    SubscriptionHandle subscribe(const std::string& start_key, const std::string& end_key, SubscriptionCallback callback) override {
        const SubscriptionHandle handle = next_handle_++;
        map_entries_.emplace(handle, Entry{start_key, end_key, std::move(callback), true});
        ++subscribe_count;
        return handle;
    }

    void cancel(SubscriptionHandle handle) override {
        const auto iterator_entry = map_entries_.find(handle);
        if (iterator_entry != map_entries_.end() && iterator_entry->second.active) {
            iterator_entry->second.active = false;
            ++cancel_count;
        }
    }

    /** @brief Invoke the callback of @p handle, even after cancellation. */
    void deliver(SubscriptionHandle handle, const SubscriptionResult& result) {
        const SubscriptionCallback callback = map_entries_.at(handle).callback;
        callback(result);
    }

    void deliver_changes(SubscriptionHandle handle, std::vector<DocumentChange> changes) {
        SubscriptionResult result{};
        result.changes = std::move(changes);
        deliver(handle, result);
    }

    void deliver_error(SubscriptionHandle handle, std::string message) {
        SubscriptionResult result{};
        result.error = std::move(message);
        deliver(handle, result);
    }

    [[nodiscard]] std::vector<SubscriptionHandle> active_handles() const {
        std::vector<SubscriptionHandle> handles{};
        for (const auto& [handle, entry] : map_entries_) {
            if (entry.active) {
                handles.push_back(handle);
            }
        }
        return handles;
    }

    [[nodiscard]] std::vector<SubscriptionHandle> cancelled_handles() const {
        std::vector<SubscriptionHandle> handles{};
        for (const auto& [handle, entry] : map_entries_) {
            if (!entry.active) {
                handles.push_back(handle);
            }
        }
        return handles;
    }

    /** @brief Active handle whose range contains @p hash. */
    [[nodiscard]] std::optional<SubscriptionHandle> handle_containing(const std::string& hash) const {
        for (const auto& [handle, entry] : map_entries_) {
            if (entry.active && entry.str_start <= hash && hash < entry.str_end) {
                return handle;
            }
        }
        return std::nullopt;
    }

    void deliver_empty_to_all_active() {
        for (const SubscriptionHandle handle : active_handles()) {
            deliver_changes(handle, {});
        }
    }

    std::size_t subscribe_count{};
    std::size_t cancel_count{};

  private:
    std::map<SubscriptionHandle, Entry> map_entries_;
    SubscriptionHandle next_handle_{100};
};

class RecordingSink final : public QueryEventSink {
  public:
    void on_event(const QueryEvent& event) override {
        std::scoped_lock lock(mutex_);
        list_events_.push_back(event);
    }

    [[nodiscard]] std::vector<QueryEvent> events() const {
        std::scoped_lock lock(mutex_);
        return list_events_;
    }

    [[nodiscard]] std::vector<std::pair<QueryEventKind, std::string>> summary() const {
        std::scoped_lock lock(mutex_);
        std::vector<std::pair<QueryEventKind, std::string>> list_summary{};
        for (const QueryEvent& event : list_events_) {
            list_summary.emplace_back(event.kind, event.key);
        }
        return list_summary;
    }

    [[nodiscard]] std::size_t count(QueryEventKind kind) const {
        std::scoped_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(list_events_.begin(), list_events_.end(), [kind](const QueryEvent& event) {
            return event.kind == kind;
        }));
    }

    void clear() {
        std::scoped_lock lock(mutex_);
        list_events_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<QueryEvent> list_events_;
};

inline Document make_location_document(const std::string& key, const GeoPoint& location) {
    Document document{};
    document.key = key;
    document.fields.emplace(std::string{k_geohash_field}, GeoHash(location).str());
    document.fields.emplace(std::string{k_location_field}, location);
    return document;
}

inline DocumentChange added(const std::string& key, const GeoPoint& location) {
    return DocumentChange{ChangeKind::Added, make_location_document(key, location)};
}

inline DocumentChange modified(const std::string& key, const GeoPoint& location) {
    return DocumentChange{ChangeKind::Modified, make_location_document(key, location)};
}

inline DocumentChange removed(const std::string& key) {
    return DocumentChange{ChangeKind::Removed, Document{key, {}}};
}

}  // namespace geo_query::test
