#include "geo_query/live_query.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "geo_query/errors.hpp"
#include "geo_query/geo_utils.hpp"

namespace geo_query {

namespace {

double validated_radius(double radius_m) {
    if (!std::isfinite(radius_m) || radius_m < 0.0) {
        throw GeoQueryError(ErrorCode::InvalidArgument, fmt::format("Query radius must be a non-negative number, got {}", radius_m));
    }
    return cap_radius(radius_m);
}

QueryEvent make_key_event(QueryEventKind kind, const std::string& key, std::optional<GeoPoint> location, const Document& document) {
    QueryEvent event{};
    event.kind = kind;
    event.key = key;
    event.location = location;
    event.document = document;
    return event;
}

}  // namespace

std::string_view to_string(QueryState state) noexcept {
    switch (state) {
        case QueryState::Idle:
            return "idle";
        case QueryState::Planning:
            return "planning";
        case QueryState::Subscribed:
            return "subscribed";
        case QueryState::Ready:
            return "ready";
    }
    return "unknown";
}

std::shared_ptr<LiveQuery> LiveQuery::create(RangeSubscriptionProvider& provider, const GeoPoint& center, double radius_m) {
    return std::make_shared<LiveQuery>(PrivateTag{}, provider, center, radius_m);
}

LiveQuery::LiveQuery(PrivateTag, RangeSubscriptionProvider& provider, const GeoPoint& center, double radius_m)
    : provider_(provider),
      center_(center),
      radius_m_(validated_radius(radius_m)),
      logger_(get_logger()) {
    require_valid_coordinates(center_);
    if (radius_m_ < radius_m) {
        logger_->warn("Radius {} m exceeds the supported maximum; using {} m", radius_m, radius_m_);
    }
}

LiveQuery::~LiveQuery() {
    try {
        dispose();
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"live_query","action":"dispose","error":"{}"}})", exc.what());
    }
}

void LiveQuery::set_region(const GeoPoint& center, double radius_m) {
    require_valid_coordinates(center);
    const double capped_radius_m = validated_radius(radius_m);
    if (capped_radius_m < radius_m) {
        logger_->warn("Radius {} m exceeds the supported maximum; using {} m", radius_m, capped_radius_m);
    }

    std::vector<SubscriptionHandle> list_cancelled{};
    {
        std::scoped_lock lock(mutex_);
        center_ = center;
        radius_m_ = capped_radius_m;
        if (!map_listeners_.empty()) {
            setup_queries_locked(list_cancelled);
        }
    }
    cancel_subscriptions(list_cancelled);
}

ListenerId LiveQuery::add_sink(QueryEventSinkPtr sink, EventKindMask kinds) {
    if (sink == nullptr) {
        throw std::invalid_argument("LiveQuery sink cannot be null");
    }
    std::scoped_lock lock(mutex_);
    const ListenerId listener_id = next_listener_id_++;
    const Listener& listener = map_listeners_.emplace(listener_id, Listener{std::move(sink), kinds}).first->second;

    if (map_subscriptions_.empty()) {
        std::vector<SubscriptionHandle> list_cancelled{};
        setup_queries_locked(list_cancelled);
        return listener_id;
    }

    for (const auto& [key, info] : map_location_infos_) {
        if (info.in_query) {
            emit_to_locked(listener, make_key_event(QueryEventKind::Entered, key, info.location, info.document));
        }
    }
    if (!has_outstanding_locked()) {
        emit_to_locked(listener, QueryEvent{QueryEventKind::Ready});
    }
    return listener_id;
}

ListenerId LiveQuery::add_listener(QueryEventKind kind, CallbackSink::Callback callback) {
    return add_sink(std::make_shared<CallbackSink>(std::move(callback)), event_mask(kind));
}

void LiveQuery::remove_listener(ListenerId listener_id) {
    std::vector<SubscriptionHandle> list_cancelled{};
    {
        std::scoped_lock lock(mutex_);
        if (map_listeners_.erase(listener_id) == 0) {
            return;
        }
        if (map_listeners_.empty()) {
            reset_locked(list_cancelled);
        }
    }
    cancel_subscriptions(list_cancelled);
}

void LiveQuery::dispose() {
    std::vector<SubscriptionHandle> list_cancelled{};
    {
        std::scoped_lock lock(mutex_);
        reset_locked(list_cancelled);
    }
    cancel_subscriptions(list_cancelled);
}

GeoPoint LiveQuery::center() const {
    std::scoped_lock lock(mutex_);
    return center_;
}

double LiveQuery::radius_m() const {
    std::scoped_lock lock(mutex_);
    return radius_m_;
}

QueryState LiveQuery::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

CoveringSet LiveQuery::covering_set() const {
    std::scoped_lock lock(mutex_);
    return set_ranges_;
}

std::size_t LiveQuery::subscription_count() const {
    std::scoped_lock lock(mutex_);
    return map_subscriptions_.size();
}

std::size_t LiveQuery::outstanding_count() const {
    std::scoped_lock lock(mutex_);
    std::size_t outstanding = 0;
    for (const auto& [range, subscription] : map_subscriptions_) {
        if (subscription.outstanding) {
            ++outstanding;
        }
    }
    return outstanding;
}

std::size_t LiveQuery::listener_count() const {
    std::scoped_lock lock(mutex_);
    return map_listeners_.size();
}

std::optional<LocationInfo> LiveQuery::location_info(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_info = map_location_infos_.find(key);
    if (iterator_info == map_location_infos_.end()) {
        return std::nullopt;
    }
    return iterator_info->second;
}

std::size_t LiveQuery::cached_location_count() const {
    std::scoped_lock lock(mutex_);
    return map_location_infos_.size();
}

void LiveQuery::handle_result(const GeoHashRange& range, std::uint64_t generation, const SubscriptionResult& result) {
    std::scoped_lock lock(mutex_);
    const auto iterator_subscription = map_subscriptions_.find(range);
    if (iterator_subscription == map_subscriptions_.end() || iterator_subscription->second.generation != generation) {
        logger_->debug("Dropping delivery for cancelled range {}", range.to_string());
        return;
    }

    if (result.error.has_value()) {
        logger_->error(
            R"({{"component":"live_query","range":"{}","code":"{}","error":"{}"}})",
            range.to_string(),
            to_string(ErrorCode::SubscriptionError),
            result.error.value()
        );
        QueryEvent event{};
        event.kind = QueryEventKind::Error;
        event.str_error = result.error.value();
        emit_locked(event);
        return;
    }

    if (iterator_subscription->second.outstanding) {
        iterator_subscription->second.outstanding = false;
        refresh_state_locked();
        check_and_fire_ready_locked();
    }

    for (const DocumentChange& change : result.changes) {
        switch (change.kind) {
            case ChangeKind::Added:
            case ChangeKind::Modified:
                child_changed_locked(change.document);
                break;
            case ChangeKind::Removed:
                child_removed_locked(change.document);
                break;
        }
    }
}

void LiveQuery::setup_queries_locked(std::vector<SubscriptionHandle>& list_cancelled) {
    state_ = QueryState::Planning;
    CoveringSet new_ranges = planner::plan_region(center_, radius_m_);

    std::size_t cancelled_count = 0;
    for (auto iterator_subscription = map_subscriptions_.begin(); iterator_subscription != map_subscriptions_.end();) {
        if (new_ranges.count(iterator_subscription->first) == 0) {
            list_cancelled.push_back(iterator_subscription->second.handle);
            iterator_subscription = map_subscriptions_.erase(iterator_subscription);
            ++cancelled_count;
        } else {
            ++iterator_subscription;
        }
    }

    std::size_t added_count = 0;
    const std::weak_ptr<LiveQuery> weak_query = weak_from_this();
    for (const GeoHashRange& range : new_ranges) {
        if (map_subscriptions_.count(range) != 0) {
            continue;
        }
        const std::uint64_t generation = next_generation_++;
        const SubscriptionHandle handle = provider_.subscribe(
            range.start_value(),
            range.end_value(),
            [weak_query, range, generation](const SubscriptionResult& result) {
                if (const auto query = weak_query.lock()) {
                    query->handle_result(range, generation, result);
                }
            }
        );
        map_subscriptions_.emplace(range, Subscription{handle, generation, true});
        ++added_count;
    }
    if (added_count > 0) {
        flag_ready_fired_ = false;
    }
    set_ranges_ = std::move(new_ranges);

    reevaluate_membership_locked();
    std::erase_if(map_location_infos_, [this](const auto& entry) {
        return !planner::covering_contains(set_ranges_, entry.second.geohash);
    });

    logger_->debug(
        R"({{"component":"live_query","action":"plan","lat":{},"lon":{},"radius_m":{},"ranges":{},"added":{},"cancelled":{}}})",
        center_.latitude_deg,
        center_.longitude_deg,
        radius_m_,
        set_ranges_.size(),
        added_count,
        cancelled_count
    );

    refresh_state_locked();
    check_and_fire_ready_locked();
}

void LiveQuery::reset_locked(std::vector<SubscriptionHandle>& list_cancelled) {
    for (const auto& [range, subscription] : map_subscriptions_) {
        list_cancelled.push_back(subscription.handle);
    }
    map_subscriptions_.clear();
    map_location_infos_.clear();
    set_ranges_.clear();
    flag_ready_fired_ = false;
    state_ = QueryState::Idle;
}

void LiveQuery::child_changed_locked(const Document& document) {
    GeoPoint location{};
    try {
        location = location_value(document);
    } catch (const GeoQueryError& exc) {
        logger_->error(
            R"({{"component":"live_query","key":"{}","error":"{}","detail":"{}"}})",
            document.key,
            to_string(exc.code()),
            exc.what()
        );
        return;
    }
    update_location_info_locked(document, location);
}

void LiveQuery::child_removed_locked(const Document& document) {
    const auto iterator_info = map_location_infos_.find(document.key);
    if (iterator_info == map_location_infos_.end()) {
        return;
    }

    if (has_location(document)) {
        try {
            const GeoHash latest_hash(location_value(document), GeoHash::k_max_precision);
            if (planner::covering_contains(set_ranges_, latest_hash)) {
                return;
            }
        } catch (const GeoQueryError& exc) {
            logger_->warn("Removed document {} carries an unusable location: {}", document.key, exc.what());
        }
    }

    const bool was_in_query = iterator_info->second.in_query;
    const Document last_document = std::move(iterator_info->second.document);
    map_location_infos_.erase(iterator_info);
    if (was_in_query) {
        emit_locked(make_key_event(QueryEventKind::Exited, document.key, std::nullopt, last_document));
    }
}

void LiveQuery::update_location_info_locked(const Document& document, const GeoPoint& location) {
    const auto iterator_info = map_location_infos_.find(document.key);
    const bool is_new = iterator_info == map_location_infos_.end();
    const bool was_in_query = !is_new && iterator_info->second.in_query;
    const bool changed_location = !is_new && !(iterator_info->second.location == location);
    const bool is_in_query = location_is_in_query_locked(location);

    if ((is_new || !was_in_query) && is_in_query) {
        emit_locked(make_key_event(QueryEventKind::Entered, document.key, location, document));
    } else if (!is_new && is_in_query) {
        if (changed_location) {
            emit_locked(make_key_event(QueryEventKind::Moved, document.key, location, document));
        }
        emit_locked(make_key_event(QueryEventKind::Changed, document.key, location, document));
    } else if (was_in_query && !is_in_query) {
        emit_locked(make_key_event(QueryEventKind::Exited, document.key, std::nullopt, document));
    }

    map_location_infos_.insert_or_assign(
        document.key,
        LocationInfo{location, GeoHash(location, GeoHash::k_max_precision), is_in_query, document}
    );
}

void LiveQuery::reevaluate_membership_locked() {
    std::vector<std::pair<Document, GeoPoint>> list_cached{};
    list_cached.reserve(map_location_infos_.size());
    for (const auto& [key, info] : map_location_infos_) {
        list_cached.emplace_back(info.document, info.location);
    }
    for (const auto& [document, location] : list_cached) {
        update_location_info_locked(document, location);
    }
}

void LiveQuery::cancel_subscriptions(const std::vector<SubscriptionHandle>& list_cancelled) {
    for (const SubscriptionHandle handle : list_cancelled) {
        provider_.cancel(handle);
    }
}

void LiveQuery::check_and_fire_ready_locked() {
    if (flag_ready_fired_ || map_subscriptions_.empty() || has_outstanding_locked()) {
        return;
    }
    flag_ready_fired_ = true;
    logger_->info(
        R"({{"component":"live_query","action":"ready","ranges":{},"keys":{}}})",
        map_subscriptions_.size(),
        map_location_infos_.size()
    );
    emit_locked(QueryEvent{QueryEventKind::Ready});
}

void LiveQuery::refresh_state_locked() {
    if (map_subscriptions_.empty()) {
        state_ = QueryState::Idle;
    } else if (has_outstanding_locked()) {
        state_ = QueryState::Subscribed;
    } else {
        state_ = QueryState::Ready;
    }
}

bool LiveQuery::location_is_in_query_locked(const GeoPoint& location) const {
    return distance_m(location, center_) <= radius_m_;
}

bool LiveQuery::has_outstanding_locked() const {
    for (const auto& [range, subscription] : map_subscriptions_) {
        if (subscription.outstanding) {
            return true;
        }
    }
    return false;
}

void LiveQuery::emit_locked(const QueryEvent& event) {
    for (const auto& [listener_id, listener] : map_listeners_) {
        emit_to_locked(listener, event);
    }
}

void LiveQuery::emit_to_locked(const Listener& listener, const QueryEvent& event) {
    if ((listener.kinds & event_mask(event.kind)) == 0) {
        return;
    }
    try {
        listener.sink->on_event(event);
    } catch (const std::exception& exc) {
        logger_->error(
            R"({{"component":"live_query","event":"{}","key":"{}","sink_error":"{}"}})",
            to_string(event.kind),
            event.key,
            exc.what()
        );
    }
}

}  // namespace geo_query
