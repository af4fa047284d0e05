#include "geo_query/tracker_simulation.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "geo_query/geo_utils.hpp"

namespace geo_query {

namespace {

constexpr std::chrono::milliseconds k_dispatch_sleep_duration{20};  /**< Pause between dispatcher passes. */
constexpr double k_spawn_radius_fraction{1.5};                      /**< Trackers spawn up to 1.5 radii from center. */
constexpr double k_turn_back_radius_fraction{2.0};                  /**< Trackers beyond 2 radii head back to center. */
constexpr double k_heading_jitter_deg{7.0};                         /**< Per-tick heading drift. */

}  // namespace

TrackerSimulation::TrackerSimulation(Configuration configuration)
    : configuration_(std::move(configuration)),
      document_store_(),
      location_store_(document_store_, document_store_, configuration_.geohash_precision),
      event_queue_(std::make_shared<QueryEventQueue>()),
      logger_(get_logger()) {
    if (configuration_.tracker.tracker_count <= 0) {
        throw std::invalid_argument("TrackerSimulation requires at least one tracker");
    }
    if (configuration_.tracker.update_hz <= 0.0) {
        throw std::invalid_argument("TrackerSimulation update rate must be positive");
    }
}

TrackerSimulation::~TrackerSimulation() {
    shutdown();
}

void TrackerSimulation::initialize() {
    const TrackerConfig& tracker_config = configuration_.tracker;
    logger_->info("Initializing tracker simulation with {} trackers", tracker_config.tracker_count);

    list_trackers_.clear();
    for (int index = 0; index < tracker_config.tracker_count; ++index) {
        const double bearing_deg = 360.0 * index / tracker_config.tracker_count;
        const double spawn_distance_m = tracker_config.region_radius_m * k_spawn_radius_fraction
            * static_cast<double>(index + 1) / tracker_config.tracker_count;
        Tracker tracker{};
        tracker.identifier = fmt::format("tracker-{}", index + 1);
        tracker.location = offset_coordinate(tracker_config.region_center, bearing_deg, spawn_distance_m);
        tracker.heading_deg = bearing_deg + 90.0;
        location_store_.set_location(tracker.identifier, tracker.location);
        list_trackers_.push_back(tracker);
    }

    live_query_ = location_store_.query_at_location(tracker_config.region_center, tracker_config.region_radius_m);
    live_query_->add_sink(event_queue_);
    logger_->info("Live query planned {} ranges", live_query_->covering_set().size());
}

void TrackerSimulation::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting tracker simulation loops");
    update_thread_ = std::thread(&TrackerSimulation::update_loop, this);
    dispatch_thread_ = std::thread(&TrackerSimulation::dispatch_loop, this);
}

void TrackerSimulation::shutdown() {
    if (flag_running_.exchange(false)) {
        logger_->info("Shutting down tracker simulation");
        if (update_thread_.joinable()) {
            update_thread_.join();
        }
        if (dispatch_thread_.joinable()) {
            dispatch_thread_.join();
        }
    }
    if (live_query_ != nullptr) {
        live_query_->dispose();
    }
}

void TrackerSimulation::step(const Duration& tick) {
    const TrackerConfig& tracker_config = configuration_.tracker;
    const double travel_m = tracker_config.tracker_speed_mps * tick.count();
    for (Tracker& tracker : list_trackers_) {
        if (distance_m(tracker.location, tracker_config.region_center) > tracker_config.region_radius_m * k_turn_back_radius_fraction) {
            tracker.heading_deg = initial_bearing_deg(tracker.location, tracker_config.region_center);
        } else {
            tracker.heading_deg += k_heading_jitter_deg;
        }
        tracker.location = offset_coordinate(tracker.location, tracker.heading_deg, travel_m);
        location_store_.set_location(tracker.identifier, tracker.location);
    }
}

std::size_t TrackerSimulation::pump() {
    document_store_.dispatch_pending();
    return drain_events();
}

const LiveQueryPtr& TrackerSimulation::live_query() const noexcept {
    return live_query_;
}

EventTally TrackerSimulation::tally() const noexcept {
    return EventTally{
        count_entered_.load(),
        count_exited_.load(),
        count_changed_.load(),
        count_moved_.load(),
        count_errors_.load(),
        count_ready_.load()
    };
}

void TrackerSimulation::update_loop() {
    const Duration tick_interval{1.0 / configuration_.tracker.update_hz};
    const SteadyClock::duration steady_tick_interval = std::chrono::duration_cast<SteadyClock::duration>(tick_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            step(tick_interval);
        } catch (const std::exception& exc) {
            logger_->error("Update loop error: {}", exc.what());
        }
        next_tick = now + steady_tick_interval;
    }
}

void TrackerSimulation::dispatch_loop() {
    while (flag_running_.load()) {
        try {
            pump();
        } catch (const std::exception& exc) {
            logger_->error("Dispatch loop error: {}", exc.what());
        }
        std::this_thread::sleep_for(k_dispatch_sleep_duration);
    }
}

std::size_t TrackerSimulation::drain_events() {
    std::size_t drained_count = 0;
    while (true) {
        std::optional<QueryEvent> optional_event = event_queue_->try_consume();
        if (!optional_event.has_value()) {
            break;
        }
        const QueryEvent& event = optional_event.value();
        switch (event.kind) {
            case QueryEventKind::Entered:
                ++count_entered_;
                break;
            case QueryEventKind::Exited:
                ++count_exited_;
                break;
            case QueryEventKind::Changed:
                ++count_changed_;
                break;
            case QueryEventKind::Moved:
                ++count_moved_;
                break;
            case QueryEventKind::Error:
                ++count_errors_;
                break;
            case QueryEventKind::Ready:
                ++count_ready_;
                break;
        }

        if (event.kind == QueryEventKind::Error) {
            logger_->warn(R"({{"component":"tracker_simulation","event":"error","message":"{}"}})", event.str_error);
        } else if (event.location.has_value()) {
            logger_->info(
                R"({{"component":"tracker_simulation","event":"{}","key":"{}","lat":{},"lon":{}}})",
                to_string(event.kind),
                event.key,
                event.location->latitude_deg,
                event.location->longitude_deg
            );
        } else {
            logger_->info(
                R"({{"component":"tracker_simulation","event":"{}","key":"{}"}})",
                to_string(event.kind),
                event.key
            );
        }
        ++drained_count;
    }
    return drained_count;
}

}  // namespace geo_query
