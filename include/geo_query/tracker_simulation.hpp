// === Tracker Simulation ======================================================
//
// Drives the demo: a swarm of keys moves around the configured center on
// great-circle headings, each tick writes their locations through a
// LocationStore backed by the in-memory store, and a dispatcher loop pumps
// the store's subscription deliveries into a live query and logs its events.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "geo_query/configuration.hpp"
#include "geo_query/in_memory_store.hpp"
#include "geo_query/live_query.hpp"
#include "geo_query/location_store.hpp"
#include "geo_query/logging.hpp"
#include "geo_query/query_events.hpp"

namespace geo_query {

/** @brief Running totals of the events drained from the live query. */
struct EventTally final {
    std::size_t entered{};
    std::size_t exited{};
    std::size_t changed{};
    std::size_t moved{};
    std::size_t errors{};
    std::size_t ready{};
};

/** @brief Owns the demo store, query, and worker threads. */
class TrackerSimulation final {
  public:
    explicit TrackerSimulation(Configuration configuration);
    ~TrackerSimulation();

    TrackerSimulation(const TrackerSimulation&) = delete;
    TrackerSimulation& operator=(const TrackerSimulation&) = delete;

    /** @brief Place trackers, write their initial locations, and start the query. */
    void initialize();
    /** @brief Start background update and dispatch loops. */
    void run();
    /** @brief Stop worker threads and dispose the query. */
    void shutdown();

    /** @brief Advance every tracker by @p tick and persist the new locations. */
    void step(const Duration& tick);
    /** @brief Deliver pending store notifications and drain the resulting events. */
    std::size_t pump();

    [[nodiscard]] const LiveQueryPtr& live_query() const noexcept;
    [[nodiscard]] EventTally tally() const noexcept;

  private:
    struct Tracker final {
        std::string identifier{};
        GeoPoint location{};
        double heading_deg{};
    };

    /** @brief Fixed-timestep loop moving trackers. */
    void update_loop();
    /** @brief Loop delivering subscription results and logging events. */
    void dispatch_loop();
    std::size_t drain_events();

    Configuration configuration_;
    InMemoryDocumentStore document_store_;
    LocationStore location_store_;
    std::shared_ptr<QueryEventQueue> event_queue_;
    LiveQueryPtr live_query_;
    std::vector<Tracker> list_trackers_;
    std::atomic<std::size_t> count_entered_{0};
    std::atomic<std::size_t> count_exited_{0};
    std::atomic<std::size_t> count_changed_{0};
    std::atomic<std::size_t> count_moved_{0};
    std::atomic<std::size_t> count_errors_{0};
    std::atomic<std::size_t> count_ready_{0};
    std::atomic<bool> flag_running_{false};
    std::thread update_thread_;
    std::thread dispatch_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geo_query
