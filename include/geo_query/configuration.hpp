// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe logging, the
// persisted geohash precision, and the tracker simulation used by the demo.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "geo_query/types.hpp"

namespace geo_query {

/**
 * @brief Parameters of the demo tracker simulation.
 */
struct TrackerConfig final {
    GeoPoint region_center{};        /**< Center of the watched circle and of the tracker swarm. */
    double region_radius_m{};        /**< Radius of the watched circle. */
    int tracker_count{};             /**< Number of simulated moving keys. */
    double tracker_speed_mps{};      /**< Ground speed of every tracker. */
    double update_hz{};              /**< Simulation update cadence in Hertz. */
};

/**
 * @brief Immutable bundle of runtime knobs.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    std::string log_level{};         /**< spdlog level name; empty keeps the default. */
    int geohash_precision{};         /**< Precision of the persisted geohash field. */
    TrackerConfig tracker{};         /**< Demo simulation settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize the logger, and return the configuration. */
    static Configuration load();

  private:
    static TrackerConfig load_tracker_config();
};

}  // namespace geo_query
