// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings. Raw
// environment variables are transformed into the strongly-typed
// `Configuration` structure consumed by the demo runtime and the store facade.
//
// Recognized variables
// - GEO_QUERY_LOG_DIR, GEO_QUERY_LOG_LEVEL
// - GEO_QUERY_STORE_PRECISION (1..22)
// - GEO_QUERY_CENTER_LAT, GEO_QUERY_CENTER_LON, GEO_QUERY_RADIUS_M
// - GEO_QUERY_TRACKER_COUNT, GEO_QUERY_TRACKER_SPEED_MPS, GEO_QUERY_UPDATE_HZ
//
// Invalid values fall back to defaults and are reported through the logger.

#include "geo_query/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "geo_query/geo_utils.hpp"
#include "geo_query/geohash.hpp"
#include "geo_query/logging.hpp"

namespace geo_query {

namespace {
constexpr double k_default_center_lat{37.7853889};
constexpr double k_default_center_lon{-122.4056973};
constexpr double k_default_region_radius_m{1000.0};
constexpr double k_default_update_hz{2.0};
constexpr double k_default_tracker_speed_mps{60.0};
constexpr int k_default_tracker_count{8};
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        return std::stod(raw_value);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double '{}' from environment; using fallback {}", raw_value, fallback);
        return fallback;
    }
}

double parse_positive_double(const char* raw_value, double fallback) {
    return clamp_positive(parse_double(raw_value, fallback), fallback);
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer '{}' from environment; using fallback {}", raw_value, fallback);
        return fallback;
    }
}

std::string parse_string(const char* raw_value, std::string_view fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

int parse_precision(const char* raw_value) {
    const int parsed_value = parse_int(raw_value, GeoHash::k_default_precision);
    if (parsed_value > GeoHash::k_max_precision) {
        get_logger()->warn("Store precision {} exceeds {}; using default {}", parsed_value, GeoHash::k_max_precision, GeoHash::k_default_precision);
        return GeoHash::k_default_precision;
    }
    return parsed_value;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string(std::getenv("GEO_QUERY_LOG_DIR"), k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string(std::getenv("GEO_QUERY_LOG_LEVEL"), "");
    config.geohash_precision = parse_precision(std::getenv("GEO_QUERY_STORE_PRECISION"));
    config.tracker = load_tracker_config();

    logger->info("Configuration loaded: precision={} center=({}, {}) radius_m={} trackers={} update_hz={}",
                 config.geohash_precision,
                 config.tracker.region_center.latitude_deg,
                 config.tracker.region_center.longitude_deg,
                 config.tracker.region_radius_m,
                 config.tracker.tracker_count,
                 config.tracker.update_hz);

    return config;
}

TrackerConfig ConfigurationLoader::load_tracker_config() {
    TrackerConfig tracker{};
    GeoPoint center{
        parse_double(std::getenv("GEO_QUERY_CENTER_LAT"), k_default_center_lat),
        parse_double(std::getenv("GEO_QUERY_CENTER_LON"), k_default_center_lon)
    };
    if (!coordinates_valid(center)) {
        get_logger()->warn("Configured center ({}, {}) is invalid; using default", center.latitude_deg, center.longitude_deg);
        center = GeoPoint{k_default_center_lat, k_default_center_lon};
    }
    tracker.region_center = center;
    tracker.region_radius_m = parse_positive_double(std::getenv("GEO_QUERY_RADIUS_M"), k_default_region_radius_m);
    tracker.tracker_count = parse_int(std::getenv("GEO_QUERY_TRACKER_COUNT"), k_default_tracker_count);
    tracker.tracker_speed_mps = parse_positive_double(std::getenv("GEO_QUERY_TRACKER_SPEED_MPS"), k_default_tracker_speed_mps);
    tracker.update_hz = parse_positive_double(std::getenv("GEO_QUERY_UPDATE_HZ"), k_default_update_hz);
    return tracker;
}

}  // namespace geo_query
