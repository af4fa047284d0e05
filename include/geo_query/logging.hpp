// === Logging =================================================================
//
// Process-wide spdlog logger shared by the library, the demo, and the tests.
// Console output is human readable; the rotating file receives one JSON
// object per record so query events can be replayed with line-based tools.

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace geo_query {

/** @brief Create the shared logger once; later calls return the existing one. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error if initialize_logger() was never called. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Path of the JSON log file, empty before initialization. */
[[nodiscard]] std::filesystem::path log_file_path();

/**
 * @brief Apply a textual spdlog level.
 *
 * @return false when @p str_level is unknown; the level is then reset to info.
 */
bool set_log_level(const std::string& str_level);

}  // namespace geo_query
