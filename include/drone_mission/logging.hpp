#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace drone_mission {

/**
 * @brief Create the shared `drone_mission` logger on first call.
 *
 * Logs go to a colored console sink and to a rotating plain-text file under
 * @p log_directory, one record per line. Later calls return the existing
 * logger.
 *
 * @throws std::runtime_error if the directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error if initialize_logger has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Apply an spdlog level name; unknown names fall back to info. */
bool set_log_level(const std::string& str_level);

/** @brief Log each non-empty line of @p text as its own record. */
void log_lines(spdlog::logger& logger, spdlog::level::level_enum level, const std::string& text);

}  // namespace drone_mission
