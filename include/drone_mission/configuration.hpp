// === Configuration ===========================================================
//
// Runtime knobs for the mission_runner app. `ConfigurationLoader` translates
// DRONE_MISSION_* environment variables into RuntimeConfiguration so the
// engine itself never touches `std::getenv`.

#pragma once

#include <filesystem>
#include <string>

#include "drone_mission/engine_config.hpp"

namespace drone_mission {

/**
 * @brief Immutable bundle of settings for one mission_runner invocation.
 *
 * Every field is populated by ConfigurationLoader; the engine tuning is
 * passed by value to MissionController.
 */
struct RuntimeConfiguration final {
    std::string log_directory{};            /**< Destination directory for structured logs. */
    std::string log_level{};                /**< spdlog level name; empty keeps the default. */
    std::filesystem::path config_root{};    /**< Directory holding missions/ and vehicles/. */
    std::string mission_id{};               /**< Mission document to run. */
    std::string vehicle_id{};               /**< Vehicle document to fly it on. */
    bool real_time{true};                   /**< Pace ticks against the wall clock. */
    EngineConfig engine{};                  /**< Engine tuning handed to the controller. */
};

/**
 * @brief Utility responsible for hydrating RuntimeConfiguration from
 *        environment variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initializes the shared logger as a side effect. */
    static RuntimeConfiguration load();

  private:
    static EngineConfig load_engine_config();
};

}  // namespace drone_mission
