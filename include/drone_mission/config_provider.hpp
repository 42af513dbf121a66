// === Config Provider =========================================================
//
// Source of mission and vehicle descriptions. The controller only depends on
// the abstract interface; YamlConfigProvider reads the on-disk layout
//
//   <root>/missions/<id>.{yaml,yml,json}
//   <root>/vehicles/<id>.{yaml,yml,json}
//
// JSON files load through the same parser since JSON is a YAML subset.

#pragma once

#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "drone_mission/logging.hpp"
#include "drone_mission/mission_definition.hpp"

namespace drone_mission {

/** @brief Loads mission and vehicle descriptions by id. */
class ConfigProvider {
  public:
    virtual ~ConfigProvider() = default;

    /** @throws ConfigError when the mission is missing or malformed. */
    [[nodiscard]] virtual MissionDefinition load_mission(const std::string& mission_id) = 0;
    /** @throws ConfigError when the vehicle is missing or malformed. */
    [[nodiscard]] virtual VehicleProfile load_vehicle(const std::string& vehicle_id) = 0;
};

/** @brief File-backed provider using yaml-cpp. */
class YamlConfigProvider final : public ConfigProvider {
  public:
    explicit YamlConfigProvider(std::filesystem::path root);

    [[nodiscard]] MissionDefinition load_mission(const std::string& mission_id) override;
    [[nodiscard]] VehicleProfile load_vehicle(const std::string& vehicle_id) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept;

  private:
    [[nodiscard]] std::filesystem::path resolve(const std::string& subdirectory, const std::string& id) const;
    [[nodiscard]] YAML::Node load_document(const std::filesystem::path& path) const;

    std::filesystem::path path_root_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Map a parsed mission document onto MissionDefinition.
 *
 * Expects top-level `mission`, `commands` and (optional) `telemetry_config`
 * entries.
 *
 * @throws UnsupportedCommandError for a command type outside the closed set.
 * @throws ConfigError naming the offending field for anything else.
 */
[[nodiscard]] MissionDefinition parse_mission(const YAML::Node& document);

/**
 * @brief Map a parsed vehicle document (top-level `drone` entry) onto VehicleProfile.
 *
 * @throws ConfigError naming the offending field.
 */
[[nodiscard]] VehicleProfile parse_vehicle(const YAML::Node& document);

}  // namespace drone_mission
