#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include "logging_test_fixture.hpp"
#include "drone_mission/config_provider.hpp"
#include "drone_mission/errors.hpp"

using namespace drone_mission;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_mission::test::ensure_logger_initialized();
    return true;
}();

constexpr const char* k_mission_yaml = R"(
mission:
  name: Living Room Loop
  description: short indoor loop
  drone_model: Cetus Lite Beta FPV
  duration_estimate_seconds: 45
  safety_parameters:
    max_altitude_feet: 12
    max_speed_fps: 8
    emergency_land_battery_percent: 25
    geofence_radius_feet: 15
    max_wind_speed_mph: 0
  environment:
    indoor_safe: true
    outdoor_capable: false
    recommended_space: 15x15 ft
commands:
  - id: 1
    type: TAKEOFF
    description: up
    parameters: {target_altitude_feet: 6, climb_rate_fps: 1.5, stabilization_time_seconds: 2}
    expected_duration_seconds: 6
    safety_checks: [battery_level, altitude_hold]
  - id: 2
    type: circle
    parameters: {radius_feet: 3, speed_fps: 1, direction: counterclockwise, smooth_entry: false}
  - id: 3
    type: LAND
    parameters: {descent_rate_fps: 0.8, precision_landing: yes}
telemetry_config:
  update_rate_hz: 20
  data_points: [battery, position]
  logging_enabled: false
  real_time_display: true
)";

constexpr const char* k_vehicle_yaml = R"(
drone:
  model: Cetus Lite Beta FPV
  manufacturer: BetaFPV
  type: micro_quadcopter
  category: trainer
  specifications:
    weight_grams: 35
    motor_count: 4
    video_system: {resolution: 720p}
  capabilities:
    gps: false
    altitude_hold: true
)";

/** Scratch config root removed when the test finishes. */
struct ScratchConfigRoot {
    ScratchConfigRoot()
        : path(std::filesystem::temp_directory_path()
               / ("drone_mission_config_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))) {
        std::filesystem::create_directories(path / "missions");
        std::filesystem::create_directories(path / "vehicles");
    }

    ~ScratchConfigRoot() {
        std::error_code error;
        std::filesystem::remove_all(path, error);
    }

    void write(const std::filesystem::path& relative, const std::string& contents) const {
        std::ofstream stream{path / relative};
        stream << contents;
    }

    std::filesystem::path path;
};
}  // namespace

TEST_CASE("Mission documents map onto MissionDefinition") {
    const MissionDefinition mission = parse_mission(YAML::Load(k_mission_yaml));

    REQUIRE(mission.name == "Living Room Loop");
    REQUIRE(mission.vehicle_model == "Cetus Lite Beta FPV");
    REQUIRE(mission.estimated_duration_s == 45.0);
    REQUIRE(mission.safety.max_altitude_ft == 12.0);
    REQUIRE(mission.safety.max_horizontal_speed_fps == 8.0);
    REQUIRE(mission.safety.emergency_land_battery_percent == 25);
    REQUIRE(mission.environment.indoor_safe);
    REQUIRE_FALSE(mission.environment.outdoor_capable);
    REQUIRE(mission.environment.recommended_space == "15x15 ft");

    REQUIRE(mission.commands.size() == 3);
    const CommandSpec& takeoff = mission.commands[0];
    REQUIRE(takeoff.kind == CommandKind::Ascend);
    REQUIRE(takeoff.expected_duration_s == 6.0);
    REQUIRE(takeoff.safety_checks == std::vector<std::string>{"battery_level", "altitude_hold"});
    REQUIRE(find_number(takeoff.parameters, "climb_rate_fps") == 1.5);

    const CommandSpec& circle = mission.commands[1];
    REQUIRE(circle.kind == CommandKind::CircularPath);
    REQUIRE(find_string(circle.parameters, "direction") == std::string{"counterclockwise"});
    REQUIRE(find_bool(circle.parameters, "smooth_entry") == false);
    REQUIRE(circle.safety_checks.empty());

    REQUIRE(find_bool(mission.commands[2].parameters, "precision_landing") == true);

    REQUIRE(mission.telemetry.update_rate_hz == 20.0);
    REQUIRE(mission.telemetry.data_points == std::vector<std::string>{"battery", "position"});
    REQUIRE_FALSE(mission.telemetry.logging_enabled);
}

TEST_CASE("JSON mission documents load through the same parser") {
    const MissionDefinition mission = parse_mission(YAML::Load(R"({
        "mission": {
            "name": "json",
            "safety_parameters": {"max_altitude_feet": 10, "emergency_land_battery_percent": 20}
        },
        "commands": [
            {"id": 1, "type": "TAKEOFF", "parameters": {"target_altitude_feet": 3, "climb_rate_fps": 1, "stabilization_time_seconds": 0}}
        ]
    })"));

    REQUIRE(mission.name == "json");
    REQUIRE(mission.commands.size() == 1);
    REQUIRE(mission.telemetry.update_rate_hz == 10.0);
    REQUIRE(mission.telemetry.real_time_display);
}

TEST_CASE("Malformed mission documents name the offending field") {
    REQUIRE_THROWS_WITH(
        parse_mission(YAML::Load("commands: []\n")),
        Catch::Contains("'mission'")
    );
    REQUIRE_THROWS_WITH(
        parse_mission(YAML::Load(R"(
mission:
  name: bad
  safety_parameters: {max_altitude_feet: high, emergency_land_battery_percent: 20}
commands: []
)")),
        Catch::Contains("mission.safety_parameters.max_altitude_feet")
    );
    REQUIRE_THROWS_WITH(
        parse_mission(YAML::Load(R"(
mission:
  name: bad
  safety_parameters: {max_altitude_feet: 10, emergency_land_battery_percent: 20}
commands:
  - {type: HOVER}
)")),
        Catch::Contains("commands[0].id")
    );
    REQUIRE_THROWS_AS(
        parse_mission(YAML::Load(R"(
mission:
  name: bad
  safety_parameters: {max_altitude_feet: 10, emergency_land_battery_percent: 20}
commands:
  - {id: 1, type: YAW_SPIN}
)")),
        UnsupportedCommandError
    );
}

TEST_CASE("Vehicle documents keep scalar specifications and capabilities") {
    const VehicleProfile vehicle = parse_vehicle(YAML::Load(k_vehicle_yaml));

    REQUIRE(vehicle.model == "Cetus Lite Beta FPV");
    REQUIRE(vehicle.manufacturer == "BetaFPV");
    REQUIRE(vehicle.motor_count() == 4);
    REQUIRE(find_number(vehicle.specifications, "weight_grams") == 35.0);
    REQUIRE(vehicle.specifications.count("video_system") == 0);
    REQUIRE(vehicle.has_capability("altitude_hold"));
    REQUIRE_FALSE(vehicle.has_capability("gps"));
    REQUIRE_FALSE(vehicle.has_capability("lidar"));

    REQUIRE_THROWS_AS(parse_vehicle(YAML::Load("drone: {manufacturer: nobody}\n")), ConfigError);
}

TEST_CASE("YamlConfigProvider resolves documents by id") {
    ScratchConfigRoot root{};
    root.write("missions/loop.yaml", k_mission_yaml);
    root.write("vehicles/cetus.yml", k_vehicle_yaml);
    root.write("missions/broken.json", "{\"mission\": [");

    YamlConfigProvider provider{root.path};
    REQUIRE(provider.load_mission("loop").commands.size() == 3);
    REQUIRE(provider.load_vehicle("cetus").model == "Cetus Lite Beta FPV");

    REQUIRE_THROWS_WITH(provider.load_mission("missing"), Catch::Contains("missing"));
    REQUIRE_THROWS_AS(provider.load_mission("broken"), ConfigError);
    REQUIRE_THROWS_AS(provider.load_vehicle(""), ConfigError);
}
