#include <limits>
#include <string>
#include <variant>

#include <catch2/catch.hpp>

#include "mission_fixtures.hpp"
#include "drone_mission/command_parameters.hpp"
#include "drone_mission/errors.hpp"

using namespace drone_mission;
using namespace drone_mission::test;

TEST_CASE("Command kinds accept engine and legacy names") {
    REQUIRE(command_kind_from_string("TAKEOFF") == CommandKind::Ascend);
    REQUIRE(command_kind_from_string("ascend") == CommandKind::Ascend);
    REQUIRE(command_kind_from_string("Hover") == CommandKind::Hold);
    REQUIRE(command_kind_from_string("CIRCLE") == CommandKind::CircularPath);
    REQUIRE(command_kind_from_string("circular_path") == CommandKind::CircularPath);
    REQUIRE(command_kind_from_string("LAND") == CommandKind::DescendAndLand);
    REQUIRE(command_kind_from_string("DESCEND_AND_LAND") == CommandKind::DescendAndLand);
}

TEST_CASE("Unsupported command kinds report the offending name") {
    try {
        (void)command_kind_from_string("BARREL_ROLL");
        FAIL("expected UnsupportedCommandError");
    } catch (const UnsupportedCommandError& error) {
        REQUIRE(error.kind() == "BARREL_ROLL");
    }
    REQUIRE_THROWS_AS(command_kind_from_string(""), ConfigError);
}

TEST_CASE("Ascend parameters resolve from the parameter bag") {
    const PhasePlan plan = resolve_phase_plan(ascend_command(1, 10.0, 2.0, 1.5));
    const auto* params = std::get_if<AscendParams>(&plan);
    REQUIRE(params != nullptr);
    REQUIRE(params->target_altitude_ft == 10.0);
    REQUIRE(params->climb_rate_fps == 2.0);
    REQUIRE(params->stabilization_time_s == 1.5);
}

TEST_CASE("Optional parameters fall back to defaults") {
    const PhasePlan hold = resolve_phase_plan(hold_command(2, 5.0, true));
    REQUIRE(std::get<HoldParams>(hold).altitude_tolerance_ft == 0.5);
    REQUIRE(std::get<HoldParams>(hold).position_hold);

    const PhasePlan circle = resolve_phase_plan(make_command(3, CommandKind::CircularPath, {{"radius_feet", 4.0}, {"speed_fps", 2.0}, {"direction", std::string{"ccw"}}}));
    const auto& circle_params = std::get<CircularPathParams>(circle);
    REQUIRE(circle_params.direction == CircleDirection::CounterClockwise);
    REQUIRE(circle_params.revolutions == 1.0);
    REQUIRE(circle_params.smooth_entry);
    REQUIRE_FALSE(circle_params.altitude_ft.has_value());

    const PhasePlan land = resolve_phase_plan(land_command(4, 1.0, false));
    REQUIRE(std::get<DescendAndLandParams>(land).final_approach_height_ft == 1.0);
    REQUIRE(std::get<DescendAndLandParams>(land).touchdown_speed_fps == 0.2);
}

TEST_CASE("Invalid parameters are configuration errors") {
    SECTION("missing required value") {
        CommandSpec command = land_command(4, 1.0, false);
        command.parameters.erase("precision_landing");
        REQUIRE_THROWS_AS(resolve_phase_plan(command), ConfigError);
    }
    SECTION("wrong type") {
        CommandSpec command = hold_command(2, 5.0, true);
        command.parameters["duration_seconds"] = std::string{"five"};
        REQUIRE_THROWS_AS(resolve_phase_plan(command), ConfigError);
    }
    SECTION("non-positive rate") {
        REQUIRE_THROWS_AS(resolve_phase_plan(ascend_command(1, 10.0, 0.0, 1.0)), ConfigError);
    }
    SECTION("infinite altitude") {
        REQUIRE_THROWS_WITH(
            resolve_phase_plan(ascend_command(1, std::numeric_limits<double>::infinity(), 2.0, 1.0)),
            Catch::Contains("target_altitude_feet") && Catch::Contains("finite")
        );
    }
    SECTION("NaN duration") {
        REQUIRE_THROWS_AS(resolve_phase_plan(hold_command(2, std::numeric_limits<double>::quiet_NaN(), true)), ConfigError);
    }
    SECTION("infinite optional parameter") {
        CommandSpec command = land_command(4, 1.0, false);
        command.parameters["final_approach_height_feet"] = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(resolve_phase_plan(command), ConfigError);
    }
    SECTION("unknown direction") {
        REQUIRE_THROWS_WITH(
            resolve_phase_plan(circle_command(3, 6.0, 1.0, "sideways", 1.0)),
            Catch::Contains("command 3") && Catch::Contains("sideways")
        );
    }
}

TEST_CASE("Circle directions accept common spellings") {
    REQUIRE(circle_direction_from_string("Clockwise") == CircleDirection::Clockwise);
    REQUIRE(circle_direction_from_string("CW") == CircleDirection::Clockwise);
    REQUIRE(circle_direction_from_string("counter_clockwise") == CircleDirection::CounterClockwise);
    REQUIRE(circle_direction_from_string("counterclockwise") == CircleDirection::CounterClockwise);
}
