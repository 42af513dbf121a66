#include <stdexcept>

#include <catch2/catch.hpp>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/flight_mode.hpp"

using namespace drone_mission;

TEST_CASE("Nominal mission lifecycle follows the transition table") {
    DroneState state{};
    REQUIRE(state.mode == FlightMode::Disarmed);

    for (const FlightMode next : {FlightMode::Armed,
                                  FlightMode::Ascend,
                                  FlightMode::Stabilizing,
                                  FlightMode::Hover,
                                  FlightMode::Circle,
                                  FlightMode::Hover,
                                  FlightMode::Descending,
                                  FlightMode::FinalApproach,
                                  FlightMode::Landed,
                                  FlightMode::MissionComplete}) {
        REQUIRE_NOTHROW(transition_mode(state, next));
    }
    REQUIRE(state.mode == FlightMode::MissionComplete);
}

TEST_CASE("Illegal transitions are rejected") {
    DroneState state{};
    REQUIRE_THROWS_AS(transition_mode(state, FlightMode::Ascend), std::logic_error);
    REQUIRE(state.mode == FlightMode::Disarmed);

    REQUIRE_FALSE(is_transition_allowed(FlightMode::Ascend, FlightMode::Circle));
    REQUIRE_FALSE(is_transition_allowed(FlightMode::Descending, FlightMode::Hover));
    REQUIRE_FALSE(is_transition_allowed(FlightMode::Circle, FlightMode::Descending));
    REQUIRE(is_transition_allowed(FlightMode::Landed, FlightMode::Ascend));
    REQUIRE(is_transition_allowed(FlightMode::Hover, FlightMode::Hover));
}

TEST_CASE("Any active mode may abort but terminal modes are final") {
    REQUIRE(is_transition_allowed(FlightMode::Circle, FlightMode::Aborted));
    REQUIRE(is_transition_allowed(FlightMode::FinalApproach, FlightMode::Aborted));
    REQUIRE(is_transition_allowed(FlightMode::Disarmed, FlightMode::Aborted));

    REQUIRE(is_terminal(FlightMode::Aborted));
    REQUIRE(is_terminal(FlightMode::MissionComplete));
    REQUIRE_FALSE(is_terminal(FlightMode::Landed));
    REQUIRE_FALSE(is_transition_allowed(FlightMode::Aborted, FlightMode::Armed));
    REQUIRE_FALSE(is_transition_allowed(FlightMode::MissionComplete, FlightMode::Aborted));
}

TEST_CASE("Flight modes render with telemetry names") {
    REQUIRE(to_string(FlightMode::FinalApproach) == "FINAL_APPROACH");
    REQUIRE(to_string(FlightMode::MissionComplete) == "MISSION_COMPLETE");
    REQUIRE(to_string(FlightMode::Hover) == "HOVER");
}
