#include <memory>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "drone_mission/safety_gate.hpp"

using namespace drone_mission;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_mission::test::ensure_logger_initialized();
    return true;
}();

SafetyParameters limits() {
    SafetyParameters params{};
    params.max_altitude_ft = 15.0;
    params.max_horizontal_speed_fps = 5.0;
    params.emergency_land_battery_percent = 20;
    params.geofence_radius_ft = 10.0;
    return params;
}

class AlwaysFails final : public SafetyCheck {
  public:
    std::string_view name() const noexcept override {
        return "position_stability";
    }

    std::optional<std::string> evaluate(const DroneState&, const SafetyParameters&) const override {
        return std::string{"optical flow lost"};
    }
};
}  // namespace

TEST_CASE("battery_level fails strictly below the emergency threshold") {
    SafetyGate gate{};
    DroneState state{};

    state.battery_percent = 20;
    REQUIRE_FALSE(gate.check({"battery_level"}, state, limits()).has_value());

    state.battery_percent = 19;
    const auto violation = gate.check({"battery_level"}, state, limits());
    REQUIRE(violation.has_value());
    REQUIRE(violation->check_name == "battery_level");
    REQUIRE(violation->state_snapshot.battery_percent == 19);
    REQUIRE_FALSE(violation->reason.empty());
}

TEST_CASE("altitude_hold fails above the ceiling") {
    SafetyGate gate{};
    DroneState state{};
    state.position.z = 15.0;
    REQUIRE_FALSE(gate.check({"altitude_hold"}, state, limits()).has_value());

    state.position.z = 15.01;
    const auto violation = gate.check({"altitude_hold"}, state, limits());
    REQUIRE(violation.has_value());
    REQUIRE(violation->check_name == "altitude_hold");
}

TEST_CASE("speed_limit only considers horizontal speed") {
    SafetyGate gate{};
    DroneState state{};
    state.velocity = Vector3{3.0, 4.0, 10.0};
    REQUIRE_FALSE(gate.check({"speed_limit"}, state, limits()).has_value());

    state.velocity = Vector3{4.0, 4.0, 0.0};
    REQUIRE(gate.check({"speed_limit"}, state, limits()).has_value());

    SafetyParameters unlimited = limits();
    unlimited.max_horizontal_speed_fps = 0.0;
    REQUIRE_FALSE(gate.check({"speed_limit"}, state, unlimited).has_value());
}

TEST_CASE("Advisory checks pass regardless of state") {
    SafetyGate gate{};
    DroneState state{};
    state.position = Vector3{100.0, 100.0, 0.0};
    state.battery_percent = 0;
    REQUIRE_FALSE(gate.check({"geofence", "position_stability", "path_clear", "landing_zone_clear"}, state, limits()).has_value());
}

TEST_CASE("Checks run in order and stop at the first failure") {
    SafetyGate gate{};
    DroneState state{};
    state.battery_percent = 5;
    state.position.z = 30.0;

    const auto violation = gate.check({"path_clear", "altitude_hold", "battery_level"}, state, limits());
    REQUIRE(violation.has_value());
    REQUIRE(violation->check_name == "altitude_hold");
}

TEST_CASE("Unregistered checks fail closed") {
    SafetyGate gate{};
    REQUIRE_FALSE(gate.knows("wind_gauge"));
    REQUIRE(gate.knows("battery_level"));

    const auto violation = gate.check({"wind_gauge"}, DroneState{}, limits());
    REQUIRE(violation.has_value());
    REQUIRE(violation->check_name == "wind_gauge");
}

TEST_CASE("Registered checks replace built-ins with the same name") {
    SafetyGate gate{};
    gate.register_check(std::make_unique<AlwaysFails>());

    const auto violation = gate.check({"position_stability"}, DroneState{}, limits());
    REQUIRE(violation.has_value());
    REQUIRE(violation->reason == "optical flow lost");

    REQUIRE_THROWS_AS(gate.register_check(nullptr), std::invalid_argument);
}
