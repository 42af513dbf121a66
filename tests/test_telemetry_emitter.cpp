#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "drone_mission/telemetry_bus.hpp"
#include "drone_mission/telemetry_emitter.hpp"

using namespace drone_mission;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_mission::test::ensure_logger_initialized();
    return true;
}();

DroneState state_at(double x, double y, double z) {
    DroneState state{};
    state.position = Vector3{x, y, z};
    state.velocity = Vector3{3.0, 0.0, 4.0};
    state.motor_temps_c = {30.0, 32.0, 34.0, 36.0};
    state.mode = FlightMode::Hover;
    return state;
}
}  // namespace

TEST_CASE("Emitter forwards snapshots and tracks the flight path") {
    TelemetryBus bus{};
    TelemetryEmitter emitter{TelemetryConfig{}, bus};

    emitter.emit(state_at(0.0, 0.0, 0.0), "CLIMB");
    emitter.emit(state_at(0.0, 0.0, 4.0), "CLIMB");
    emitter.emit(state_at(3.0, 0.0, 0.0), "HOVER");

    REQUIRE(emitter.snapshot_count() == 3);
    REQUIRE(emitter.forwarded_count() == 3);
    REQUIRE(emitter.distance_flown_ft() == Approx(9.0));
    REQUIRE(emitter.peak_altitude_ft() == 4.0);
    REQUIRE(emitter.last_snapshot().has_value());
    REQUIRE(emitter.last_snapshot()->phase_label == "HOVER");

    const std::vector<TelemetrySnapshot> snapshots = bus.drain();
    REQUIRE(snapshots.size() == 3);
    REQUIRE(snapshots[1].speed_fps == Approx(5.0));
    REQUIRE(snapshots[1].average_motor_temp_c == Approx(33.0));
    REQUIRE(bus.pending() == 0);
}

TEST_CASE("Emitter keeps tracking when real-time display is off") {
    TelemetryConfig config{};
    config.real_time_display = false;
    TelemetryBus bus{};
    TelemetryEmitter emitter{config, bus};

    emitter.emit(state_at(0.0, 0.0, 2.0), "HOVER");
    REQUIRE(emitter.snapshot_count() == 1);
    REQUIRE(emitter.forwarded_count() == 0);
    REQUIRE(emitter.peak_altitude_ft() == 2.0);
    REQUIRE_FALSE(bus.try_consume().has_value());
}

TEST_CASE("Emitter requires a positive update rate") {
    TelemetryConfig config{};
    config.update_rate_hz = 0.0;
    TelemetryBus bus{};
    REQUIRE_THROWS_AS(TelemetryEmitter(config, bus), std::invalid_argument);
}

TEST_CASE("Snapshot lines honor the requested data points") {
    TelemetrySnapshot snapshot{};
    snapshot.phase_label = "CIRCLE (40%)";
    snapshot.state = state_at(1.0, 2.0, 10.0);
    snapshot.state.battery_percent = 64;
    snapshot.state.battery_voltage = 3.77;
    snapshot.state.flight_time_s = 12.3;
    snapshot.speed_fps = 5.0;
    snapshot.average_motor_temp_c = 33.0;

    const std::string full = format_snapshot(snapshot, {});
    REQUIRE(full.rfind("[CIRCLE (40%)] T:12.3s", 0) == 0);
    REQUIRE(full.find("Pos:(1.00, 2.00, 10.00)") != std::string::npos);
    REQUIRE(full.find("Bat:64% (3.77V)") != std::string::npos);
    REQUIRE(full.find("Mode:HOVER") != std::string::npos);
    REQUIRE(full.find("Sats:0") != std::string::npos);

    const std::string trimmed = format_snapshot(snapshot, {"altitude", "battery"});
    REQUIRE(trimmed == "[CIRCLE (40%)] | Alt:10.00ft | Bat:64% (3.77V)");
}
