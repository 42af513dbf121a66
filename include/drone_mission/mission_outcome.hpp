// === Mission Outcome =========================================================
//
// Terminal result of a mission run. Every failure the engine can detect is
// reported here rather than thrown to the caller.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/safety_gate.hpp"

namespace drone_mission {

/**
 * @brief Enumerates how a mission run ended.
 */
enum class OutcomeKind {
    Success,             /**< Every command executed. */
    Aborted,             /**< A safety check halted the mission. */
    PreflightFailed,     /**< Refused before arming; no state transitions occurred. */
    ConfigInvalid,       /**< Mission or vehicle data missing or malformed. */
    UnsupportedCommand   /**< A command kind outside the supported set. */
};

[[nodiscard]] std::string_view to_string(OutcomeKind kind) noexcept;

/** @brief Flight statistics gathered by the telemetry emitter. */
struct MissionSummary final {
    double flight_time_s{};
    int final_battery_percent{};
    double final_battery_voltage{};
    double distance_flown_ft{};
    double peak_altitude_ft{};
    std::size_t telemetry_count{};
};

/** @brief Result of MissionController::execute. */
struct MissionOutcome final {
    OutcomeKind kind{OutcomeKind::Success};
    std::string reason{};                        /**< Check name for aborts, diagnostic otherwise. */
    std::optional<SafetyViolation> violation{};  /**< Populated for Aborted. */
    DroneState final_state{};
    std::size_t commands_completed{};
    MissionSummary summary{};

    [[nodiscard]] bool succeeded() const noexcept {
        return kind == OutcomeKind::Success;
    }
};

}  // namespace drone_mission
