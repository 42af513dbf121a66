// === Flight Mode =============================================================
//
// Lifecycle modes reported in DroneState plus the transition table every
// executor and the controller go through when they change mode.

#pragma once

#include <string_view>

namespace drone_mission {

struct DroneState;

/**
 * @brief Enumerates the lifecycle modes of a simulated vehicle.
 */
enum class FlightMode {
    Disarmed,         /**< Initial mode; motors locked. */
    Armed,            /**< Motors armed on the ground, mission clock running. */
    Ascend,           /**< Ramping toward a commanded altitude. */
    Stabilizing,      /**< Settling after an altitude ramp. */
    Hover,            /**< Airborne and holding position. */
    Circle,           /**< Flying a circular path. */
    Descending,       /**< Main descent toward the final-approach height. */
    FinalApproach,    /**< Slow descent to touchdown. */
    Landed,           /**< On the ground after a landing. */
    MissionComplete,  /**< Terminal: every command executed. */
    Aborted           /**< Terminal: a safety check halted the mission. */
};

/** @brief Upper-case name for @p mode as shown in telemetry and reports. */
[[nodiscard]] std::string_view to_string(FlightMode mode) noexcept;

/** @brief True for MissionComplete and Aborted. */
[[nodiscard]] bool is_terminal(FlightMode mode) noexcept;

/** @brief True when @p from may move to @p to (self-transitions are allowed). */
[[nodiscard]] bool is_transition_allowed(FlightMode from, FlightMode to) noexcept;

/**
 * @brief Move @p state into @p next.
 *
 * @throws std::logic_error if the transition table forbids the move.
 */
void transition_mode(DroneState& state, FlightMode next);

}  // namespace drone_mission
