#pragma once

#include <string>
#include <vector>

#include "drone_mission/flight_mode.hpp"
#include "drone_mission/mission_definition.hpp"
#include "drone_mission/types.hpp"

namespace drone_mission {

/**
 * @brief Mutable vehicle state for a single mission run.
 *
 * Created fresh (Disarmed) at the start of a run, owned by the controller and
 * lent by reference to one phase executor at a time.
 */
struct DroneState final {
    Vector3 position{};                         /**< Local-frame position in feet; z >= 0. */
    Vector3 velocity{};                         /**< Velocity in feet per second. */
    int battery_percent{100};                   /**< Remaining charge, 0-100. */
    double battery_voltage{4.2};                /**< Cell voltage derived from battery_percent. */
    bool armed{};                               /**< Motors armed. */
    bool flying{};                              /**< Airborne. */
    FlightMode mode{FlightMode::Disarmed};      /**< Lifecycle mode. */
    int current_command_id{};                   /**< Id of the command being executed. */
    int mission_progress_percent{};             /**< 0-100; 100 only in a terminal mode. */
    double flight_time_s{};                     /**< Simulated elapsed time since arming. */
    std::vector<double> motor_temps_c{};        /**< Per-motor temperature. */
    int signal_strength_percent{100};           /**< Link quality, 0-100. */
    int gps_satellites{};                       /**< Zero for vehicles without positioning. */
};

/**
 * @brief Build the Disarmed start-of-mission state for @p vehicle.
 *
 * @param vehicle Supplies the motor count and GPS capability.
 * @param ambient_temp_c Starting temperature for every motor.
 */
[[nodiscard]] DroneState make_initial_state(const VehicleProfile& vehicle, double ambient_temp_c);

/** @brief Mean of the motor temperatures (ambient 0 when there are none). */
[[nodiscard]] double average_motor_temp_c(const DroneState& state) noexcept;

/** @brief Multi-line human-readable status report for operators. */
[[nodiscard]] std::string format_status_report(const DroneState& state);

}  // namespace drone_mission
