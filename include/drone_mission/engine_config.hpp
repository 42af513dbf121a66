// === Engine Configuration ====================================================
//
// Explicit tuning bundle handed to MissionController at construction. Holds
// the simplified power, thermal and link models plus the timing of the
// dwell sub-phases. There is no process-wide copy; every controller owns its
// own value.

#pragma once

#include <cstdint>

namespace drone_mission {

/**
 * @brief Integer battery drain cadence per maneuver class.
 */
struct BatteryModel final {
    int climb_drain_per_tick{1};        /**< Percent drained on every tick of an active ramp. */
    int hover_drain_interval_ticks{20}; /**< Hold/dwell: drain 1% every N ticks. */
    int maneuver_drain_interval_ticks{15}; /**< CircularPath: drain 1% every N ticks. */
    int descent_drain_interval_ticks{30};  /**< Descent and final approach: drain 1% every N ticks. */
    double empty_voltage{3.0};          /**< Cell voltage at 0%. */
    double voltage_span{1.2};           /**< Added voltage at 100%. */
};

/**
 * @brief Motor heating and cooling model.
 */
struct ThermalModel final {
    double ambient_c{25.0};             /**< Starting and floor temperature. */
    double max_c{65.0};                 /**< Hard ceiling for any motor. */
    double climb_heating_c{0.5};        /**< Per-tick rise while ramping. */
    double maneuver_heating_c{0.1};     /**< Per-tick rise while circling. */
    double hover_heating_c{0.02};       /**< Per-tick rise while holding. */
    double shutdown_cooldown_c{5.0};    /**< Drop applied once the vehicle stops flying. */
};

/**
 * @brief Deterministic link-quality model with an optional seeded jitter layer.
 */
struct LinkModel final {
    double signal_loss_percent_per_ft{0.5}; /**< Loss per foot of horizontal distance from launch. */
    double jitter_percent{0.0};             /**< Uniform +/- jitter amplitude; 0 disables the RNG. */
    int nominal_gps_satellites{12};         /**< Reported when the vehicle advertises gps. */
};

/**
 * @brief Complete engine tuning.
 */
struct EngineConfig final {
    BatteryModel battery{};
    ThermalModel thermal{};
    LinkModel link{};
    double smooth_entry_s{1.0};                 /**< Settle time before a smooth-entry circle. */
    double precision_centering_s{3.0};          /**< Duration of the precision-landing centering sub-phase. */
    double precision_centering_factor{0.7};     /**< Remaining distance-to-home fraction per second of centering. */
    double touchdown_tolerance_ft{0.1};         /**< Height treated as ground contact. */
    double inter_command_settle_s{0.5};         /**< Pause between consecutive commands. */
    std::uint32_t noise_seed{42};               /**< Seed for the jitter layer. */
};

}  // namespace drone_mission
