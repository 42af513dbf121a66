// === Vehicle Model ===========================================================
//
// Simplified power, thermal and link bookkeeping shared by every phase
// executor. One instance lives for a single mission run so the optional
// jitter generator is reseeded for every run.

#pragma once

#include <cstddef>
#include <random>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/engine_config.hpp"

namespace drone_mission {

/** @brief Applies the EngineConfig models to a DroneState. */
class VehicleModel final {
  public:
    VehicleModel(const EngineConfig& config, bool has_gps);

    /** @brief Drain @p percent of battery, clamped at 0, and refresh the voltage. */
    void drain_battery(DroneState& state, int percent) const;
    /** @brief Drain 1% when @p tick_index falls on @p interval_ticks. */
    void drain_on_interval(DroneState& state, std::size_t tick_index, int interval_ticks) const;
    /** @brief Raise every motor by @p rise_c, never past the thermal ceiling. */
    void heat_motors(DroneState& state, double rise_c) const;
    /** @brief Apply the shutdown cooldown; a no-op while the vehicle is flying. */
    void cool_motors(DroneState& state) const;
    /** @brief Recompute signal strength and satellite count from position. */
    void update_link(DroneState& state);

    [[nodiscard]] const EngineConfig& config() const noexcept;

  private:
    const EngineConfig& config_;
    bool has_gps_;
    std::mt19937 generator_;
};

}  // namespace drone_mission
