#include "drone_mission/hold_executor.hpp"

#include <algorithm>
#include <cmath>

namespace drone_mission {

namespace {
constexpr double k_drift_phase_rate{0.1};           /**< Radians of drift phase per tick (horizontal). */
constexpr double k_altitude_phase_rate{0.05};       /**< Radians of drift phase per tick (vertical). */
constexpr double k_drift_x_amplitude_ft{0.1};
constexpr double k_drift_y_amplitude_ft{0.2};
constexpr double k_altitude_drift_ratio{0.1};       /**< Vertical drift as a fraction of the altitude tolerance. */
constexpr double k_position_hold_damping{0.25};     /**< Amplitude scale while active correction is on. */
}  // namespace

HoldExecutor::HoldExecutor(HoldParams params)
    : params_(params) {}

PhaseResult HoldExecutor::execute(DroneState& state, PhaseContext& context) {
    PhaseResult result{};
    const EngineConfig& config = context.vehicle.config();

    transition_mode(state, FlightMode::Hover);

    const double anchor_altitude_ft = state.position.z;
    const double damping = params_.position_hold ? k_position_hold_damping : 1.0;
    const double rate_hz = context.update_rate_hz;
    const std::size_t hold_ticks = ticks_for(params_.duration_s, rate_hz);

    for (std::size_t tick = 0; tick < hold_ticks; ++tick) {
        const double step = static_cast<double>(tick);
        const Vector3 drift{
            std::sin(step * k_drift_phase_rate) * k_drift_x_amplitude_ft * damping,
            std::cos(step * k_drift_phase_rate) * k_drift_y_amplitude_ft * damping,
            std::cos(step * k_altitude_phase_rate) * params_.altitude_tolerance_ft * k_altitude_drift_ratio * damping,
        };

        const double previous_z = state.position.z;
        state.position.x += drift.x;
        state.position.y += drift.y;
        state.position.z = std::max(
            0.0,
            std::clamp(
                state.position.z + drift.z,
                anchor_altitude_ft - params_.altitude_tolerance_ft,
                anchor_altitude_ft + params_.altitude_tolerance_ft
            )
        );
        state.velocity = Vector3{drift.x * rate_hz, drift.y * rate_hz, (state.position.z - previous_z) * rate_hz};

        context.vehicle.drain_on_interval(state, tick, config.battery.hover_drain_interval_ticks);
        context.vehicle.heat_motors(state, config.thermal.hover_heating_c);
        if (!complete_tick(state, context, "HOVER", result)) {
            return result;
        }
    }

    state.velocity = Vector3{};
    return result;
}

}  // namespace drone_mission
