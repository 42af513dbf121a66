#include "drone_mission/ascend_executor.hpp"

#include <algorithm>
#include <cmath>

namespace drone_mission {

AscendExecutor::AscendExecutor(AscendParams params)
    : params_(params) {}

PhaseResult AscendExecutor::execute(DroneState& state, PhaseContext& context) {
    PhaseResult result{};
    const EngineConfig& config = context.vehicle.config();

    state.flying = true;
    transition_mode(state, FlightMode::Ascend);

    const double start_altitude_ft = state.position.z;
    const double delta_ft = params_.target_altitude_ft - start_altitude_ft;
    const double direction = delta_ft >= 0.0 ? 1.0 : -1.0;
    std::size_t ramp_ticks = ticks_for(std::abs(delta_ft) / params_.climb_rate_fps, context.update_rate_hz);
    if (ramp_ticks == 0 && delta_ft != 0.0) {
        ramp_ticks = 1;
    }
    const std::string label = direction > 0.0 ? "CLIMB" : "DESCENT RAMP";

    for (std::size_t tick = 0; tick < ramp_ticks; ++tick) {
        const bool final_tick = tick + 1 == ramp_ticks;
        const double fraction = static_cast<double>(tick + 1) / static_cast<double>(ramp_ticks);
        state.position.z = final_tick ? params_.target_altitude_ft : std::max(0.0, start_altitude_ft + delta_ft * fraction);
        state.velocity = Vector3{0.0, 0.0, direction * params_.climb_rate_fps};

        context.vehicle.drain_battery(state, config.battery.climb_drain_per_tick);
        context.vehicle.heat_motors(state, config.thermal.climb_heating_c);
        if (!complete_tick(state, context, label, result)) {
            return result;
        }
    }

    state.position.z = params_.target_altitude_ft;
    state.velocity = Vector3{};
    transition_mode(state, FlightMode::Stabilizing);
    if (!dwell(state, context, params_.stabilization_time_s, "STABILIZE", result)) {
        return result;
    }

    transition_mode(state, FlightMode::Hover);
    return result;
}

}  // namespace drone_mission
