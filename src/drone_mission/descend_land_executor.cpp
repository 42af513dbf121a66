#include "drone_mission/descend_land_executor.hpp"

#include <algorithm>
#include <cmath>

#include "drone_mission/logging.hpp"

namespace drone_mission {

DescendAndLandExecutor::DescendAndLandExecutor(DescendAndLandParams params)
    : params_(params) {}

PhaseResult DescendAndLandExecutor::execute(DroneState& state, PhaseContext& context) {
    PhaseResult result{};
    const EngineConfig& config = context.vehicle.config();
    const double rate_hz = context.update_rate_hz;
    const int drain_interval = config.battery.descent_drain_interval_ticks;
    std::size_t drain_tick = 0;

    transition_mode(state, FlightMode::Descending);

    if (params_.precision_landing && !center_over_home(state, context, result, drain_tick)) {
        return result;
    }

    const double descent_step_ft = params_.descent_rate_fps / rate_hz;
    const std::size_t descent_ticks = ticks_for((state.position.z - params_.final_approach_height_ft) / params_.descent_rate_fps, rate_hz);
    for (std::size_t tick = 0; tick < descent_ticks; ++tick) {
        const bool final_tick = tick + 1 == descent_ticks;
        state.position.z = final_tick ? params_.final_approach_height_ft : std::max(params_.final_approach_height_ft, state.position.z - descent_step_ft);
        state.velocity = Vector3{0.0, 0.0, -params_.descent_rate_fps};
        context.vehicle.drain_on_interval(state, drain_tick++, drain_interval);
        if (!complete_tick(state, context, "DESCENT", result)) {
            return result;
        }
    }

    transition_mode(state, FlightMode::FinalApproach);
    const double touchdown_step_ft = params_.touchdown_speed_fps / rate_hz;
    const std::size_t approach_ticks = std::max<std::size_t>(
        1,
        ticks_for((state.position.z - config.touchdown_tolerance_ft) / params_.touchdown_speed_fps, rate_hz)
    );
    for (std::size_t tick = 0; tick < approach_ticks; ++tick) {
        const bool touchdown = tick + 1 == approach_ticks;
        if (touchdown) {
            state.position.z = 0.0;
            state.velocity = Vector3{};
            state.flying = false;
            transition_mode(state, FlightMode::Landed);
            context.vehicle.cool_motors(state);
        } else {
            state.position.z = std::max(0.0, state.position.z - touchdown_step_ft);
            state.velocity = Vector3{0.0, 0.0, -params_.touchdown_speed_fps};
        }
        context.vehicle.drain_on_interval(state, drain_tick++, drain_interval);
        if (!complete_tick(state, context, touchdown ? "LANDED" : "FINAL", result)) {
            return result;
        }
    }

    get_logger()->info("Touchdown at ({:.2f}, {:.2f}) after {} ticks", state.position.x, state.position.y, result.tick_count);
    return result;
}

bool DescendAndLandExecutor::center_over_home(DroneState& state, PhaseContext& context, PhaseResult& result, std::size_t& drain_tick) {
    const EngineConfig& config = context.vehicle.config();
    const double rate_hz = context.update_rate_hz;
    const std::size_t centering_ticks = ticks_for(config.precision_centering_s, rate_hz);
    const double per_tick_factor = std::pow(config.precision_centering_factor, 1.0 / rate_hz);

    for (std::size_t tick = 0; tick < centering_ticks; ++tick) {
        const double previous_x = state.position.x;
        const double previous_y = state.position.y;
        state.position.x *= per_tick_factor;
        state.position.y *= per_tick_factor;
        state.velocity = Vector3{(state.position.x - previous_x) * rate_hz, (state.position.y - previous_y) * rate_hz, 0.0};
        context.vehicle.drain_on_interval(state, drain_tick++, config.battery.descent_drain_interval_ticks);
        if (!complete_tick(state, context, "POSITION", result)) {
            return false;
        }
    }
    state.velocity = Vector3{};
    return true;
}

}  // namespace drone_mission
