#include "drone_mission/phase_executor.hpp"

#include <cmath>

namespace drone_mission {

namespace {
constexpr double k_tick_rounding_epsilon{1e-9}; /**< Absorbs floating-point noise in seconds * rate products. */
}

std::size_t PhaseExecutor::ticks_for(double seconds, double rate_hz) noexcept {
    if (!(seconds > 0.0) || !(rate_hz > 0.0)) {
        return 0;
    }
    const double ticks = std::ceil(seconds * rate_hz - k_tick_rounding_epsilon);
    if (!(ticks < static_cast<double>(k_max_phase_ticks))) {
        return k_max_phase_ticks;
    }
    return static_cast<std::size_t>(ticks);
}

bool PhaseExecutor::complete_tick(DroneState& state, PhaseContext& context, const std::string& label, PhaseResult& result) {
    state.flight_time_s += context.tick_interval().count();
    context.vehicle.update_link(state);

    std::optional<SafetyViolation> optional_violation = context.gate.check(context.safety_checks, state, context.safety);
    if (optional_violation.has_value()) {
        result.violation = std::move(optional_violation);
        return false;
    }

    context.emitter.emit(state, label);
    ++result.tick_count;
    context.pacer.wait(context.tick_interval());
    return true;
}

bool PhaseExecutor::dwell(DroneState& state, PhaseContext& context, double seconds, const std::string& label, PhaseResult& result) {
    const std::size_t dwell_ticks = ticks_for(seconds, context.update_rate_hz);
    const EngineConfig& config = context.vehicle.config();
    for (std::size_t tick = 0; tick < dwell_ticks; ++tick) {
        state.velocity = Vector3{};
        context.vehicle.drain_on_interval(state, tick, config.battery.hover_drain_interval_ticks);
        context.vehicle.heat_motors(state, config.thermal.hover_heating_c);
        if (!complete_tick(state, context, label, result)) {
            return false;
        }
    }
    return true;
}

}  // namespace drone_mission
