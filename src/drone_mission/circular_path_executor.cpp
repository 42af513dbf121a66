#include "drone_mission/circular_path_executor.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include <fmt/format.h>

#include "drone_mission/logging.hpp"

namespace drone_mission {

CircularPathExecutor::CircularPathExecutor(CircularPathParams params)
    : params_(params) {}

PhaseResult CircularPathExecutor::execute(DroneState& state, PhaseContext& context) {
    PhaseResult result{};
    const EngineConfig& config = context.vehicle.config();
    const double rate_hz = context.update_rate_hz;

    transition_mode(state, FlightMode::Circle);
    if (params_.altitude_ft.has_value()) {
        state.position.z = std::max(0.0, *params_.altitude_ft);
    }

    const double circumference_ft = 2.0 * std::numbers::pi * params_.radius_ft * params_.revolutions;
    const double total_time_s = circumference_ft / params_.speed_fps;
    const std::size_t total_ticks = std::max<std::size_t>(1, ticks_for(total_time_s, rate_hz));
    const double sign = params_.direction == CircleDirection::Clockwise ? -1.0 : 1.0;
    const double angle_step = sign * 2.0 * std::numbers::pi * params_.revolutions / static_cast<double>(total_ticks);
    const double angular_rate = angle_step * rate_hz;

    get_logger()->info(
        "Circle radius {:.1f}ft, circumference {:.1f}ft over {:.1f}s ({} ticks)",
        params_.radius_ft,
        circumference_ft,
        total_time_s,
        total_ticks
    );

    if (params_.smooth_entry && !dwell(state, context, config.smooth_entry_s, "CIRCLE ENTRY", result)) {
        return result;
    }

    const double center_x = state.position.x;
    const double center_y = state.position.y;

    for (std::size_t tick = 0; tick < total_ticks; ++tick) {
        const double angle = static_cast<double>(tick) * angle_step;
        state.position.x = center_x + params_.radius_ft * std::cos(angle);
        state.position.y = center_y + params_.radius_ft * std::sin(angle);
        state.velocity = Vector3{
            -params_.radius_ft * std::sin(angle) * angular_rate,
            params_.radius_ft * std::cos(angle) * angular_rate,
            0.0,
        };

        context.vehicle.drain_on_interval(state, tick, config.battery.maneuver_drain_interval_ticks);
        context.vehicle.heat_motors(state, config.thermal.maneuver_heating_c);

        const int progress = static_cast<int>((static_cast<double>(tick + 1) / static_cast<double>(total_ticks)) * 100.0);
        if (!complete_tick(state, context, fmt::format("CIRCLE ({}%)", progress), result)) {
            return result;
        }
    }

    state.position.x = center_x;
    state.position.y = center_y;
    state.velocity = Vector3{};
    transition_mode(state, FlightMode::Hover);
    return result;
}

}  // namespace drone_mission
