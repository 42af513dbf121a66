#include "drone_mission/vehicle_model.hpp"

#include <algorithm>
#include <cmath>

namespace drone_mission {

namespace {
constexpr double k_percent_scale{100.0}; /**< Conversion factor between fractional and percentage representations. */
}

VehicleModel::VehicleModel(const EngineConfig& config, bool has_gps)
    : config_(config),
      has_gps_(has_gps),
      generator_(config.noise_seed) {}

void VehicleModel::drain_battery(DroneState& state, int percent) const {
    if (percent > 0) {
        state.battery_percent = std::max(0, state.battery_percent - percent);
    }
    state.battery_percent = std::clamp(state.battery_percent, 0, 100);
    state.battery_voltage = config_.battery.empty_voltage
        + (static_cast<double>(state.battery_percent) / k_percent_scale) * config_.battery.voltage_span;
}

void VehicleModel::drain_on_interval(DroneState& state, std::size_t tick_index, int interval_ticks) const {
    if (interval_ticks <= 0) {
        return;
    }
    if (tick_index % static_cast<std::size_t>(interval_ticks) == 0) {
        drain_battery(state, 1);
    }
}

void VehicleModel::heat_motors(DroneState& state, double rise_c) const {
    for (double& temp : state.motor_temps_c) {
        temp = std::min(config_.thermal.max_c, temp + rise_c);
    }
}

void VehicleModel::cool_motors(DroneState& state) const {
    if (state.flying) {
        return;
    }
    for (double& temp : state.motor_temps_c) {
        temp = std::max(config_.thermal.ambient_c, std::min(config_.thermal.max_c, temp - config_.thermal.shutdown_cooldown_c));
    }
}

void VehicleModel::update_link(DroneState& state) {
    const double distance_ft = state.position.horizontal_magnitude();
    double signal = k_percent_scale - distance_ft * config_.link.signal_loss_percent_per_ft;
    if (config_.link.jitter_percent > 0.0) {
        std::uniform_real_distribution<double> jitter(-config_.link.jitter_percent, config_.link.jitter_percent);
        signal += jitter(generator_);
    }
    state.signal_strength_percent = static_cast<int>(std::lround(std::clamp(signal, 0.0, k_percent_scale)));
    state.gps_satellites = has_gps_ ? config_.link.nominal_gps_satellites : 0;
}

const EngineConfig& VehicleModel::config() const noexcept {
    return config_;
}

}  // namespace drone_mission
