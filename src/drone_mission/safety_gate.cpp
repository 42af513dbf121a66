#include "drone_mission/safety_gate.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace drone_mission {

namespace {

class BatteryLevelCheck final : public SafetyCheck {
  public:
    std::string_view name() const noexcept override {
        return "battery_level";
    }

    std::optional<std::string> evaluate(const DroneState& state, const SafetyParameters& params) const override {
        if (state.battery_percent < params.emergency_land_battery_percent) {
            return fmt::format("battery {}% below emergency threshold {}%", state.battery_percent, params.emergency_land_battery_percent);
        }
        return std::nullopt;
    }
};

class AltitudeHoldCheck final : public SafetyCheck {
  public:
    std::string_view name() const noexcept override {
        return "altitude_hold";
    }

    std::optional<std::string> evaluate(const DroneState& state, const SafetyParameters& params) const override {
        if (state.position.z > params.max_altitude_ft) {
            return fmt::format("altitude {:.2f}ft exceeds limit {:.2f}ft", state.position.z, params.max_altitude_ft);
        }
        return std::nullopt;
    }
};

/** @brief Enforces max_horizontal_speed; a zero limit disables the check. */
class SpeedLimitCheck final : public SafetyCheck {
  public:
    std::string_view name() const noexcept override {
        return "speed_limit";
    }

    std::optional<std::string> evaluate(const DroneState& state, const SafetyParameters& params) const override {
        const double horizontal_speed = state.velocity.horizontal_magnitude();
        if (params.max_horizontal_speed_fps > 0.0 && horizontal_speed > params.max_horizontal_speed_fps) {
            return fmt::format("horizontal speed {:.2f}fps exceeds limit {:.2f}fps", horizontal_speed, params.max_horizontal_speed_fps);
        }
        return std::nullopt;
    }
};

/** @brief Geofence is advisory: leaving it is logged but never aborts. */
class GeofenceCheck final : public SafetyCheck {
  public:
    explicit GeofenceCheck(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    std::string_view name() const noexcept override {
        return "geofence";
    }

    std::optional<std::string> evaluate(const DroneState& state, const SafetyParameters& params) const override {
        const double distance_ft = state.position.horizontal_magnitude();
        if (params.geofence_radius_ft > 0.0 && distance_ft > params.geofence_radius_ft) {
            logger_->warn("Vehicle {:.1f}ft from launch, outside advisory geofence of {:.1f}ft", distance_ft, params.geofence_radius_ft);
        }
        return std::nullopt;
    }

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Placeholder for sensor-backed checks the simulation cannot observe. */
class AdvisoryCheck final : public SafetyCheck {
  public:
    explicit AdvisoryCheck(std::string name)
        : str_name_(std::move(name)) {}

    std::string_view name() const noexcept override {
        return str_name_;
    }

    std::optional<std::string> evaluate(const DroneState&, const SafetyParameters&) const override {
        return std::nullopt;
    }

  private:
    std::string str_name_;
};

}  // namespace

SafetyGate::SafetyGate()
    : logger_(get_logger()) {
    register_check(std::make_unique<BatteryLevelCheck>());
    register_check(std::make_unique<AltitudeHoldCheck>());
    register_check(std::make_unique<SpeedLimitCheck>());
    register_check(std::make_unique<GeofenceCheck>(logger_));
    register_check(std::make_unique<AdvisoryCheck>("position_stability"));
    register_check(std::make_unique<AdvisoryCheck>("path_clear"));
    register_check(std::make_unique<AdvisoryCheck>("landing_zone_clear"));
}

void SafetyGate::register_check(std::unique_ptr<SafetyCheck> check) {
    if (check == nullptr) {
        throw std::invalid_argument("SafetyGate cannot register a null check");
    }
    std::string name{check->name()};
    if (name.empty()) {
        throw std::invalid_argument("SafetyGate checks require a name");
    }
    map_checks_[std::move(name)] = std::move(check);
}

bool SafetyGate::knows(std::string_view name) const {
    return map_checks_.find(name) != map_checks_.end();
}

std::optional<SafetyViolation> SafetyGate::check(
    const std::vector<std::string>& names,
    const DroneState& state,
    const SafetyParameters& params
) const {
    for (const std::string& name : names) {
        const auto iterator_check = map_checks_.find(name);
        if (iterator_check == map_checks_.end()) {
            logger_->error("Safety check {} is not registered", name);
            return SafetyViolation{name, "unknown safety check", state};
        }

        std::optional<std::string> optional_reason = iterator_check->second->evaluate(state, params);
        if (optional_reason.has_value()) {
            logger_->warn("Safety check {} failed: {}", name, optional_reason.value());
            return SafetyViolation{name, std::move(optional_reason.value()), state};
        }
    }
    return std::nullopt;
}

}  // namespace drone_mission
