#include "drone_mission/command_parameters.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include "drone_mission/errors.hpp"

namespace drone_mission {

namespace {

std::string describe(const CommandSpec& command) {
    return "command " + std::to_string(command.id) + " (" + std::string{to_string(command.kind)} + ")";
}

double require_number(const CommandSpec& command, const std::string& key) {
    const std::optional<double> value = find_number(command.parameters, key);
    if (!value.has_value()) {
        throw ConfigError(describe(command) + " is missing numeric parameter '" + key + "'");
    }
    if (!std::isfinite(*value)) {
        throw ConfigError(describe(command) + " parameter '" + key + "' must be a finite number");
    }
    return *value;
}

bool require_bool(const CommandSpec& command, const std::string& key) {
    const std::optional<bool> value = find_bool(command.parameters, key);
    if (!value.has_value()) {
        throw ConfigError(describe(command) + " is missing boolean parameter '" + key + "'");
    }
    return *value;
}

void require_positive(const CommandSpec& command, const std::string& key, double value) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        throw ConfigError(describe(command) + " parameter '" + key + "' must be a finite positive number");
    }
}

void require_non_negative(const CommandSpec& command, const std::string& key, double value) {
    if (!std::isfinite(value) || !(value >= 0.0)) {
        throw ConfigError(describe(command) + " parameter '" + key + "' must be finite and not negative");
    }
}

AscendParams resolve_ascend(const CommandSpec& command) {
    AscendParams params{};
    params.target_altitude_ft = require_number(command, "target_altitude_feet");
    params.climb_rate_fps = require_number(command, "climb_rate_fps");
    params.stabilization_time_s = require_number(command, "stabilization_time_seconds");
    require_non_negative(command, "target_altitude_feet", params.target_altitude_ft);
    require_positive(command, "climb_rate_fps", params.climb_rate_fps);
    require_non_negative(command, "stabilization_time_seconds", params.stabilization_time_s);
    return params;
}

HoldParams resolve_hold(const CommandSpec& command) {
    HoldParams params{};
    params.duration_s = require_number(command, "duration_seconds");
    params.position_hold = require_bool(command, "position_hold");
    params.altitude_tolerance_ft = find_number(command.parameters, "altitude_tolerance_feet").value_or(params.altitude_tolerance_ft);
    require_positive(command, "duration_seconds", params.duration_s);
    require_non_negative(command, "altitude_tolerance_feet", params.altitude_tolerance_ft);
    return params;
}

CircularPathParams resolve_circular_path(const CommandSpec& command) {
    CircularPathParams params{};
    params.radius_ft = require_number(command, "radius_feet");
    params.speed_fps = require_number(command, "speed_fps");
    const std::optional<std::string> direction = find_string(command.parameters, "direction");
    if (!direction.has_value()) {
        throw ConfigError(describe(command) + " is missing string parameter 'direction'");
    }
    try {
        params.direction = circle_direction_from_string(*direction);
    } catch (const ConfigError& error) {
        throw ConfigError(describe(command) + ": " + error.what());
    }
    params.altitude_ft = find_number(command.parameters, "altitude_feet");
    params.revolutions = find_number(command.parameters, "num_revolutions").value_or(params.revolutions);
    params.smooth_entry = find_bool(command.parameters, "smooth_entry").value_or(params.smooth_entry);

    require_positive(command, "radius_feet", params.radius_ft);
    require_positive(command, "speed_fps", params.speed_fps);
    require_positive(command, "num_revolutions", params.revolutions);
    if (params.altitude_ft.has_value()) {
        require_non_negative(command, "altitude_feet", *params.altitude_ft);
    }
    return params;
}

DescendAndLandParams resolve_descend_and_land(const CommandSpec& command) {
    DescendAndLandParams params{};
    params.descent_rate_fps = require_number(command, "descent_rate_fps");
    params.precision_landing = require_bool(command, "precision_landing");
    params.final_approach_height_ft = find_number(command.parameters, "final_approach_height_feet").value_or(params.final_approach_height_ft);
    params.touchdown_speed_fps = find_number(command.parameters, "touchdown_speed_fps").value_or(params.touchdown_speed_fps);
    require_positive(command, "descent_rate_fps", params.descent_rate_fps);
    require_non_negative(command, "final_approach_height_feet", params.final_approach_height_ft);
    require_positive(command, "touchdown_speed_fps", params.touchdown_speed_fps);
    return params;
}

}  // namespace

PhasePlan resolve_phase_plan(const CommandSpec& command) {
    switch (command.kind) {
        case CommandKind::Ascend:
            return resolve_ascend(command);
        case CommandKind::Hold:
            return resolve_hold(command);
        case CommandKind::CircularPath:
            return resolve_circular_path(command);
        case CommandKind::DescendAndLand:
            return resolve_descend_and_land(command);
    }
    throw ConfigError(describe(command) + " has no parameter schema");
}

CircleDirection circle_direction_from_string(const std::string& name) {
    std::string lower{name};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "clockwise" || lower == "cw") {
        return CircleDirection::Clockwise;
    }
    if (lower == "counterclockwise" || lower == "counter_clockwise" || lower == "ccw") {
        return CircleDirection::CounterClockwise;
    }
    throw ConfigError("unknown circle direction '" + name + "'");
}

}  // namespace drone_mission
