// === Command Parameters ======================================================
//
// Typed views of each command kind's parameter bag. resolve_phase_plan turns
// a CommandSpec into exactly one PhasePlan alternative, applying defaults and
// range checks, so malformed commands are rejected before a mission arms.

#pragma once

#include <optional>
#include <variant>

#include "drone_mission/mission_definition.hpp"

namespace drone_mission {

/** @brief Orbit direction as seen from above. */
enum class CircleDirection {
    Clockwise,
    CounterClockwise
};

struct AscendParams final {
    double target_altitude_ft{};
    double climb_rate_fps{};
    double stabilization_time_s{};
};

struct HoldParams final {
    double duration_s{};
    bool position_hold{};
    double altitude_tolerance_ft{0.5};
};

struct CircularPathParams final {
    double radius_ft{};
    double speed_fps{};
    std::optional<double> altitude_ft{};  /**< Orbit altitude; unset keeps the entry altitude. */
    CircleDirection direction{CircleDirection::Clockwise};
    double revolutions{1.0};
    bool smooth_entry{true};
};

struct DescendAndLandParams final {
    double descent_rate_fps{};
    bool precision_landing{};
    double final_approach_height_ft{1.0};
    double touchdown_speed_fps{0.2};
};

/** @brief Exactly one typed parameter set per command kind. */
using PhasePlan = std::variant<AscendParams, HoldParams, CircularPathParams, DescendAndLandParams>;

/**
 * @brief Resolve @p command into its typed parameter set.
 *
 * @throws ConfigError when a required parameter is missing, has the wrong
 *         type, or is out of range.
 */
[[nodiscard]] PhasePlan resolve_phase_plan(const CommandSpec& command);

/** @brief Parse an orbit direction name (clockwise/cw, counterclockwise/counter_clockwise/ccw). */
[[nodiscard]] CircleDirection circle_direction_from_string(const std::string& name);

}  // namespace drone_mission
