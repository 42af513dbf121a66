// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// engine (time primitives, local-frame vectors).

#pragma once

#include <chrono>
#include <cmath>

namespace drone_mission {

/**
 * @brief Alias for the steady clock used for real-time pacing.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Cartesian vector in the local launch frame (feet or feet/second).
 *
 * x/y are horizontal, z is height above the launch point.
 */
struct Vector3 final {
    double x{};
    double y{};
    double z{};

    [[nodiscard]] double magnitude() const noexcept {
        return std::sqrt(x * x + y * y + z * z);
    }

    [[nodiscard]] double horizontal_magnitude() const noexcept {
        return std::hypot(x, y);
    }
};

}  // namespace drone_mission
