// === Safety Gate =============================================================
//
// Named precondition checks evaluated against the live DroneState and the
// mission's SafetyParameters. The controller runs a command's declared checks
// before dispatch and phase executors re-run them on every tick. Results are
// returned as values; nothing here throws to signal an abort.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/logging.hpp"
#include "drone_mission/mission_definition.hpp"

namespace drone_mission {

/** @brief Failed check plus the state it was evaluated against. */
struct SafetyViolation final {
    std::string check_name{};
    std::string reason{};
    DroneState state_snapshot{};
};

/**
 * @brief One named safety check.
 *
 * Implementations return a failure reason, or std::nullopt when the state is
 * acceptable. Sensor-backed implementations replace the advisory built-ins
 * through SafetyGate::register_check.
 */
class SafetyCheck {
  public:
    virtual ~SafetyCheck() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::optional<std::string> evaluate(const DroneState& state, const SafetyParameters& params) const = 0;
};

/** @brief Registry and evaluator for named safety checks. */
class SafetyGate final {
  public:
    /**
     * @brief Build a gate with the built-in checks registered.
     *
     * Built-ins: battery_level, altitude_hold and speed_limit (enforcing),
     * geofence (warns only), position_stability, path_clear and
     * landing_zone_clear (always pass).
     */
    SafetyGate();

    /** @brief Add @p check, replacing any check with the same name. */
    void register_check(std::unique_ptr<SafetyCheck> check);
    /** @brief True when a check called @p name is registered. */
    [[nodiscard]] bool knows(std::string_view name) const;

    /**
     * @brief Evaluate @p names in order and stop at the first failure.
     *
     * An unregistered name fails closed.
     */
    [[nodiscard]] std::optional<SafetyViolation> check(
        const std::vector<std::string>& names,
        const DroneState& state,
        const SafetyParameters& params
    ) const;

  private:
    std::map<std::string, std::unique_ptr<SafetyCheck>, std::less<>> map_checks_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_mission
