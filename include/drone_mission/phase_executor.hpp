// === Phase Executor ==========================================================
//
// Base class for the per-command tick loops. Each concrete executor owns the
// kinematics of one command kind; the shared tick bookkeeping (clock, link
// model, in-flight safety checks, telemetry, pacing) lives here so every
// loop observes the same ordering:
//
//   update state -> advance clock -> safety checks -> emit -> wait
//
// A failed check ends the loop before the tick is emitted.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/mission_definition.hpp"
#include "drone_mission/safety_gate.hpp"
#include "drone_mission/telemetry_emitter.hpp"
#include "drone_mission/tick_pacer.hpp"
#include "drone_mission/vehicle_model.hpp"

namespace drone_mission {

/** @brief Collaborators lent to an executor for the duration of one command. */
struct PhaseContext final {
    const SafetyParameters& safety;
    const std::vector<std::string>& safety_checks; /**< The command's declared checks, re-run every tick. */
    const SafetyGate& gate;
    TelemetryEmitter& emitter;
    TickPacer& pacer;
    VehicleModel& vehicle;
    double update_rate_hz{};

    [[nodiscard]] Duration tick_interval() const noexcept {
        return Duration{1.0 / update_rate_hz};
    }
};

/** @brief Result of running one phase. */
struct PhaseResult final {
    std::size_t tick_count{};                   /**< Ticks completed and emitted. */
    std::optional<SafetyViolation> violation{}; /**< Set when an in-flight check halted the phase. */

    [[nodiscard]] bool aborted() const noexcept {
        return violation.has_value();
    }
};

/** @brief Fixed-timestep loop for one command kind. */
class PhaseExecutor {
  public:
    virtual ~PhaseExecutor() = default;

    /** @brief Run the phase to completion or until a safety check fails. */
    [[nodiscard]] virtual PhaseResult execute(DroneState& state, PhaseContext& context) = 0;

    /** @brief Upper bound on the ticks any single loop of a phase may run. */
    static constexpr std::size_t k_max_phase_ticks{10'000'000};

    /** @brief Number of ticks needed to cover @p seconds at @p rate_hz (rounded up, at most k_max_phase_ticks). */
    [[nodiscard]] static std::size_t ticks_for(double seconds, double rate_hz) noexcept;

  protected:
    /**
     * @brief Finish the current tick after the executor has updated @p state.
     *
     * @return false when a safety check failed; @p result then holds the violation.
     */
    [[nodiscard]] bool complete_tick(DroneState& state, PhaseContext& context, const std::string& label, PhaseResult& result);

    /**
     * @brief Hold the current position for @p seconds, ticking at the update rate.
     *
     * Used for stabilization and settle sub-phases. Drains battery on the
     * hover cadence.
     */
    [[nodiscard]] bool dwell(DroneState& state, PhaseContext& context, double seconds, const std::string& label, PhaseResult& result);
};

}  // namespace drone_mission
