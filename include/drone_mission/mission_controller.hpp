// === Mission Controller ======================================================
//
// Orchestrates one mission run:
//
//   validate -> pre-flight -> arm -> (gate -> dispatch -> settle)* -> terminal
//
// Every run builds a fresh DroneState, SafetyGate, VehicleModel and
// TelemetryEmitter; nothing is carried between runs. The controller owns the
// state for the duration of the run and lends it to one executor at a time.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/config_provider.hpp"
#include "drone_mission/engine_config.hpp"
#include "drone_mission/logging.hpp"
#include "drone_mission/mission_definition.hpp"
#include "drone_mission/mission_outcome.hpp"
#include "drone_mission/safety_gate.hpp"
#include "drone_mission/telemetry_sink.hpp"
#include "drone_mission/tick_pacer.hpp"

namespace drone_mission {

/** @brief Runs missions against a telemetry sink and a tick pacer. */
class MissionController final {
  public:
    MissionController(EngineConfig config, TelemetrySink& sink, TickPacer& pacer);

    /**
     * @brief Execute @p mission on @p vehicle.
     *
     * Never throws for mission-level failures: invalid configuration,
     * pre-flight refusals and safety aborts are all reported through the
     * returned outcome.
     */
    [[nodiscard]] MissionOutcome execute(const MissionDefinition& mission, const VehicleProfile& vehicle);

    /**
     * @brief Load @p mission_id and @p vehicle_id from @p provider, then execute.
     *
     * Load failures become ConfigInvalid or UnsupportedCommand outcomes.
     */
    [[nodiscard]] MissionOutcome execute(ConfigProvider& provider, const std::string& mission_id, const std::string& vehicle_id);

    [[nodiscard]] const EngineConfig& config() const noexcept;

  private:
    [[nodiscard]] std::optional<std::string> validate(const MissionDefinition& mission, const SafetyGate& gate, std::vector<PhasePlan>& list_plans) const;
    [[nodiscard]] std::optional<std::string> preflight(const MissionDefinition& mission, const VehicleProfile& vehicle, const DroneState& state) const;

    EngineConfig config_;
    TelemetrySink& sink_;
    TickPacer& pacer_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_mission
