#pragma once

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/phase_executor.hpp"

namespace drone_mission {

/**
 * @brief Linear altitude ramp followed by a stabilization dwell.
 *
 * Ramps z from its current value to the target at the commanded climb rate
 * (downward when the target is below the vehicle), then holds in
 * Stabilizing and finishes in Hover.
 */
class AscendExecutor final : public PhaseExecutor {
  public:
    explicit AscendExecutor(AscendParams params);

    [[nodiscard]] PhaseResult execute(DroneState& state, PhaseContext& context) override;

  private:
    AscendParams params_;
};

}  // namespace drone_mission
