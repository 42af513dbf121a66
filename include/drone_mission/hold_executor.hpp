#pragma once

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/phase_executor.hpp"

namespace drone_mission {

/**
 * @brief Position hold with a small sinusoidal drift.
 *
 * With position hold enabled the drift amplitude is damped rather than
 * removed. Altitude stays within the commanded tolerance of the entry
 * altitude.
 */
class HoldExecutor final : public PhaseExecutor {
  public:
    explicit HoldExecutor(HoldParams params);

    [[nodiscard]] PhaseResult execute(DroneState& state, PhaseContext& context) override;

  private:
    HoldParams params_;
};

}  // namespace drone_mission
