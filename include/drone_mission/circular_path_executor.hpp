#pragma once

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/phase_executor.hpp"

namespace drone_mission {

/**
 * @brief Orbits the entry point and snaps back to it on completion.
 *
 * The orbit center is the vehicle's horizontal position on entry, so the
 * phase always ends exactly where it started.
 */
class CircularPathExecutor final : public PhaseExecutor {
  public:
    explicit CircularPathExecutor(CircularPathParams params);

    [[nodiscard]] PhaseResult execute(DroneState& state, PhaseContext& context) override;

  private:
    CircularPathParams params_;
};

}  // namespace drone_mission
