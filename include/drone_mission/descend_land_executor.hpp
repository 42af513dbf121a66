#pragma once

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/phase_executor.hpp"

namespace drone_mission {

/**
 * @brief Optional precision centering, main descent, final approach, touchdown.
 *
 * Always ends with z == 0, all velocity components zero, flying == false and
 * mode Landed unless a safety check aborts first.
 */
class DescendAndLandExecutor final : public PhaseExecutor {
  public:
    explicit DescendAndLandExecutor(DescendAndLandParams params);

    [[nodiscard]] PhaseResult execute(DroneState& state, PhaseContext& context) override;

  private:
    [[nodiscard]] bool center_over_home(DroneState& state, PhaseContext& context, PhaseResult& result, std::size_t& drain_tick);

    DescendAndLandParams params_;
};

}  // namespace drone_mission
