#pragma once

#include <memory>

#include "drone_mission/command_parameters.hpp"
#include "drone_mission/phase_executor.hpp"

namespace drone_mission {

/**
 * @brief Build the executor for @p plan.
 *
 * Dispatch is an exhaustive std::visit over PhasePlan; adding an alternative
 * without an executor fails to compile.
 */
[[nodiscard]] std::unique_ptr<PhaseExecutor> make_phase_executor(const PhasePlan& plan);

}  // namespace drone_mission
