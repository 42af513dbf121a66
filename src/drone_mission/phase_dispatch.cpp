#include "drone_mission/phase_dispatch.hpp"

#include <variant>

#include "drone_mission/ascend_executor.hpp"
#include "drone_mission/circular_path_executor.hpp"
#include "drone_mission/descend_land_executor.hpp"
#include "drone_mission/hold_executor.hpp"

namespace drone_mission {

namespace {

template <typename... Visitors>
struct Overloaded : Visitors... {
    using Visitors::operator()...;
};

template <typename... Visitors>
Overloaded(Visitors...) -> Overloaded<Visitors...>;

}  // namespace

std::unique_ptr<PhaseExecutor> make_phase_executor(const PhasePlan& plan) {
    return std::visit(
        Overloaded{
            [](const AscendParams& params) -> std::unique_ptr<PhaseExecutor> {
                return std::make_unique<AscendExecutor>(params);
            },
            [](const HoldParams& params) -> std::unique_ptr<PhaseExecutor> {
                return std::make_unique<HoldExecutor>(params);
            },
            [](const CircularPathParams& params) -> std::unique_ptr<PhaseExecutor> {
                return std::make_unique<CircularPathExecutor>(params);
            },
            [](const DescendAndLandParams& params) -> std::unique_ptr<PhaseExecutor> {
                return std::make_unique<DescendAndLandExecutor>(params);
            },
        },
        plan
    );
}

}  // namespace drone_mission
