#include "drone_mission/flight_mode.hpp"

#include <stdexcept>
#include <string>

#include "drone_mission/drone_state.hpp"

namespace drone_mission {

std::string_view to_string(FlightMode mode) noexcept {
    switch (mode) {
        case FlightMode::Disarmed:
            return "DISARMED";
        case FlightMode::Armed:
            return "ARMED";
        case FlightMode::Ascend:
            return "ASCEND";
        case FlightMode::Stabilizing:
            return "STABILIZING";
        case FlightMode::Hover:
            return "HOVER";
        case FlightMode::Circle:
            return "CIRCLE";
        case FlightMode::Descending:
            return "DESCENDING";
        case FlightMode::FinalApproach:
            return "FINAL_APPROACH";
        case FlightMode::Landed:
            return "LANDED";
        case FlightMode::MissionComplete:
            return "MISSION_COMPLETE";
        case FlightMode::Aborted:
            return "ABORTED";
    }
    return "UNKNOWN";
}

bool is_terminal(FlightMode mode) noexcept {
    return mode == FlightMode::MissionComplete || mode == FlightMode::Aborted;
}

bool is_transition_allowed(FlightMode from, FlightMode to) noexcept {
    if (from == to) {
        return true;
    }
    if (is_terminal(from)) {
        return false;
    }
    if (to == FlightMode::Aborted) {
        return true;
    }

    switch (from) {
        case FlightMode::Disarmed:
            return to == FlightMode::Armed;
        case FlightMode::Armed:
            return to == FlightMode::Ascend || to == FlightMode::MissionComplete;
        case FlightMode::Ascend:
            return to == FlightMode::Stabilizing;
        case FlightMode::Stabilizing:
            return to == FlightMode::Hover;
        case FlightMode::Hover:
            return to == FlightMode::Ascend || to == FlightMode::Circle || to == FlightMode::Descending
                || to == FlightMode::MissionComplete;
        case FlightMode::Circle:
            return to == FlightMode::Hover;
        case FlightMode::Descending:
            return to == FlightMode::FinalApproach;
        case FlightMode::FinalApproach:
            return to == FlightMode::Landed;
        case FlightMode::Landed:
            return to == FlightMode::Ascend || to == FlightMode::MissionComplete;
        case FlightMode::MissionComplete:
        case FlightMode::Aborted:
            return false;
    }
    return false;
}

void transition_mode(DroneState& state, FlightMode next) {
    if (!is_transition_allowed(state.mode, next)) {
        throw std::logic_error(
            "Illegal flight mode transition " + std::string{to_string(state.mode)} + " -> " + std::string{to_string(next)}
        );
    }
    state.mode = next;
}

}  // namespace drone_mission
