#include "drone_mission/mission_outcome.hpp"

namespace drone_mission {

std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:
            return "Success";
        case OutcomeKind::Aborted:
            return "Aborted";
        case OutcomeKind::PreflightFailed:
            return "PreflightFailed";
        case OutcomeKind::ConfigInvalid:
            return "ConfigInvalid";
        case OutcomeKind::UnsupportedCommand:
            return "UnsupportedCommand";
    }
    return "Unknown";
}

}  // namespace drone_mission
