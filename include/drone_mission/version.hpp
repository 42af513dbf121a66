// === Version Metadata ========================================================
//
// Exposes the engine's semantic version string used in logs and reports.

#pragma once

#include <string_view>

namespace drone_mission {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace drone_mission
