// === Errors ==================================================================
//
// Exception types raised while loading or validating mission configuration.
// Mission-level failures (safety aborts, pre-flight refusals) are reported
// through MissionOutcome instead.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace drone_mission {

/** @brief Mission or vehicle data is missing, malformed or of the wrong shape. */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief A command names a kind outside the supported closed set. */
class UnsupportedCommandError final : public ConfigError {
  public:
    explicit UnsupportedCommandError(std::string kind)
        : ConfigError("Unsupported command kind: " + kind),
          str_kind_(std::move(kind)) {}

    [[nodiscard]] const std::string& kind() const noexcept {
        return str_kind_;
    }

  private:
    std::string str_kind_;
};

}  // namespace drone_mission
