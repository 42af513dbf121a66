// === Mission Definition ======================================================
//
// Immutable description of a mission and the vehicle it targets. These are
// produced by a ConfigProvider and never mutated once loaded; the controller
// and phase executors only read them.

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace drone_mission {

/** @brief Loosely-typed scalar carried in parameter and specification bags. */
using ParameterValue = std::variant<double, bool, std::string>;

/** @brief Key/value bag whose semantics depend on the owning command kind. */
using ParameterMap = std::map<std::string, ParameterValue>;

/**
 * @brief Closed set of flight commands the engine knows how to execute.
 */
enum class CommandKind {
    Ascend,          /**< Climb (or ramp) to a target altitude, then stabilize. */
    Hold,            /**< Hold position for a fixed duration. */
    CircularPath,    /**< Fly one or more revolutions around the entry point. */
    DescendAndLand   /**< Descend, slow for final approach and touch down. */
};

/** @brief Canonical upper-case name for @p kind. */
[[nodiscard]] std::string_view to_string(CommandKind kind) noexcept;

/**
 * @brief Parse a command kind name, accepting both legacy and engine names.
 *
 * Matching is case-insensitive; `TAKEOFF`, `HOVER`, `CIRCLE` and `LAND` are
 * accepted alongside `ASCEND`, `HOLD`, `CIRCULAR_PATH` and `DESCEND_AND_LAND`.
 *
 * @throws UnsupportedCommandError when the name is not in the closed set.
 */
[[nodiscard]] CommandKind command_kind_from_string(std::string_view name);

/**
 * @brief Mission-wide safety thresholds consulted by every phase.
 */
struct SafetyParameters final {
    double max_altitude_ft{};              /**< Highest permitted altitude. */
    double max_horizontal_speed_fps{};     /**< Highest permitted horizontal speed. */
    int emergency_land_battery_percent{};  /**< Battery floor for the battery_level check. */
    double geofence_radius_ft{};           /**< Nominal operating radius (advisory). */
    double max_wind_speed_mph{};           /**< Highest tolerable wind (advisory). */
};

/**
 * @brief Where the mission may be flown.
 */
struct EnvironmentRequirements final {
    bool indoor_safe{};
    bool outdoor_capable{};
    std::string recommended_space{};
};

/**
 * @brief Telemetry cadence and presentation settings.
 */
struct TelemetryConfig final {
    double update_rate_hz{10.0};          /**< Tick rate for every phase loop; must be > 0. */
    std::vector<std::string> data_points; /**< Fields to render (empty renders all). */
    bool logging_enabled{true};           /**< Log each snapshot at debug level. */
    bool real_time_display{true};         /**< Forward snapshots to the sink. */
};

/**
 * @brief One element of the ordered command sequence.
 */
struct CommandSpec final {
    int id{};                               /**< Unique id; defines execution order. */
    CommandKind kind{CommandKind::Hold};    /**< Which phase executor runs this command. */
    std::string description{};              /**< Free-form operator description. */
    ParameterMap parameters{};              /**< Kind-specific parameters. */
    double expected_duration_s{};           /**< Informational only. */
    std::vector<std::string> safety_checks; /**< Named checks run before and during the phase. */
};

/**
 * @brief Complete, immutable mission description.
 */
struct MissionDefinition final {
    std::string name{};
    std::string description{};
    std::string vehicle_model{};        /**< Target vehicle model; empty accepts any vehicle. */
    double estimated_duration_s{};
    SafetyParameters safety{};
    EnvironmentRequirements environment{};
    std::vector<CommandSpec> commands{};
    TelemetryConfig telemetry{};
};

/**
 * @brief Vehicle identity plus a display-only specification bag.
 */
struct VehicleProfile final {
    std::string model{};
    std::string manufacturer{};
    std::string type{};
    std::string category{};
    ParameterMap specifications{};        /**< e.g. weight_grams, flight_time_minutes, motor_count. */
    std::map<std::string, bool> capabilities{};

    /** @brief Number of motors reported in the specification bag (defaults to 4). */
    [[nodiscard]] std::size_t motor_count() const;
    /** @brief True when the capability bag lists @p name as enabled. */
    [[nodiscard]] bool has_capability(const std::string& name) const;
};

/**
 * @brief Typed lookups into a parameter bag.
 *
 * Each returns std::nullopt when @p key is absent.
 *
 * @throws ConfigError when @p key is present but holds a different type.
 */
[[nodiscard]] std::optional<double> find_number(const ParameterMap& parameters, const std::string& key);

[[nodiscard]] std::optional<bool> find_bool(const ParameterMap& parameters, const std::string& key);

[[nodiscard]] std::optional<std::string> find_string(const ParameterMap& parameters, const std::string& key);

}  // namespace drone_mission
