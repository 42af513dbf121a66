// === Telemetry Sink ==========================================================
//
// Snapshot record produced once per tick plus the consumer interface the
// engine forwards it to. Sinks may print, log or publish; the engine only
// guarantees that snapshots arrive in non-decreasing flight-time order and
// at most update_rate_hz times per simulated second.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/logging.hpp"

namespace drone_mission {

/** @brief One telemetry publication. */
struct TelemetrySnapshot final {
    std::string phase_label{};      /**< e.g. "CLIMB", "HOVER", "CIRCLE (40%)". */
    DroneState state{};             /**< State copy at emission time. */
    double speed_fps{};             /**< Velocity magnitude. */
    double average_motor_temp_c{};  /**< Mean motor temperature. */
};

/** @brief External consumer of telemetry snapshots. */
class TelemetrySink {
  public:
    virtual ~TelemetrySink() = default;

    virtual void accept(const TelemetrySnapshot& snapshot) = 0;
};

/**
 * @brief Render @p snapshot as a single line.
 *
 * When @p data_points is non-empty only the named fields are rendered:
 * flight_time, position, altitude, velocity, battery, signal_strength,
 * motor_temps, mode, gps_satellites. Unknown names are ignored.
 */
[[nodiscard]] std::string format_snapshot(const TelemetrySnapshot& snapshot, const std::vector<std::string>& data_points);

/** @brief Sink writing formatted snapshots to the shared logger at info level. */
class LoggingTelemetrySink final : public TelemetrySink {
  public:
    explicit LoggingTelemetrySink(std::vector<std::string> data_points = {});

    void accept(const TelemetrySnapshot& snapshot) override;

  private:
    std::vector<std::string> list_data_points_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_mission
