// === Telemetry Emitter =======================================================
//
// Called by phase executors once per tick. Builds a TelemetrySnapshot, keeps
// running mission statistics, and forwards the snapshot to the external sink
// when real-time display is enabled. It has no timer of its own; the executor
// tick loop is the only rate limiter.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "drone_mission/drone_state.hpp"
#include "drone_mission/logging.hpp"
#include "drone_mission/mission_definition.hpp"
#include "drone_mission/telemetry_sink.hpp"

namespace drone_mission {

/** @brief Formats, tracks and dispatches per-tick snapshots. */
class TelemetryEmitter final {
  public:
    TelemetryEmitter(TelemetryConfig config, TelemetrySink& sink);

    /** @brief Record and (optionally) publish a snapshot of @p state. */
    void emit(const DroneState& state, const std::string& phase_label);

    /** @brief Snapshots produced, whether or not they reached the sink. */
    [[nodiscard]] std::size_t snapshot_count() const noexcept;
    /** @brief Snapshots handed to the sink. */
    [[nodiscard]] std::size_t forwarded_count() const noexcept;
    /** @brief Path length accumulated between successive snapshots, in feet. */
    [[nodiscard]] double distance_flown_ft() const noexcept;
    /** @brief Highest altitude seen in any snapshot. */
    [[nodiscard]] double peak_altitude_ft() const noexcept;
    [[nodiscard]] const std::optional<TelemetrySnapshot>& last_snapshot() const noexcept;
    [[nodiscard]] const TelemetryConfig& config() const noexcept;

  private:
    TelemetryConfig config_;
    TelemetrySink& sink_;
    std::size_t snapshot_count_{};
    std::size_t forwarded_count_{};
    double distance_flown_ft_{};
    double peak_altitude_ft_{};
    std::optional<TelemetrySnapshot> optional_last_snapshot_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_mission
