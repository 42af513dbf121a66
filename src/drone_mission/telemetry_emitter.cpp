#include "drone_mission/telemetry_emitter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace drone_mission {

TelemetryEmitter::TelemetryEmitter(TelemetryConfig config, TelemetrySink& sink)
    : config_(std::move(config)),
      sink_(sink),
      logger_(get_logger()) {
    if (config_.update_rate_hz <= 0.0) {
        throw std::invalid_argument("TelemetryEmitter requires a positive update rate");
    }
}

void TelemetryEmitter::emit(const DroneState& state, const std::string& phase_label) {
    TelemetrySnapshot snapshot{};
    snapshot.phase_label = phase_label;
    snapshot.state = state;
    snapshot.speed_fps = state.velocity.magnitude();
    snapshot.average_motor_temp_c = average_motor_temp_c(state);

    if (optional_last_snapshot_.has_value()) {
        const Vector3& previous = optional_last_snapshot_->state.position;
        const Vector3 delta{state.position.x - previous.x, state.position.y - previous.y, state.position.z - previous.z};
        distance_flown_ft_ += delta.magnitude();
    }
    peak_altitude_ft_ = std::max(peak_altitude_ft_, state.position.z);
    ++snapshot_count_;

    if (config_.logging_enabled) {
        logger_->debug("{}", format_snapshot(snapshot, config_.data_points));
    }
    if (config_.real_time_display) {
        sink_.accept(snapshot);
        ++forwarded_count_;
    }
    optional_last_snapshot_ = std::move(snapshot);
}

std::size_t TelemetryEmitter::snapshot_count() const noexcept {
    return snapshot_count_;
}

std::size_t TelemetryEmitter::forwarded_count() const noexcept {
    return forwarded_count_;
}

double TelemetryEmitter::distance_flown_ft() const noexcept {
    return distance_flown_ft_;
}

double TelemetryEmitter::peak_altitude_ft() const noexcept {
    return peak_altitude_ft_;
}

const std::optional<TelemetrySnapshot>& TelemetryEmitter::last_snapshot() const noexcept {
    return optional_last_snapshot_;
}

const TelemetryConfig& TelemetryEmitter::config() const noexcept {
    return config_;
}

}  // namespace drone_mission
