#include "drone_mission/telemetry_sink.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace drone_mission {

namespace {

bool wants(const std::vector<std::string>& data_points, std::string_view field) {
    return data_points.empty() || std::find(data_points.begin(), data_points.end(), field) != data_points.end();
}

}  // namespace

std::string format_snapshot(const TelemetrySnapshot& snapshot, const std::vector<std::string>& data_points) {
    const DroneState& state = snapshot.state;
    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);
    fmt::format_to(out, "[{}]", snapshot.phase_label);

    if (wants(data_points, "flight_time")) {
        fmt::format_to(out, " T:{:.1f}s", state.flight_time_s);
    }
    if (wants(data_points, "position")) {
        fmt::format_to(out, " | Pos:({:.2f}, {:.2f}, {:.2f})", state.position.x, state.position.y, state.position.z);
    } else if (wants(data_points, "altitude")) {
        fmt::format_to(out, " | Alt:{:.2f}ft", state.position.z);
    }
    if (wants(data_points, "velocity")) {
        fmt::format_to(out, " | Vel:{:.1f}fps", snapshot.speed_fps);
    }
    if (wants(data_points, "battery")) {
        fmt::format_to(out, " | Bat:{}% ({:.2f}V)", state.battery_percent, state.battery_voltage);
    }
    if (wants(data_points, "signal_strength")) {
        fmt::format_to(out, " | Sig:{}%", state.signal_strength_percent);
    }
    if (wants(data_points, "motor_temps")) {
        fmt::format_to(out, " | Temp:{:.1f}C", snapshot.average_motor_temp_c);
    }
    if (wants(data_points, "mode")) {
        fmt::format_to(out, " | Mode:{}", to_string(state.mode));
    }
    if (wants(data_points, "gps_satellites")) {
        fmt::format_to(out, " | Sats:{}", state.gps_satellites);
    }
    return fmt::to_string(buffer);
}

LoggingTelemetrySink::LoggingTelemetrySink(std::vector<std::string> data_points)
    : list_data_points_(std::move(data_points)),
      logger_(get_logger()) {}

void LoggingTelemetrySink::accept(const TelemetrySnapshot& snapshot) {
    logger_->info("{}", format_snapshot(snapshot, list_data_points_));
}

}  // namespace drone_mission
