#include "drone_mission/drone_state.hpp"

#include <iterator>
#include <numeric>

#include <fmt/format.h>

namespace drone_mission {

DroneState make_initial_state(const VehicleProfile& vehicle, double ambient_temp_c) {
    DroneState state{};
    state.motor_temps_c.assign(vehicle.motor_count(), ambient_temp_c);
    return state;
}

double average_motor_temp_c(const DroneState& state) noexcept {
    if (state.motor_temps_c.empty()) {
        return 0.0;
    }
    const double total = std::accumulate(state.motor_temps_c.begin(), state.motor_temps_c.end(), 0.0);
    return total / static_cast<double>(state.motor_temps_c.size());
}

std::string format_status_report(const DroneState& state) {
    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);
    fmt::format_to(out, "DRONE STATUS REPORT\n");
    fmt::format_to(out, "=========================================\n");
    fmt::format_to(out, "Position:    ({:.2f}, {:.2f}, {:.2f}) ft\n", state.position.x, state.position.y, state.position.z);
    fmt::format_to(out, "Velocity:    {:.1f} fps\n", state.velocity.magnitude());
    fmt::format_to(out, "Battery:     {}% ({:.2f}V)\n", state.battery_percent, state.battery_voltage);
    fmt::format_to(out, "Flight Time: {:.1f}s\n", state.flight_time_s);
    fmt::format_to(out, "Mode:        {}\n", to_string(state.mode));
    fmt::format_to(out, "Command:     {}\n", state.current_command_id);
    fmt::format_to(out, "Progress:    {}%\n", state.mission_progress_percent);
    fmt::format_to(out, "Motor Temps: ");
    for (std::size_t index = 0; index < state.motor_temps_c.size(); ++index) {
        fmt::format_to(out, "{}{:.1f}", index == 0 ? "" : ", ", state.motor_temps_c[index]);
    }
    fmt::format_to(out, " C\n");
    fmt::format_to(out, "Signal:      {}%\n", state.signal_strength_percent);
    fmt::format_to(out, "Satellites:  {}\n", state.gps_satellites);
    fmt::format_to(out, "Flying:      {}\n", state.flying);
    fmt::format_to(out, "Armed:       {}\n", state.armed);
    fmt::format_to(out, "=========================================");
    return fmt::to_string(buffer);
}

}  // namespace drone_mission
