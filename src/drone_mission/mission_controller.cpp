#include "drone_mission/mission_controller.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "drone_mission/errors.hpp"
#include "drone_mission/phase_dispatch.hpp"
#include "drone_mission/phase_executor.hpp"
#include "drone_mission/telemetry_emitter.hpp"
#include "drone_mission/vehicle_model.hpp"

namespace drone_mission {

namespace {

MissionSummary summarize(const DroneState& state, const TelemetryEmitter* emitter) {
    MissionSummary summary{};
    summary.flight_time_s = state.flight_time_s;
    summary.final_battery_percent = state.battery_percent;
    summary.final_battery_voltage = state.battery_voltage;
    if (emitter != nullptr) {
        summary.distance_flown_ft = emitter->distance_flown_ft();
        summary.peak_altitude_ft = emitter->peak_altitude_ft();
        summary.telemetry_count = emitter->snapshot_count();
    }
    return summary;
}

MissionOutcome refused(OutcomeKind kind, std::string reason, const DroneState& state) {
    MissionOutcome outcome{};
    outcome.kind = kind;
    outcome.reason = std::move(reason);
    outcome.final_state = state;
    outcome.summary = summarize(state, nullptr);
    return outcome;
}

/** Hold, CircularPath and DescendAndLand need the vehicle in the air. */
bool requires_airborne(CommandKind kind) noexcept {
    return kind != CommandKind::Ascend;
}

}  // namespace

MissionController::MissionController(EngineConfig config, TelemetrySink& sink, TickPacer& pacer)
    : config_(std::move(config)),
      sink_(sink),
      pacer_(pacer),
      logger_(get_logger()) {}

const EngineConfig& MissionController::config() const noexcept {
    return config_;
}

MissionOutcome MissionController::execute(ConfigProvider& provider, const std::string& mission_id, const std::string& vehicle_id) {
    MissionDefinition mission{};
    VehicleProfile vehicle{};
    try {
        mission = provider.load_mission(mission_id);
        vehicle = provider.load_vehicle(vehicle_id);
    } catch (const UnsupportedCommandError& ex) {
        logger_->error("Mission '{}' rejected: {}", mission_id, ex.what());
        return refused(OutcomeKind::UnsupportedCommand, ex.what(), DroneState{});
    } catch (const ConfigError& ex) {
        logger_->error("Mission '{}' rejected: {}", mission_id, ex.what());
        return refused(OutcomeKind::ConfigInvalid, ex.what(), DroneState{});
    }
    return execute(mission, vehicle);
}

MissionOutcome MissionController::execute(const MissionDefinition& mission, const VehicleProfile& vehicle) {
    SafetyGate gate;
    DroneState state = make_initial_state(vehicle, config_.thermal.ambient_c);

    std::vector<PhasePlan> list_plans;
    if (const auto optional_error = validate(mission, gate, list_plans)) {
        logger_->error("Mission '{}' configuration invalid: {}", mission.name, *optional_error);
        return refused(OutcomeKind::ConfigInvalid, *optional_error, state);
    }
    if (const auto optional_error = preflight(mission, vehicle, state)) {
        logger_->error("Mission '{}' failed pre-flight: {}", mission.name, *optional_error);
        return refused(OutcomeKind::PreflightFailed, *optional_error, state);
    }

    VehicleModel vehicle_model(config_, vehicle.has_capability("gps"));
    TelemetryEmitter emitter(mission.telemetry, sink_);

    pacer_.reset();
    state.armed = true;
    transition_mode(state, FlightMode::Armed);
    logger_->info("Mission '{}' armed on {} ({} commands at {:.1f}Hz)", mission.name, vehicle.model, mission.commands.size(), mission.telemetry.update_rate_hz);

    MissionOutcome outcome{};
    const std::size_t total = mission.commands.size();
    for (std::size_t index = 0; index < total; ++index) {
        const CommandSpec& command = mission.commands[index];
        state.current_command_id = command.id;
        state.mission_progress_percent = static_cast<int>(index * 100 / total);
        logger_->info("Command {}/{}: {} (id {}) {}", index + 1, total, to_string(command.kind), command.id, command.description);

        std::optional<SafetyViolation> optional_violation = gate.check(command.safety_checks, state, mission.safety);
        if (!optional_violation.has_value()) {
            PhaseContext context{mission.safety, command.safety_checks, gate, emitter, pacer_, vehicle_model, mission.telemetry.update_rate_hz};
            const std::unique_ptr<PhaseExecutor> executor = make_phase_executor(list_plans[index]);
            PhaseResult result = executor->execute(state, context);
            logger_->debug("Command {} finished after {} ticks", command.id, result.tick_count);
            optional_violation = std::move(result.violation);
        }

        if (optional_violation.has_value()) {
            transition_mode(state, FlightMode::Aborted);
            state.armed = false;
            logger_->critical(
                "Mission '{}' aborted during command {}: {} ({})",
                mission.name,
                command.id,
                optional_violation->check_name,
                optional_violation->reason
            );
            outcome.kind = OutcomeKind::Aborted;
            outcome.reason = optional_violation->check_name;
            outcome.violation = std::move(optional_violation);
            outcome.commands_completed = index;
            outcome.final_state = state;
            outcome.summary = summarize(state, &emitter);
            return outcome;
        }

        if (index + 1 < total && config_.inter_command_settle_s > 0.0) {
            state.flight_time_s += config_.inter_command_settle_s;
            pacer_.wait(Duration{config_.inter_command_settle_s});
        }
    }

    state.mission_progress_percent = 100;
    state.armed = false;
    state.flying = false;
    state.velocity = Vector3{};
    transition_mode(state, FlightMode::MissionComplete);
    vehicle_model.cool_motors(state);

    outcome.kind = OutcomeKind::Success;
    outcome.reason = "mission complete";
    outcome.commands_completed = total;
    outcome.final_state = state;
    outcome.summary = summarize(state, &emitter);
    logger_->info(
        "Mission '{}' complete: {:.1f}s flown, {:.1f}ft travelled, battery {}%",
        mission.name,
        outcome.summary.flight_time_s,
        outcome.summary.distance_flown_ft,
        outcome.summary.final_battery_percent
    );
    return outcome;
}

std::optional<std::string> MissionController::validate(const MissionDefinition& mission, const SafetyGate& gate, std::vector<PhasePlan>& list_plans) const {
    const double rate_hz = mission.telemetry.update_rate_hz;
    if (!std::isfinite(rate_hz) || !(rate_hz > 0.0)) {
        return fmt::format("update_rate_hz must be a finite positive number (got {})", rate_hz);
    }

    const SafetyParameters& safety = mission.safety;
    if (!std::isfinite(safety.max_altitude_ft) || !(safety.max_altitude_ft > 0.0)) {
        return fmt::format("max_altitude must be a finite positive number (got {})", safety.max_altitude_ft);
    }
    for (const double limit : {safety.max_horizontal_speed_fps, safety.geofence_radius_ft, safety.max_wind_speed_mph}) {
        if (!std::isfinite(limit) || limit < 0.0) {
            return fmt::format("safety limits must be finite and not negative (got {})", limit);
        }
    }
    if (safety.emergency_land_battery_percent < 0 || safety.emergency_land_battery_percent > 100) {
        return fmt::format("emergency_land_battery_percent must be within 0-100 (got {})", safety.emergency_land_battery_percent);
    }

    list_plans.clear();
    list_plans.reserve(mission.commands.size());
    for (std::size_t index = 0; index < mission.commands.size(); ++index) {
        const CommandSpec& command = mission.commands[index];
        if (index > 0 && command.id != mission.commands[index - 1].id + 1) {
            return fmt::format("command ids must be consecutive: id {} follows id {}", command.id, mission.commands[index - 1].id);
        }
        for (const std::string& check_name : command.safety_checks) {
            if (!gate.knows(check_name)) {
                return fmt::format("command {} names unknown safety check '{}'", command.id, check_name);
            }
        }
        try {
            list_plans.push_back(resolve_phase_plan(command));
        } catch (const ConfigError& ex) {
            return std::string(ex.what());
        }
    }
    return std::nullopt;
}

std::optional<std::string> MissionController::preflight(const MissionDefinition& mission, const VehicleProfile& vehicle, const DroneState& state) const {
    if (mission.commands.empty()) {
        return std::string("mission has no commands");
    }
    if (state.battery_percent <= 0) {
        return std::string("battery not present");
    }
    if (state.battery_percent < mission.safety.emergency_land_battery_percent) {
        return fmt::format("battery {}% below emergency threshold {}%", state.battery_percent, mission.safety.emergency_land_battery_percent);
    }
    if (!mission.vehicle_model.empty() && mission.vehicle_model != vehicle.model) {
        return fmt::format("mission targets '{}' but vehicle is '{}'", mission.vehicle_model, vehicle.model);
    }

    bool airborne = false;
    for (const CommandSpec& command : mission.commands) {
        if (requires_airborne(command.kind) && !airborne) {
            return fmt::format("command {} ({}) requires the vehicle to be airborne", command.id, to_string(command.kind));
        }
        if (command.kind == CommandKind::Ascend) {
            airborne = true;
        } else if (command.kind == CommandKind::DescendAndLand) {
            airborne = false;
        }
    }

    logger_->info(
        "Pre-flight passed: indoor_safe={} outdoor_capable={} space='{}'",
        mission.environment.indoor_safe,
        mission.environment.outdoor_capable,
        mission.environment.recommended_space
    );
    logger_->info(
        "Advisory limits: max wind {:.1f}mph, geofence {:.1f}ft, max speed {:.1f}fps",
        mission.safety.max_wind_speed_mph,
        mission.safety.geofence_radius_ft,
        mission.safety.max_horizontal_speed_fps
    );
    return std::nullopt;
}

}  // namespace drone_mission
