#include "drone_mission/config_provider.hpp"

#include <array>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "drone_mission/errors.hpp"

namespace drone_mission {

namespace {

constexpr std::array<std::string_view, 3> k_document_extensions{".yaml", ".yml", ".json"};

std::string join_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

YAML::Node require_field(const YAML::Node& node, const std::string& key, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(fmt::format("'{}' must be a mapping", path.empty() ? "<document>" : path));
    }
    YAML::Node child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        throw ConfigError(fmt::format("missing required field '{}'", join_path(path, key)));
    }
    return child;
}

template <typename T>
T read_as(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(fmt::format("field '{}' has the wrong type", path));
    }
}

template <typename T>
T read_required(const YAML::Node& node, const std::string& key, const std::string& path) {
    return read_as<T>(require_field(node, key, path), join_path(path, key));
}

template <typename T>
T read_optional(const YAML::Node& node, const std::string& key, const std::string& path, T fallback) {
    if (!node.IsMap()) {
        return fallback;
    }
    const YAML::Node child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        return fallback;
    }
    return read_as<T>(child, join_path(path, key));
}

std::vector<std::string> read_string_list(const YAML::Node& node, const std::string& key, const std::string& path) {
    std::vector<std::string> list_values;
    if (!node.IsMap()) {
        return list_values;
    }
    const YAML::Node child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        return list_values;
    }
    const std::string child_path = join_path(path, key);
    if (!child.IsSequence()) {
        throw ConfigError(fmt::format("field '{}' must be a list", child_path));
    }
    for (std::size_t index = 0; index < child.size(); ++index) {
        list_values.push_back(read_as<std::string>(child[index], fmt::format("{}[{}]", child_path, index)));
    }
    return list_values;
}

/** Scalars decode as number, then boolean, then fall back to the raw string. */
ParameterValue read_parameter_value(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw ConfigError(fmt::format("parameter '{}' must be a scalar", path));
    }
    double number{};
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    bool flag{};
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    return node.Scalar();
}

ParameterMap read_parameter_map(const YAML::Node& node, const std::string& key, const std::string& path) {
    ParameterMap parameters;
    if (!node.IsMap()) {
        return parameters;
    }
    const YAML::Node child = node[key];
    if (!child.IsDefined() || child.IsNull()) {
        return parameters;
    }
    const std::string child_path = join_path(path, key);
    if (!child.IsMap()) {
        throw ConfigError(fmt::format("field '{}' must be a mapping", child_path));
    }
    for (const auto& entry : child) {
        const auto name = entry.first.as<std::string>();
        if (!entry.second.IsScalar()) {
            // Nested structures (e.g. video_system blocks) are display-only.
            continue;
        }
        parameters.emplace(name, read_parameter_value(entry.second, join_path(child_path, name)));
    }
    return parameters;
}

SafetyParameters parse_safety(const YAML::Node& node, const std::string& path) {
    SafetyParameters safety{};
    safety.max_altitude_ft = read_required<double>(node, "max_altitude_feet", path);
    safety.max_horizontal_speed_fps = read_optional<double>(node, "max_speed_fps", path, 0.0);
    safety.emergency_land_battery_percent = read_required<int>(node, "emergency_land_battery_percent", path);
    safety.geofence_radius_ft = read_optional<double>(node, "geofence_radius_feet", path, 0.0);
    safety.max_wind_speed_mph = read_optional<double>(node, "max_wind_speed_mph", path, 0.0);
    return safety;
}

EnvironmentRequirements parse_environment(const YAML::Node& node, const std::string& path) {
    EnvironmentRequirements environment{};
    environment.indoor_safe = read_optional<bool>(node, "indoor_safe", path, false);
    environment.outdoor_capable = read_optional<bool>(node, "outdoor_capable", path, false);
    environment.recommended_space = read_optional<std::string>(node, "recommended_space", path, "");
    return environment;
}

CommandSpec parse_command(const YAML::Node& node, const std::string& path) {
    CommandSpec command{};
    command.id = read_required<int>(node, "id", path);
    command.kind = command_kind_from_string(read_required<std::string>(node, "type", path));
    command.description = read_optional<std::string>(node, "description", path, "");
    command.parameters = read_parameter_map(node, "parameters", path);
    command.expected_duration_s = read_optional<double>(node, "expected_duration_seconds", path, 0.0);
    command.safety_checks = read_string_list(node, "safety_checks", path);
    return command;
}

TelemetryConfig parse_telemetry(const YAML::Node& document) {
    TelemetryConfig telemetry{};
    const YAML::Node node = document["telemetry_config"];
    if (!node.IsDefined() || node.IsNull()) {
        return telemetry;
    }
    const std::string path{"telemetry_config"};
    telemetry.update_rate_hz = read_optional<double>(node, "update_rate_hz", path, telemetry.update_rate_hz);
    telemetry.data_points = read_string_list(node, "data_points", path);
    telemetry.logging_enabled = read_optional<bool>(node, "logging_enabled", path, telemetry.logging_enabled);
    telemetry.real_time_display = read_optional<bool>(node, "real_time_display", path, telemetry.real_time_display);
    return telemetry;
}

}  // namespace

MissionDefinition parse_mission(const YAML::Node& document) {
    MissionDefinition mission{};

    const YAML::Node details = require_field(document, "mission", "");
    mission.name = read_required<std::string>(details, "name", "mission");
    mission.description = read_optional<std::string>(details, "description", "mission", "");
    mission.vehicle_model = read_optional<std::string>(details, "drone_model", "mission", "");
    mission.estimated_duration_s = read_optional<double>(details, "duration_estimate_seconds", "mission", 0.0);
    mission.safety = parse_safety(require_field(details, "safety_parameters", "mission"), "mission.safety_parameters");
    if (details["environment"].IsDefined()) {
        mission.environment = parse_environment(details["environment"], "mission.environment");
    }

    const YAML::Node commands = require_field(document, "commands", "");
    if (!commands.IsSequence()) {
        throw ConfigError("field 'commands' must be a list");
    }
    mission.commands.reserve(commands.size());
    for (std::size_t index = 0; index < commands.size(); ++index) {
        mission.commands.push_back(parse_command(commands[index], fmt::format("commands[{}]", index)));
    }

    mission.telemetry = parse_telemetry(document);
    return mission;
}

VehicleProfile parse_vehicle(const YAML::Node& document) {
    VehicleProfile vehicle{};
    const YAML::Node node = require_field(document, "drone", "");
    const std::string path{"drone"};

    vehicle.model = read_required<std::string>(node, "model", path);
    vehicle.manufacturer = read_optional<std::string>(node, "manufacturer", path, "");
    vehicle.type = read_optional<std::string>(node, "type", path, "");
    vehicle.category = read_optional<std::string>(node, "category", path, "");
    vehicle.specifications = read_parameter_map(node, "specifications", path);

    const YAML::Node capabilities = node["capabilities"];
    if (capabilities.IsDefined() && !capabilities.IsNull()) {
        if (!capabilities.IsMap()) {
            throw ConfigError("field 'drone.capabilities' must be a mapping");
        }
        for (const auto& entry : capabilities) {
            const auto name = entry.first.as<std::string>();
            vehicle.capabilities[name] = read_as<bool>(entry.second, "drone.capabilities." + name);
        }
    }
    return vehicle;
}

YamlConfigProvider::YamlConfigProvider(std::filesystem::path root)
    : path_root_(std::move(root)),
      logger_(get_logger()) {}

MissionDefinition YamlConfigProvider::load_mission(const std::string& mission_id) {
    const std::filesystem::path path = resolve("missions", mission_id);
    MissionDefinition mission = parse_mission(load_document(path));
    logger_->info("Loaded mission '{}' ({} commands) from {}", mission.name, mission.commands.size(), path.string());
    return mission;
}

VehicleProfile YamlConfigProvider::load_vehicle(const std::string& vehicle_id) {
    const std::filesystem::path path = resolve("vehicles", vehicle_id);
    VehicleProfile vehicle = parse_vehicle(load_document(path));
    logger_->info("Loaded vehicle '{}' from {}", vehicle.model, path.string());
    return vehicle;
}

const std::filesystem::path& YamlConfigProvider::root() const noexcept {
    return path_root_;
}

std::filesystem::path YamlConfigProvider::resolve(const std::string& subdirectory, const std::string& id) const {
    if (id.empty()) {
        throw ConfigError(fmt::format("empty {} id", subdirectory));
    }
    const std::filesystem::path directory = path_root_ / subdirectory;
    for (const std::string_view extension : k_document_extensions) {
        std::filesystem::path candidate = directory / (id + std::string(extension));
        std::error_code error;
        if (std::filesystem::is_regular_file(candidate, error)) {
            return candidate;
        }
    }
    throw ConfigError(fmt::format("no {} document named '{}' under {}", subdirectory, id, directory.string()));
}

YAML::Node YamlConfigProvider::load_document(const std::filesystem::path& path) const {
    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::Exception& ex) {
        throw ConfigError(fmt::format("failed to parse {}: {}", path.string(), ex.what()));
    }
}

}  // namespace drone_mission
