#include "drone_mission/mission_definition.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

#include "drone_mission/errors.hpp"

namespace drone_mission {

namespace {

constexpr std::size_t k_default_motor_count{4};
constexpr double k_max_motor_count{16.0};

/** @brief Accepted spellings for each command kind (upper-case). */
constexpr std::array<std::pair<std::string_view, CommandKind>, 8> k_command_aliases{{
    {"ASCEND", CommandKind::Ascend},
    {"TAKEOFF", CommandKind::Ascend},
    {"HOLD", CommandKind::Hold},
    {"HOVER", CommandKind::Hold},
    {"CIRCULAR_PATH", CommandKind::CircularPath},
    {"CIRCLE", CommandKind::CircularPath},
    {"DESCEND_AND_LAND", CommandKind::DescendAndLand},
    {"LAND", CommandKind::DescendAndLand},
}};

std::string to_upper(std::string_view text) {
    std::string upper{text};
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

template <typename T>
std::optional<T> find_typed(const ParameterMap& parameters, const std::string& key, std::string_view type_name) {
    const auto iterator_value = parameters.find(key);
    if (iterator_value == parameters.end()) {
        return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&iterator_value->second)) {
        return *value;
    }
    throw ConfigError("Parameter '" + key + "' must be a " + std::string{type_name});
}

}  // namespace

std::string_view to_string(CommandKind kind) noexcept {
    switch (kind) {
        case CommandKind::Ascend:
            return "ASCEND";
        case CommandKind::Hold:
            return "HOLD";
        case CommandKind::CircularPath:
            return "CIRCULAR_PATH";
        case CommandKind::DescendAndLand:
            return "DESCEND_AND_LAND";
    }
    return "UNKNOWN";
}

CommandKind command_kind_from_string(std::string_view name) {
    const std::string upper = to_upper(name);
    for (const auto& [alias, kind] : k_command_aliases) {
        if (alias == upper) {
            return kind;
        }
    }
    throw UnsupportedCommandError(std::string{name});
}

std::size_t VehicleProfile::motor_count() const {
    const auto iterator_spec = specifications.find("motor_count");
    if (iterator_spec == specifications.end()) {
        return k_default_motor_count;
    }
    const double* reported = std::get_if<double>(&iterator_spec->second);
    if (reported == nullptr || *reported < 1.0 || *reported > k_max_motor_count) {
        return k_default_motor_count;
    }
    return static_cast<std::size_t>(std::lround(*reported));
}

bool VehicleProfile::has_capability(const std::string& name) const {
    const auto iterator_capability = capabilities.find(name);
    return iterator_capability != capabilities.end() && iterator_capability->second;
}

std::optional<double> find_number(const ParameterMap& parameters, const std::string& key) {
    return find_typed<double>(parameters, key, "number");
}

std::optional<bool> find_bool(const ParameterMap& parameters, const std::string& key) {
    return find_typed<bool>(parameters, key, "boolean");
}

std::optional<std::string> find_string(const ParameterMap& parameters, const std::string& key) {
    return find_typed<std::string>(parameters, key, "string");
}

}  // namespace drone_mission
