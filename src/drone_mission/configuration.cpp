// === Configuration Loader ====================================================
//
// Centralizes parsing of the environment-driven settings that feed the
// mission_runner app.
//
// Responsibilities
// - Apply defaults for the config root, mission and vehicle ids, pacing and
//   the seeded link-noise layer.
// - Surface diagnostics via the logging subsystem whenever a value cannot be
//   parsed; the fallback is used instead.
//
// Mission and vehicle documents are not read here; YamlConfigProvider loads
// them from `config_root`.

#include "drone_mission/configuration.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "drone_mission/logging.hpp"

namespace drone_mission {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_config_root{"config"};
constexpr std::string_view k_default_mission_id{"cetus-lite-demo"};
constexpr std::string_view k_default_vehicle_id{"cetus-lite"};

std::string parse_string(const char* raw_value, std::string_view fallback) {
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

double parse_non_negative_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return parsed_value < 0.0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::uint32_t parse_seed(const char* raw_value, std::uint32_t fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        return static_cast<std::uint32_t>(std::stoul(raw_value));
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse seed from environment; using fallback {}", fallback);
        return fallback;
    }
}

bool parse_flag(const char* raw_value, bool fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string_view value{raw_value};
    if (value == "1" || value == "true" || value == "on" || value == "yes") {
        return true;
    }
    if (value == "0" || value == "false" || value == "off" || value == "no") {
        return false;
    }
    auto logger = get_logger();
    logger->warn("Unrecognized flag '{}' in environment; using fallback {}", value, fallback);
    return fallback;
}

}  // namespace

RuntimeConfiguration ConfigurationLoader::load() {
    RuntimeConfiguration config{};
    config.log_directory = parse_string(std::getenv("DRONE_MISSION_LOG_DIR"), k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string(std::getenv("DRONE_MISSION_LOG_LEVEL"), "");
    config.config_root = parse_string(std::getenv("DRONE_MISSION_CONFIG_ROOT"), k_default_config_root);
    config.mission_id = parse_string(std::getenv("DRONE_MISSION_MISSION_ID"), k_default_mission_id);
    config.vehicle_id = parse_string(std::getenv("DRONE_MISSION_VEHICLE_ID"), k_default_vehicle_id);
    config.real_time = parse_flag(std::getenv("DRONE_MISSION_REAL_TIME"), true);
    config.engine = load_engine_config();

    logger->info("Configuration loaded: config_root={} mission={} vehicle={} real_time={} noise_seed={} jitter={}%",
                 config.config_root.string(),
                 config.mission_id,
                 config.vehicle_id,
                 config.real_time,
                 config.engine.noise_seed,
                 config.engine.link.jitter_percent);

    return config;
}

EngineConfig ConfigurationLoader::load_engine_config() {
    EngineConfig engine{};
    engine.noise_seed = parse_seed(std::getenv("DRONE_MISSION_NOISE_SEED"), engine.noise_seed);
    engine.link.jitter_percent = parse_non_negative_double(std::getenv("DRONE_MISSION_SIGNAL_JITTER_PERCENT"), engine.link.jitter_percent);
    return engine;
}

}  // namespace drone_mission
