#include <cstdlib>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "drone_mission/config_provider.hpp"
#include "drone_mission/configuration.hpp"
#include "drone_mission/drone_state.hpp"
#include "drone_mission/logging.hpp"
#include "drone_mission/mission_controller.hpp"
#include "drone_mission/telemetry_sink.hpp"
#include "drone_mission/tick_pacer.hpp"
#include "drone_mission/version.hpp"

int main(int argc, char** argv) {
    using namespace drone_mission;

    try {
        RuntimeConfiguration configuration = ConfigurationLoader::load();

        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }
        if (argc > 1) {
            configuration.mission_id = argv[1];
        }
        if (argc > 2) {
            configuration.vehicle_id = argv[2];
        }

        auto logger = get_logger();
        logger->info("mission_runner {} starting mission '{}' on '{}'", k_version, configuration.mission_id, configuration.vehicle_id);

        YamlConfigProvider provider{configuration.config_root};
        LoggingTelemetrySink sink;
        std::unique_ptr<TickPacer> pacer;
        if (configuration.real_time) {
            pacer = std::make_unique<RealTimePacer>();
        } else {
            pacer = std::make_unique<ImmediatePacer>();
        }

        MissionController controller{configuration.engine, sink, *pacer};
        const MissionOutcome outcome = controller.execute(provider, configuration.mission_id, configuration.vehicle_id);

        logger->info("Outcome: {} ({}) after {} commands", to_string(outcome.kind), outcome.reason, outcome.commands_completed);
        logger->info("Summary: {:.1f}s flight, {:.1f}ft travelled, peak {:.1f}ft, battery {}% ({:.2f}V), {} snapshots",
                     outcome.summary.flight_time_s,
                     outcome.summary.distance_flown_ft,
                     outcome.summary.peak_altitude_ft,
                     outcome.summary.final_battery_percent,
                     outcome.summary.final_battery_voltage,
                     outcome.summary.telemetry_count);
        log_lines(*logger, spdlog::level::info, format_status_report(outcome.final_state));

        if (!outcome.succeeded()) {
            return EXIT_FAILURE;
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
