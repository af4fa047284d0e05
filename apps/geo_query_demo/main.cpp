#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "geo_query/configuration.hpp"
#include "geo_query/logging.hpp"
#include "geo_query/tracker_simulation.hpp"
#include "geo_query/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace geo_query;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }
        get_logger()->info("geo_query demo {}", k_version);

        TrackerSimulation simulation{configuration};
        simulation.initialize();
        simulation.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        simulation.shutdown();
        const EventTally tally = simulation.tally();
        get_logger()->info("Events: entered={} exited={} moved={} changed={} errors={} ready={}",
                           tally.entered, tally.exited, tally.moved, tally.changed, tally.errors, tally.ready);
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
