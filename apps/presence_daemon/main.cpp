#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "beacon_presence/configuration.hpp"
#include "beacon_presence/logging.hpp"
#include "beacon_presence/tracker_runtime.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace beacon_presence;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }

        TrackerRuntime runtime{configuration};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
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
