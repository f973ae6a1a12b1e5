/// @file main.cpp
/// @brief Rating simulator entry point.
///
/// Loads an optional YAML configuration, runs one simulation and prints
/// a completion line. Presentation of the results is left to consumers.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include "rsim/foundation/config_manager.hpp"
#include "rsim/foundation/sim_logger.hpp"
#include "rsim/rating/simulation_config.hpp"
#include "rsim/rating/simulation_driver.hpp"
#include "rsim/version.hpp"

namespace {

using rsim::foundation::ConfigManager;
using rsim::foundation::LogCategory;
using rsim::foundation::SimError;
using rsim::foundation::SimLogger;
using rsim::foundation::SimResult;

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

bool hasFlag(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return true;
        }
    }
    return false;
}

/// RSIM_CONFIG_PATH overrides the command line. No path means defaults.
SimResult<void> loadConfig(ConfigManager& config, std::filesystem::path path) {
    const char* envPath = std::getenv("RSIM_CONFIG_PATH");
    if (envPath != nullptr) {
        path = envPath;
    }
    if (path.empty()) {
        return SimResult<void>::ok();
    }
    return config.load(path);
}

SimResult<void> applyLogLevel(const ConfigManager& config) {
    if (!config.hasKey("logging.level")) {
        return SimResult<void>::ok();
    }
    auto name = config.get<std::string>("logging.level");
    if (!name) {
        return SimResult<void>::err(name.error());
    }
    auto level = rsim::foundation::parseLogLevel(name.value());
    if (!level) {
        return SimResult<void>::err(
            SimError(rsim::foundation::ErrorCode::InvalidConfiguration,
                     "unknown logging.level: " + name.value()));
    }
    SimLogger::instance().setAllCategoryLevels(*level);
    return SimResult<void>::ok();
}

} // namespace

int main(int argc, char* argv[]) {
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "rsim " << rsim::Version::string << "\n";
        return EXIT_SUCCESS;
    }

    ConfigManager config;
    auto loadResult = loadConfig(config, parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto levelResult = applyLogLevel(config);
    if (!levelResult) {
        std::cerr << "Invalid logging configuration: "
                  << levelResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto simConfig = rsim::rating::loadSimulationConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid simulation configuration: "
                  << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    RSIM_LOG_INFO(LogCategory::Core,
                  std::string("rsim ") + rsim::Version::string + " starting");

    rsim::rating::SimulationDriver driver(simConfig.value());
    auto result = driver.run();
    if (!result) {
        std::cerr << "Simulation failed (" << result.error().subsystem()
                  << "): " << result.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto& sim = result.value();
    std::cout << "Simulation finished (players: " << sim.population.size()
              << ", matches: " << sim.outcomes.size()
              << ", player1 wins: " << sim.subjectWins()
              << ", player2 wins: " << sim.opponentWins() << ")\n";

    auto flushResult = SimLogger::instance().flush();
    if (!flushResult) {
        std::cerr << "Failed to flush logs: "
                  << flushResult.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
