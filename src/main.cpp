/**
 * @file main.cpp
 * @brief MailBeacon tracking server entry point
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "beacon_config.hpp"
#include "beacon_logger.hpp"
#include "tracking_api.hpp"
#include "tracking_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace mailbeacon;

namespace {

std::atomic<bool> g_shutdown{false};

extern "C" void onSignal(int) { g_shutdown = true; }

void printBanner() {
    std::cout << R"(
+===============================================================+
|            MailBeacon - Email Engagement Tracker              |
|                         Version 1.0.0                         |
|                    Author: Bennie Shearer                     |
|         Copyright (c) 2025 Bennie Shearer - MIT License       |
+===============================================================+
|  * Tracking pixel          * Click redirects                  |
|  * Image proxy             * JSONL event logs                 |
+===============================================================+
)" << "\n";
}

bool configureLogging(const LoggingConfig& cfg) {
    auto& logger = BeaconLogger::instance();
    auto level = parseLogLevel(cfg.level).value_or(LogLevel::LOG_INFO);
    logger.setConsoleOutput(cfg.console);
    logger.setLevel(level);
    if (!cfg.directory.empty() && !logger.initialize(cfg.directory, level)) {
        std::cerr << "Cannot open log directory: " << cfg.directory << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    std::filesystem::path config_path = "mailbeacon.ini";
    if (argc > 1) {
        config_path = argv[1];
    }

    BeaconConfig config;
    auto loaded = BeaconConfig::loadFromFile(config_path);
    if (loaded) {
        config = loaded.value();
        std::cout << "Configuration loaded from: " << config_path << "\n";
    } else if (loaded.error().is(ErrorCode::CONFIG_MISSING)) {
        std::cout << "No configuration at " << config_path << ", using defaults\n";
    } else {
        std::cerr << "Invalid configuration: " << loaded.error().toString() << "\n";
        return 1;
    }

    if (!configureLogging(config.logging)) {
        return 1;
    }

    auto service = std::make_shared<TrackingService>(config.tracking);
    TrackingAPI api(service, config.server);
    if (!api.start()) {
        std::cerr << "Failed to start HTTP server on " << config.server.bind_address
                  << ":" << config.server.port << "\n";
        BeaconLogger::instance().shutdown();
        return 1;
    }

    std::cout << "MailBeacon listening on " << config.server.bind_address << ":"
              << api.getPort() << "\n";
    for (const auto& route : api.routes()) {
        LOG_DEBUG("main", "Route " + methodToString(route.method) + " " + route.pattern + ": " + route.description);
    }
    std::cout << "Press Ctrl+C to stop.\n\n";

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down MailBeacon...\n";
    api.stop();
    auto stats = service->statistics();
    LOG_INFO("main", "Opens recorded: " + std::to_string(stats.opens_recorded) +
             ", suppressed: " + std::to_string(stats.opens_suppressed) +
             ", clicks: " + std::to_string(stats.clicks_recorded) +
             ", append failures: " + std::to_string(stats.append_failures));
    BeaconLogger::instance().shutdown();
    std::cout << "Goodbye!\n";
    return 0;
}
