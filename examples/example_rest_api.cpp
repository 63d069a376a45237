/**
 * @file example_rest_api.cpp
 * @brief Serve the tracking endpoints on a local port
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#include "beacon_logger.hpp"
#include "tracking_api.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

using namespace mailbeacon;

int main() {
    std::cout << "MailBeacon v1.0.0 - REST API Demo\n";
    std::cout << "=================================\n\n";

    BeaconLogger::instance().setLevel(LogLevel::LOG_INFO);

    std::filesystem::path data_dir = "./beacon_rest_demo";
    TrackingConfig tracking;
    tracking.event_log = data_dir / "tracking_logs.jsonl";
    tracking.image_read_log = data_dir / "img_reads.jsonl";
    tracking.upload_dir = data_dir / "uploads";
    auto service = std::make_shared<TrackingService>(tracking);

    ServerConfig server;
    server.port = 8080;
    server.bind_address = "127.0.0.1";
    TrackingAPI api(service, server);
    if (!api.start()) {
        std::cerr << "Failed to start REST API on port " << server.port << "\n";
        return 1;
    }
    std::cout << "REST API started on port " << api.getPort() << "\n";

    std::cout << "\n=== API ENDPOINTS ===\n";
    for (const auto& route : api.routes()) {
        std::cout << methodToString(route.method) << " " << route.pattern << " - " << route.description << "\n";
    }
    std::cout << "\n=== CURL EXAMPLES ===\n";
    std::cout << "curl -o pixel.gif 'http://localhost:" << api.getPort() << "/api/img?email=a%40example.com'\n";
    std::cout << "curl -i 'http://localhost:" << api.getPort()
              << "/api/click?email=a%40example.com&redirect=https%3A%2F%2Fexample.com'\n";
    std::cout << "curl 'http://localhost:" << api.getPort() << "/tracking/latest?n=5'\n";

    std::cout << "\nPress Enter to stop...";
    std::cin.get();

    api.stop();
    std::filesystem::remove_all(data_dir);
    std::cout << "REST API Demo Complete\n";
    return 0;
}
