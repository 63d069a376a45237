/**
 * @file example_basic.cpp
 * @brief Record opens and clicks in-process and query them back
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#include "tracking_service.hpp"
#include <filesystem>
#include <iostream>

using namespace mailbeacon;

int main() {
    std::cout << "MailBeacon v1.0.0 - Basic Tracking Demo\n";
    std::cout << "=======================================\n\n";

    std::filesystem::path data_dir = "./beacon_basic_demo";
    TrackingConfig config;
    config.event_log = data_dir / "tracking_logs.jsonl";
    config.image_read_log = data_dir / "img_reads.jsonl";
    config.upload_dir = data_dir / "uploads";
    TrackingService service(config);

    std::cout << "=== Pixel Opens ===\n";
    PixelRequest open;
    open.email = "reader@example.com";
    open.message_id = "newsletter-42";
    open.client.user_agent = "DemoMail/1.0";
    auto first = service.trackOpen(open);
    auto second = service.trackOpen(open);
    std::cout << "First open recorded:  " << (first.recorded ? "yes" : "no") << "\n";
    std::cout << "Second open recorded: " << (second.recorded ? "yes" : "no")
              << (second.suppressed ? " (inside dedup window)" : "") << "\n";
    std::cout << "Served " << first.image.bytes.size() << " bytes of " << first.image.content_type << "\n";

    std::cout << "\n=== Clicks ===\n";
    ClickRequest click;
    click.email = "reader@example.com";
    click.message_id = "newsletter-42";
    click.redirect = "https://example.com/offer";
    for (int i = 0; i < 2; ++i) {
        auto recorded = service.trackClick(click);
        if (!recorded) {
            std::cerr << "Click not recorded: " << recorded.error().toString() << "\n";
            return 1;
        }
    }

    std::cout << "\n=== Queries ===\n";
    auto view = service.byIdentity("reader@example.com");
    std::cout << "Opens: " << view.opens.size() << ", clicks: " << view.clicks.size() << "\n";
    std::cout << "Latest 2: " << service.latest(2).toJson().dump(2) << "\n";

    auto stats = service.statistics();
    std::cout << "\nRecorded " << stats.opens_recorded << " open(s), suppressed "
              << stats.opens_suppressed << ", clicks " << stats.clicks_recorded << "\n";

    std::filesystem::remove_all(data_dir);
    std::cout << "\nBasic Demo Complete\n";
    return 0;
}
