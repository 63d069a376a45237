/**
 * @file tracking_service.cpp
 * @brief Tracking service implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "tracking_service.hpp"
#include "beacon_logger.hpp"

namespace mailbeacon {

TrackingDependencies TrackingService::withDefaults(const TrackingConfig& config,
                                                   TrackingDependencies deps) {
    if (!deps.clock) deps.clock = time_utils::systemClock();
    if (!deps.events) {
        deps.events = std::make_shared<FileEventStore>(config.event_log, deps.clock);
    }
    if (!deps.image_reads) {
        deps.image_reads = std::make_shared<FileEventStore>(config.image_read_log, deps.clock);
    }
    if (!deps.fetcher) deps.fetcher = std::make_shared<HttpClient>();
    return deps;
}

TrackingService::TrackingService(TrackingConfig config, TrackingDependencies deps)
    : config_(std::move(config)),
      deps_(withDefaults(config_, std::move(deps))),
      events_(deps_.events),
      image_reads_(deps_.image_reads),
      guard_(events_, time_utils::Minutes(config_.dedup_window_minutes), deps_.clock),
      resolver_(config_.upload_dir, image_reads_, deps_.fetcher,
                std::chrono::seconds(config_.remote_timeout_seconds)),
      queries_(events_, image_reads_) {
    LOG_INFO("TrackingService", "Events: " + events_->path() + ", image reads: " +
             image_reads_->path() + ", uploads: " + config_.upload_dir.string());
}

PixelOutcome TrackingService::trackOpen(const PixelRequest& request) {
    PixelOutcome outcome;

    if (guard_.shouldSuppress(request.email, request.message_id)) {
        outcome.suppressed = true;
        ++opens_suppressed_;
        LOG_DEBUG("TrackingService", "Suppressed repeat open for " + request.email);
    } else {
        auto appended = events_->append(
            makePixelOpenEvent(request.email, request.message_id, request.image, request.client));
        if (appended) {
            outcome.recorded = true;
            ++opens_recorded_;
            LOG_INFO("TrackingService", "Open recorded for " + request.email +
                     (request.message_id ? " message " + *request.message_id : std::string()));
        } else {
            ++append_failures_;
            LOG_ERROR("TrackingService", "Failed to record open: " + appended.error().toString());
        }
    }

    outcome.image = resolver_.resolve(request.image, request.email, request.message_id);
    return outcome;
}

Result<void> TrackingService::trackClick(const ClickRequest& request) {
    auto appended = events_->append(
        makeClickEvent(request.email, request.message_id, request.redirect, request.client));
    if (!appended) {
        ++append_failures_;
        LOG_ERROR("TrackingService", "Failed to record click: " + appended.error().toString());
        return appended;
    }
    ++clicks_recorded_;
    LOG_INFO("TrackingService", "Click recorded for " + request.email + " -> " + request.redirect);
    return Ok();
}

json::JsonValue TrackingService::statusJson() const {
    return json::object()
        .add("status", "ok")
        .add("message", "API is working!")
        .build();
}

} // namespace mailbeacon
