/**
 * @file tracking_service.hpp
 * @brief Main coordinator for open, click and query use cases
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * The TrackingService owns the event stores, the dedup guard, the image
 * resolver and the query facade. Stores, fetcher and clock can be
 * injected; otherwise file stores at the configured paths, an HttpClient
 * and the system clock are used.
 */
#ifndef MAILBEACON_TRACKING_SERVICE_HPP
#define MAILBEACON_TRACKING_SERVICE_HPP

#include "beacon_config.hpp"
#include "beacon_json.hpp"
#include "beacon_time_utils.hpp"
#include "dedup_guard.hpp"
#include "event_model.hpp"
#include "event_store.hpp"
#include "http_client.hpp"
#include "image_resolver.hpp"
#include "query_facade.hpp"
#include "result.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mailbeacon {

/**
 * @struct PixelRequest
 * @brief Inputs of one tracking pixel hit
 */
struct PixelRequest {
    std::string email;
    std::optional<std::string> message_id;
    std::optional<std::string> image;   ///< decoded image reference
    ClientInfo client;
};

struct ClickRequest {
    std::string email;
    std::optional<std::string> message_id;
    std::string redirect;
    ClientInfo client;
};

/**
 * @struct PixelOutcome
 * @brief What a pixel hit recorded and which image to return
 */
struct PixelOutcome {
    ResolvedImage image;
    bool recorded = false;     ///< pixel_open appended
    bool suppressed = false;   ///< dedup guard matched a recent open
};

/**
 * @struct TrackingDependencies
 * @brief Optional collaborators; null members get production defaults
 */
struct TrackingDependencies {
    std::shared_ptr<EventStore> events;
    std::shared_ptr<EventStore> image_reads;
    std::shared_ptr<RemoteFetcher> fetcher;
    time_utils::ClockFn clock;
};

struct TrackingStatistics {
    uint64_t opens_recorded = 0;
    uint64_t opens_suppressed = 0;
    uint64_t clicks_recorded = 0;
    uint64_t append_failures = 0;
};

/**
 * @class TrackingService
 * @brief Pixel, click and query operations over the two logs
 */
class TrackingService {
public:
    explicit TrackingService(TrackingConfig config, TrackingDependencies deps = {});

    TrackingService(const TrackingService&) = delete;
    TrackingService& operator=(const TrackingService&) = delete;

    /**
     * @brief Handle a pixel hit
     *
     * Records a pixel_open unless a matching open lies inside the dedup
     * window, then resolves the image. Append failures are logged and
     * never change the image returned.
     */
    [[nodiscard]] PixelOutcome trackOpen(const PixelRequest& request);

    /// Record a click; the caller redirects regardless of the result
    Result<void> trackClick(const ClickRequest& request);

    [[nodiscard]] IdentityView byIdentity(const std::string& email) const {
        return queries_.byIdentity(email);
    }
    [[nodiscard]] LatestView latest(std::size_t n) const { return queries_.latest(n); }
    [[nodiscard]] LatestView latest() const {
        return queries_.latest(static_cast<std::size_t>(config_.latest_default));
    }
    [[nodiscard]] Result<std::string> downloadEvents() const { return queries_.downloadEvents(); }
    [[nodiscard]] Result<std::string> downloadImageReads() const { return queries_.downloadImageReads(); }

    /// Liveness payload
    [[nodiscard]] json::JsonValue statusJson() const;

    [[nodiscard]] const TrackingConfig& config() const noexcept { return config_; }
    [[nodiscard]] EventStore& eventStore() noexcept { return *events_; }
    [[nodiscard]] EventStore& imageReadStore() noexcept { return *image_reads_; }
    [[nodiscard]] const DedupGuard& dedupGuard() const noexcept { return guard_; }
    [[nodiscard]] const ImageResolver& imageResolver() const noexcept { return resolver_; }

    [[nodiscard]] TrackingStatistics statistics() const {
        TrackingStatistics s;
        s.opens_recorded = opens_recorded_.load();
        s.opens_suppressed = opens_suppressed_.load();
        s.clicks_recorded = clicks_recorded_.load();
        s.append_failures = append_failures_.load();
        return s;
    }

private:
    static TrackingDependencies withDefaults(const TrackingConfig& config, TrackingDependencies deps);

    TrackingConfig config_;
    TrackingDependencies deps_;
    std::shared_ptr<EventStore> events_;
    std::shared_ptr<EventStore> image_reads_;
    DedupGuard guard_;
    ImageResolver resolver_;
    QueryFacade queries_;

    std::atomic<uint64_t> opens_recorded_{0};
    std::atomic<uint64_t> opens_suppressed_{0};
    std::atomic<uint64_t> clicks_recorded_{0};
    std::atomic<uint64_t> append_failures_{0};
};

} // namespace mailbeacon
#endif
