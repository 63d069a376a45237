/**
 * @file query_facade.hpp
 * @brief Read-side projections over the event and image-read logs
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_QUERY_FACADE_HPP
#define MAILBEACON_QUERY_FACADE_HPP

#include "beacon_json.hpp"
#include "event_store.hpp"
#include "result.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace mailbeacon {

/**
 * @struct IdentityView
 * @brief Everything recorded for one email, in append order
 */
struct IdentityView {
    json::JsonArray opens;
    json::JsonArray clicks;
    json::JsonArray img_reads;

    [[nodiscard]] json::JsonValue toJson() const {
        return json::object()
            .add("opens", opens)
            .add("clicks", clicks)
            .add("img_reads", img_reads)
            .build();
    }
};

/**
 * @struct LatestView
 * @brief Most recent records of each log, newest first
 */
struct LatestView {
    json::JsonArray events;
    json::JsonArray img_reads;

    [[nodiscard]] json::JsonValue toJson() const {
        return json::object()
            .add("events", events)
            .add("img_reads", img_reads)
            .build();
    }
};

/**
 * @class QueryFacade
 * @brief Flat scans over the two logs; no filtering beyond email and type
 */
class QueryFacade {
public:
    static constexpr std::size_t kDefaultLatest = 200;

    QueryFacade(std::shared_ptr<const EventStore> events,
                std::shared_ptr<const EventStore> imageReads);

    /// pixel_open and click events plus image reads for the email
    [[nodiscard]] IdentityView byIdentity(const std::string& email) const;

    /// Up to n most recently appended records of each log
    [[nodiscard]] LatestView latest(std::size_t n = kDefaultLatest) const;

    [[nodiscard]] Result<std::string> downloadEvents() const { return events_->readRaw(); }
    [[nodiscard]] Result<std::string> downloadImageReads() const { return image_reads_->readRaw(); }

private:
    static json::JsonArray newest(const EventStore& store, std::size_t n);

    std::shared_ptr<const EventStore> events_;
    std::shared_ptr<const EventStore> image_reads_;
};

} // namespace mailbeacon
#endif
