/**
 * @file dedup_guard.cpp
 * @brief Dedup guard implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "dedup_guard.hpp"
#include "beacon_logger.hpp"
#include "event_model.hpp"

namespace mailbeacon {

DedupGuard::DedupGuard(std::shared_ptr<const EventStore> events,
                       time_utils::Minutes window, time_utils::ClockFn clock)
    : events_(std::move(events)), window_(window), clock_(std::move(clock)) {}

bool DedupGuard::shouldSuppress(const std::string& email,
                                const std::optional<std::string>& messageId) const {
    return shouldSuppress(email, messageId, window_);
}

bool DedupGuard::shouldSuppress(const std::string& email,
                                const std::optional<std::string>& messageId,
                                time_utils::Minutes window) const {
    ++checks_;
    const auto cutoff = clock_() - window;
    const auto openType = toString(EventType::PIXEL_OPEN);
    bool found = false;

    // Appends with caller-supplied times can be out of order, so the scan
    // does not stop at the first record older than the cutoff.
    events_->scanReverse([&](const json::JsonValue& record) {
        if (record.getString("type") != openType) return true;
        if (record.getString("email") != email) return true;
        if (record.getString("message_id") != messageId) return true;

        auto stamp = record.getString("time");
        auto when = stamp ? time_utils::parseISO8601(*stamp) : std::nullopt;
        if (!when) {
            ++unparsable_;
            return true;
        }
        if (*when >= cutoff) {
            found = true;
            return false;
        }
        return true;
    });

    if (found) {
        ++suppressed_;
        LOG_DEBUG("DedupGuard", "Recent open already recorded for " + email);
    }
    return found;
}

} // namespace mailbeacon
