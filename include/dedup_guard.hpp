/**
 * @file dedup_guard.hpp
 * @brief Suppression of repeated pixel opens inside a time window
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_DEDUP_GUARD_HPP
#define MAILBEACON_DEDUP_GUARD_HPP

#include "beacon_time_utils.hpp"
#include "event_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mailbeacon {

/**
 * @struct DedupStatistics
 * @brief Dedup guard counters
 */
struct DedupStatistics {
    uint64_t checks = 0;
    uint64_t suppressed = 0;
    uint64_t unparsable_times = 0;
};

/**
 * @class DedupGuard
 * @brief Decides whether a pixel_open for (email, message_id) was already
 *        recorded within the window
 *
 * The check and the following append are not atomic: two concurrent
 * requests for the same identity can both pass.
 */
class DedupGuard {
public:
    static constexpr time_utils::Minutes kDefaultWindow{10};

    explicit DedupGuard(std::shared_ptr<const EventStore> events,
                        time_utils::Minutes window = kDefaultWindow,
                        time_utils::ClockFn clock = time_utils::systemClock());

    /**
     * @brief True when a matching pixel_open exists with time >= now - window
     *
     * Records with a missing or unparsable time never match. An absent
     * message_id only matches records whose message_id is absent or null.
     */
    [[nodiscard]] bool shouldSuppress(const std::string& email,
                                      const std::optional<std::string>& messageId) const;

    [[nodiscard]] bool shouldSuppress(const std::string& email,
                                      const std::optional<std::string>& messageId,
                                      time_utils::Minutes window) const;

    [[nodiscard]] time_utils::Minutes window() const noexcept { return window_; }

    [[nodiscard]] DedupStatistics statistics() const {
        return {checks_.load(), suppressed_.load(), unparsable_.load()};
    }

private:
    std::shared_ptr<const EventStore> events_;
    time_utils::Minutes window_;
    time_utils::ClockFn clock_;
    mutable std::atomic<uint64_t> checks_{0};
    mutable std::atomic<uint64_t> suppressed_{0};
    mutable std::atomic<uint64_t> unparsable_{0};
};

} // namespace mailbeacon
#endif
