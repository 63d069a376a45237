/**
 * @file event_store.hpp
 * @brief Append-only line-delimited JSON event log
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Provides:
 * - EventStore interface with timestamping and tolerant line parsing
 * - FileEventStore: durable JSONL file with O_APPEND single-write appends
 *   and a block-wise reverse reader
 * - MemoryEventStore: in-process store with identical semantics
 */
#ifndef MAILBEACON_EVENT_STORE_HPP
#define MAILBEACON_EVENT_STORE_HPP

#include "beacon_json.hpp"
#include "beacon_time_utils.hpp"
#include "result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mailbeacon {

/// Receives one parsed record; return false to stop the scan
using RecordVisitor = std::function<bool(const json::JsonValue&)>;

/**
 * @struct EventStoreStatistics
 * @brief Store counters
 */
struct EventStoreStatistics {
    uint64_t appended = 0;
    uint64_t append_failures = 0;
    uint64_t skipped_lines = 0;
};

/**
 * @class EventStore
 * @brief Append-only sequence of one-line JSON object records
 *
 * Records are never updated or removed. Blank or malformed lines found
 * while reading are skipped and counted, never reported to the caller.
 */
class EventStore {
public:
    explicit EventStore(time_utils::ClockFn clock = time_utils::systemClock())
        : clock_(std::move(clock)) {}
    virtual ~EventStore() = default;

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    /**
     * @brief Append one record
     *
     * Adds a "time" member (UTC, microseconds) when the record has none.
     * @return INVALID_ARGUMENT for a non-object record, IO_ERROR when the
     *         line cannot be written
     */
    Result<void> append(json::JsonValue record);

    /// All records in append order
    [[nodiscard]] std::vector<json::JsonValue> readAll() const;

    /// Stream records newest first without loading the whole log
    void scanReverse(const RecordVisitor& visitor) const;

    /// Unmodified log content
    [[nodiscard]] virtual Result<std::string> readRaw() const = 0;

    /// Display name of the log
    [[nodiscard]] virtual std::string path() const = 0;

    [[nodiscard]] EventStoreStatistics statistics() const {
        EventStoreStatistics s;
        s.appended = appended_.load();
        s.append_failures = append_failures_.load();
        s.skipped_lines = skipped_lines_.load();
        return s;
    }

protected:
    using LineVisitor = std::function<bool(std::string_view)>;

    /// Persist one serialized record; line carries no trailing newline
    virtual Result<void> writeLine(const std::string& line) = 0;
    virtual void visitLines(const LineVisitor& visitor) const = 0;
    virtual void visitLinesReverse(const LineVisitor& visitor) const = 0;

private:
    std::optional<json::JsonValue> parseLine(std::string_view line) const;

    time_utils::ClockFn clock_;
    std::atomic<uint64_t> appended_{0};
    std::atomic<uint64_t> append_failures_{0};
    mutable std::atomic<uint64_t> skipped_lines_{0};
};

/**
 * @class FileEventStore
 * @brief Durable JSONL file store
 *
 * Each append opens the file with O_APPEND, writes the full line with one
 * write call and closes it, so lines from concurrent writers never
 * interleave. The file and its parent directory are created on first use.
 */
class FileEventStore : public EventStore {
public:
    explicit FileEventStore(std::filesystem::path file,
                            time_utils::ClockFn clock = time_utils::systemClock());

    [[nodiscard]] Result<std::string> readRaw() const override;
    [[nodiscard]] std::string path() const override { return file_.string(); }
    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    /// Create the parent directory and an empty log if either is missing
    Result<void> ensureFile() const;

    static constexpr std::size_t kReverseBlockSize = 64 * 1024;

protected:
    Result<void> writeLine(const std::string& line) override;
    void visitLines(const LineVisitor& visitor) const override;
    void visitLinesReverse(const LineVisitor& visitor) const override;

private:
    std::filesystem::path file_;
    mutable std::mutex mtx_;
};

/**
 * @class MemoryEventStore
 * @brief In-process store with the same parsing and ordering rules
 */
class MemoryEventStore : public EventStore {
public:
    explicit MemoryEventStore(std::string name = "events",
                              time_utils::ClockFn clock = time_utils::systemClock())
        : EventStore(std::move(clock)), name_(std::move(name)) {}

    [[nodiscard]] Result<std::string> readRaw() const override;
    [[nodiscard]] std::string path() const override { return "memory:" + name_; }

    /// Store a line verbatim, bypassing serialization
    void appendRawLine(std::string line);

    [[nodiscard]] std::size_t lineCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_.size();
    }

protected:
    Result<void> writeLine(const std::string& line) override;
    void visitLines(const LineVisitor& visitor) const override;
    void visitLinesReverse(const LineVisitor& visitor) const override;

private:
    std::vector<std::string> snapshot() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_;
    }

    std::string name_;
    std::vector<std::string> lines_;
    mutable std::mutex mtx_;
};

} // namespace mailbeacon
#endif
