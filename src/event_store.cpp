/**
 * @file event_store.cpp
 * @brief Event store implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "event_store.hpp"
#include "beacon_logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace mailbeacon {

//=============================================================================
// EventStore
//=============================================================================

Result<void> EventStore::append(json::JsonValue record) {
    if (!record.isObject()) {
        ++append_failures_;
        return Err(ErrorCode::INVALID_ARGUMENT, "Event record must be a JSON object");
    }
    if (!record.contains("time")) {
        record["time"] = time_utils::toISO8601Micros(clock_());
    }
    auto written = writeLine(record.dump());
    if (!written) {
        ++append_failures_;
        return written.withContext(path());
    }
    ++appended_;
    return Ok();
}

std::optional<json::JsonValue> EventStore::parseLine(std::string_view line) const {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    if (line.empty()) return std::nullopt;

    auto parsed = json::tryParse(line);
    if (!parsed || !parsed->isObject()) {
        ++skipped_lines_;
        LOG_DEBUG("EventStore", "Skipping malformed record in " + path());
        return std::nullopt;
    }
    return parsed;
}

std::vector<json::JsonValue> EventStore::readAll() const {
    std::vector<json::JsonValue> records;
    visitLines([&](std::string_view line) {
        if (auto record = parseLine(line)) {
            records.push_back(std::move(*record));
        }
        return true;
    });
    return records;
}

void EventStore::scanReverse(const RecordVisitor& visitor) const {
    visitLinesReverse([&](std::string_view line) {
        auto record = parseLine(line);
        return record ? visitor(*record) : true;
    });
}

//=============================================================================
// FileEventStore
//=============================================================================

namespace {

std::string systemErrorText(int err) {
    return std::error_code(err, std::generic_category()).message();
}

} // namespace

FileEventStore::FileEventStore(std::filesystem::path file, time_utils::ClockFn clock)
    : EventStore(std::move(clock)), file_(std::move(file)) {}

Result<void> FileEventStore::ensureFile() const {
    std::error_code ec;
    auto parent = file_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Err(ErrorCode::IO_ERROR, "Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
    if (std::filesystem::exists(file_, ec)) {
        return Ok();
    }
    std::ofstream create(file_, std::ios::app);
    if (!create) {
        return Err(ErrorCode::IO_ERROR, "Cannot create log file " + file_.string());
    }
    return Ok();
}

Result<void> FileEventStore::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto ready = ensureFile();
    if (!ready) return ready;

    std::string buffer = line;
    buffer.push_back('\n');

#ifdef _WIN32
    int fd = ::_open(file_.string().c_str(), _O_WRONLY | _O_CREAT | _O_APPEND | _O_BINARY,
                     _S_IREAD | _S_IWRITE);
#else
    int fd = ::open(file_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
#endif
    if (fd < 0) {
        return Err(ErrorCode::IO_ERROR, "open failed: " + systemErrorText(errno));
    }

    std::size_t offset = 0;
    while (offset < buffer.size()) {
#ifdef _WIN32
        auto n = ::_write(fd, buffer.data() + offset, static_cast<unsigned>(buffer.size() - offset));
#else
        auto n = ::write(fd, buffer.data() + offset, buffer.size() - offset);
#endif
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
#ifdef _WIN32
            ::_close(fd);
#else
            ::close(fd);
#endif
            return Err(ErrorCode::IO_ERROR, "write failed: " + systemErrorText(err));
        }
        offset += static_cast<std::size_t>(n);
    }

#ifdef _WIN32
    int rc = ::_close(fd);
#else
    int rc = ::close(fd);
#endif
    if (rc != 0) {
        return Err(ErrorCode::IO_ERROR, "close failed: " + systemErrorText(errno));
    }
    return Ok();
}

void FileEventStore::visitLines(const LineVisitor& visitor) const {
    auto ready = ensureFile();
    if (!ready) {
        LOG_ERROR("EventStore", ready.error().toString());
        return;
    }
    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        LOG_ERROR("EventStore", "Cannot open " + file_.string() + " for reading");
        return;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!visitor(line)) return;
    }
}

void FileEventStore::visitLinesReverse(const LineVisitor& visitor) const {
    auto ready = ensureFile();
    if (!ready) {
        LOG_ERROR("EventStore", ready.error().toString());
        return;
    }
    std::ifstream in(file_, std::ios::binary | std::ios::ate);
    if (!in) {
        LOG_ERROR("EventStore", "Cannot open " + file_.string() + " for reading");
        return;
    }

    auto remaining = static_cast<std::size_t>(in.tellg());
    std::string pending;   // partial line whose start lies in an earlier block
    std::string block;

    while (remaining > 0) {
        std::size_t n = std::min(kReverseBlockSize, remaining);
        remaining -= n;
        block.resize(n);
        in.seekg(static_cast<std::streamoff>(remaining));
        if (!in.read(block.data(), static_cast<std::streamsize>(n))) {
            LOG_ERROR("EventStore", "Short read in " + file_.string());
            return;
        }
        pending.insert(0, block);

        std::size_t nl;
        while ((nl = pending.rfind('\n')) != std::string::npos) {
            if (!visitor(std::string_view(pending).substr(nl + 1))) return;
            pending.resize(nl);
        }
    }
    if (!pending.empty()) {
        visitor(pending);
    }
}

Result<std::string> FileEventStore::readRaw() const {
    auto ready = ensureFile();
    if (!ready) return Err<std::string>(ready.error());

    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        return Err<std::string>(ErrorCode::IO_ERROR, "Cannot open " + file_.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return Ok(oss.str());
}

//=============================================================================
// MemoryEventStore
//=============================================================================

Result<void> MemoryEventStore::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.push_back(line);
    return Ok();
}

void MemoryEventStore::appendRawLine(std::string line) {
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.push_back(std::move(line));
}

void MemoryEventStore::visitLines(const LineVisitor& visitor) const {
    for (const auto& line : snapshot()) {
        if (!visitor(line)) return;
    }
}

void MemoryEventStore::visitLinesReverse(const LineVisitor& visitor) const {
    auto lines = snapshot();
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!visitor(*it)) return;
    }
}

Result<std::string> MemoryEventStore::readRaw() const {
    std::string raw;
    for (const auto& line : snapshot()) {
        raw += line;
        raw += '\n';
    }
    return Ok(std::move(raw));
}

} // namespace mailbeacon
