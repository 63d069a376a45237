/**
 * @file test_event_store.cpp
 * @brief Tests for the file and memory event stores
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "beacon_json.hpp"
#include "beacon_time_utils.hpp"
#include "event_model.hpp"
#include "event_store.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mailbeacon;
using namespace mailbeacon::testing;

namespace {

time_utils::TimePoint fixedTime() {
    return time_utils::TimePoint(std::chrono::seconds(1736164800));
}

json::JsonValue numbered(int i) {
    return json::object().add("type", "click").add("email", "n" + std::to_string(i) + "@x.test").build();
}

std::vector<std::string> emailsNewestFirst(const EventStore& store, std::size_t limit = 1000000) {
    std::vector<std::string> out;
    store.scanReverse([&](const json::JsonValue& record) {
        out.push_back(record.getString("email").value_or("<none>"));
        return out.size() < limit;
    });
    return out;
}

std::string fileContent(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE_SUITE(AppendAssignsTimeAndKeepsOrder, FileStore) {
    TempDirectory dir;
    FileEventStore store(dir / "tracking_logs.jsonl", [] { return fixedTime(); });

    REQUIRE_OK(store.append(numbered(1)));
    REQUIRE_OK(store.append(numbered(2)));
    REQUIRE_OK(store.append(numbered(3)));

    auto records = store.readAll();
    REQUIRE_SIZE(records, 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE_EQ(records[i].getString("email").value_or(""), "n" + std::to_string(i + 1) + "@x.test");
        REQUIRE_EQ(records[i].getString("time").value_or(""), "2025-01-06T12:00:00.000000Z");
    }
    REQUIRE_EQ(store.statistics().appended, 3u);
}

TEST_CASE_SUITE(ExistingTimeIsKept, FileStore) {
    TempDirectory dir;
    FileEventStore store(dir / "events.jsonl");
    auto record = numbered(1);
    record["time"] = "2024-05-01T08:00:00.000000Z";
    REQUIRE_OK(store.append(record));
    REQUIRE_EQ(store.readAll().at(0).getString("time").value_or(""), "2024-05-01T08:00:00.000000Z");
}

TEST_CASE_SUITE(OneCompactLinePerRecord, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    FileEventStore store(path, [] { return fixedTime(); });
    auto record = json::object().add("type", "click").add("redirect", "https://x.test/a\nb").build();
    REQUIRE_OK(store.append(record));
    REQUIRE_OK(store.append(numbered(2)));

    std::string content = fileContent(path);
    REQUIRE_EQ(std::count(content.begin(), content.end(), '\n'), 2);
    REQUIRE_EQ(content.back(), '\n');
    REQUIRE_EQ(store.readAll().at(0).getString("redirect").value_or(""), "https://x.test/a\nb");
}

TEST_CASE_SUITE(CreatesParentDirectoryLazily, FileStore) {
    TempDirectory dir;
    auto path = dir / "nested" / "deeper" / "events.jsonl";
    FileEventStore store(path);
    REQUIRE_FALSE(std::filesystem::exists(path));

    REQUIRE_EMPTY(store.readAll());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_EQ(std::filesystem::file_size(path), 0u);

    REQUIRE_OK(store.append(numbered(1)));
    REQUIRE_SIZE(store.readAll(), 1);
}

TEST_CASE_SUITE(AppendNeverTruncates, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    {
        FileEventStore first(path);
        REQUIRE_OK(first.append(numbered(1)));
    }
    FileEventStore second(path);
    REQUIRE_OK(second.append(numbered(2)));
    REQUIRE_SIZE(second.readAll(), 2);
}

TEST_CASE_SUITE(RejectsNonObjectRecords, FileStore) {
    TempDirectory dir;
    FileEventStore store(dir / "events.jsonl");
    REQUIRE_ERROR(store.append(json::JsonValue("just a string")), ErrorCode::INVALID_ARGUMENT);
    REQUIRE_ERROR(store.append(json::parse("[1,2]")), ErrorCode::INVALID_ARGUMENT);
    REQUIRE_EMPTY(store.readAll());
    REQUIRE_EQ(store.statistics().append_failures, 2u);
}

TEST_CASE_SUITE(UnwritableLocationReportsIoError, FileStore) {
    TempDirectory dir;
    auto blocker = dir / "not_a_dir";
    {
        std::ofstream out(blocker);
        out << "file";
    }
    FileEventStore store(blocker / "events.jsonl");
    REQUIRE_ERROR(store.append(numbered(1)), ErrorCode::IO_ERROR);
    REQUIRE_ERROR(store.readRaw(), ErrorCode::IO_ERROR);
}

TEST_CASE_SUITE(MalformedLinesAreSkipped, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    FileEventStore store(path);
    REQUIRE_OK(store.append(numbered(1)));
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"type\":\"click\",\"email\":\"trunc\n";
        out << "\n";
        out << "   \n";
        out << "[\"array\",\"not\",\"object\"]\n";
        out << "42\n";
    }
    REQUIRE_OK(store.append(numbered(2)));

    std::vector<json::JsonValue> records;
    REQUIRE_NOTHROW(records = store.readAll());
    REQUIRE_SIZE(records, 2);
    REQUIRE_EQ(records[1].getString("email").value_or(""), "n2@x.test");

    auto reversed = emailsNewestFirst(store);
    REQUIRE_SIZE(reversed, 2);
    REQUIRE_EQ(reversed[0], "n2@x.test");
    REQUIRE_EQ(reversed[1], "n1@x.test");
    REQUIRE_GE(store.statistics().skipped_lines, 3u);
}

TEST_CASE_SUITE(ReverseScanStopsEarly, FileStore) {
    TempDirectory dir;
    FileEventStore store(dir / "events.jsonl");
    for (int i = 1; i <= 5; ++i) REQUIRE_OK(store.append(numbered(i)));

    auto two = emailsNewestFirst(store, 2);
    REQUIRE_SIZE(two, 2);
    REQUIRE_EQ(two[0], "n5@x.test");
    REQUIRE_EQ(two[1], "n4@x.test");
}

TEST_CASE_SUITE(ReverseScanCrossesBlockBoundaries, FileStore) {
    TempDirectory dir;
    FileEventStore store(dir / "events.jsonl");
    // Records around 1 KiB each so lines straddle the 64 KiB read blocks
    const std::string padding(1000, 'p');
    const int count = 300;
    for (int i = 0; i < count; ++i) {
        auto record = numbered(i);
        record["padding"] = padding;
        REQUIRE_OK(store.append(record));
    }
    REQUIRE_GE(std::filesystem::file_size(dir / "events.jsonl"), 3 * FileEventStore::kReverseBlockSize);

    auto reversed = emailsNewestFirst(store);
    REQUIRE_SIZE(reversed, count);
    for (int i = 0; i < count; ++i) {
        REQUIRE_EQ(reversed[i], "n" + std::to_string(count - 1 - i) + "@x.test");
    }
}

TEST_CASE_SUITE(FileWithoutTrailingNewline, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    {
        std::ofstream out(path);
        out << "{\"email\":\"a\"}\n{\"email\":\"b\"}";
    }
    FileEventStore store(path);
    auto reversed = emailsNewestFirst(store);
    REQUIRE_SIZE(reversed, 2);
    REQUIRE_EQ(reversed[0], "b");
    REQUIRE_SIZE(store.readAll(), 2);
}

TEST_CASE_SUITE(ReadRawIsUnmodified, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    FileEventStore store(path);
    REQUIRE_OK(store.append(numbered(1)));
    {
        std::ofstream out(path, std::ios::app);
        out << "garbage line\n";
    }
    auto raw = store.readRaw();
    REQUIRE_OK(raw);
    REQUIRE_EQ(*raw, fileContent(path));
    REQUIRE_CONTAINS(*raw, "garbage line");
}

TEST_CASE_SUITE(ConcurrentAppendsStayLineAtomic, FileStore) {
    TempDirectory dir;
    auto path = dir / "events.jsonl";
    auto store = std::make_shared<FileEventStore>(path);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([store, t] {
            for (int i = 0; i < 50; ++i) {
                auto record = numbered(t * 100 + i);
                record["padding"] = std::string(512, static_cast<char>('a' + t));
                auto appended = store->append(record);
                if (!appended) return;
            }
        });
    }
    for (auto& w : writers) w.join();

    REQUIRE_SIZE(store->readAll(), 200);
    REQUIRE_EQ(store->statistics().skipped_lines, 0u);
}

TEST_CASE_SUITE(SameSemanticsAsFileStore, MemoryStore) {
    MemoryEventStore store("events", [] { return fixedTime(); });
    REQUIRE_EQ(store.path(), "memory:events");
    REQUIRE_OK(store.append(numbered(1)));
    store.appendRawLine("{broken");
    store.appendRawLine("");
    REQUIRE_OK(store.append(numbered(2)));
    REQUIRE_EQ(store.lineCount(), 4u);

    auto records = store.readAll();
    REQUIRE_SIZE(records, 2);
    REQUIRE_EQ(records[0].getString("time").value_or(""), "2025-01-06T12:00:00.000000Z");

    auto reversed = emailsNewestFirst(store);
    REQUIRE_SIZE(reversed, 2);
    REQUIRE_EQ(reversed[0], "n2@x.test");

    auto raw = store.readRaw();
    REQUIRE_OK(raw);
    REQUIRE_CONTAINS(*raw, "{broken\n");
    REQUIRE_EQ(store.statistics().skipped_lines, 2u);
}

TEST_CASE_SUITE(EventFactoriesProduceExpectedFields, EventModel) {
    ClientInfo client;
    client.user_agent = "Mail/1.0";
    auto open = makePixelOpenEvent("a@x.test", std::nullopt, std::string("logo.png"), client);
    REQUIRE_EQ(open.getString("type").value_or(""), "pixel_open");
    REQUIRE(open["message_id"].isNull());
    REQUIRE(open["remote_addr"].isNull());
    REQUIRE_EQ(open.getString("image_param").value_or(""), "logo.png");
    REQUIRE_EQ(open.getString("user_agent").value_or(""), "Mail/1.0");
    REQUIRE_FALSE(open.contains("time"));

    auto click = makeClickEvent("a@x.test", std::string("m-1"), "https://x.test", client);
    REQUIRE_EQ(click.getString("type").value_or(""), "click");
    REQUIRE_EQ(click.getString("redirect").value_or(""), "https://x.test");
    REQUIRE_EQ(click.getString("message_id").value_or(""), "m-1");

    ImageReadEvent remote;
    remote.email = "a@x.test";
    remote.served = ImageSource::REMOTE;
    remote.reference = "https://cdn.x.test/a.png";
    remote.error = "[TIMEOUT] slow";
    auto read = remote.toJson();
    REQUIRE_EQ(read.getString("served").value_or(""), "remote");
    REQUIRE_EQ(read.getString("url").value_or(""), "https://cdn.x.test/a.png");
    REQUIRE_FALSE(read.contains("filename"));
    REQUIRE_EQ(read.getString("error").value_or(""), "[TIMEOUT] slow");
}

MAILBEACON_TEST_MAIN("Event Store")
