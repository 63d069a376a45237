/**
 * @file test_foundation.cpp
 * @brief Tests for JSON, time, string, MIME and configuration utilities
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "beacon_config.hpp"
#include "beacon_ini.hpp"
#include "beacon_json.hpp"
#include "beacon_string_utils.hpp"
#include "beacon_time_utils.hpp"
#include "mime_types.hpp"
#include "result.hpp"

#include <chrono>
#include <fstream>
#include <string>

using namespace mailbeacon;
using namespace mailbeacon::testing;

// JSON

TEST_CASE_SUITE(DumpIsSingleLine, Json) {
    auto v = json::object()
        .add("email", "a@b.c")
        .add("note", "line1\nline2\ttab \"quoted\"")
        .addNull("message_id")
        .build();
    std::string text = v.dump();
    REQUIRE(text.find('\n') == std::string::npos);
    REQUIRE_CONTAINS(text, "\\n");
    REQUIRE_CONTAINS(text, "\"message_id\":null");

    auto back = json::parse(text);
    REQUIRE(back == v);
    REQUIRE_EQ(back.getString("note").value_or(""), "line1\nline2\ttab \"quoted\"");
}

TEST_CASE_SUITE(ObjectKeysDumpInSortedOrder, Json) {
    auto v = json::object()
        .add("type", "pixel_open")
        .add("email", "a@b.c")
        .add("time", "2025-01-06T12:00:00.000000Z")
        .build();
    REQUIRE_EQ(v.dump(), "{\"email\":\"a@b.c\",\"time\":\"2025-01-06T12:00:00.000000Z\",\"type\":\"pixel_open\"}");
}

TEST_CASE_SUITE(OptionalStringMapsToNull, Json) {
    std::optional<std::string> none;
    std::optional<std::string> some = "m-1";
    auto v = json::object().add("a", none).add("b", some).build();
    REQUIRE(v["a"].isNull());
    REQUIRE_EQ(v.getString("b").value_or(""), "m-1");
    REQUIRE_FALSE(v.getString("a").has_value());
    REQUIRE_FALSE(v.getString("missing").has_value());
}

TEST_CASE_SUITE(UnicodeEscapesDecodeToUtf8, Json) {
    auto v = json::parse(R"({"s":"café 😀"})");
    REQUIRE_EQ(v.getString("s").value_or(""), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST_CASE_SUITE(TryParseRejectsGarbage, Json) {
    REQUIRE_FALSE(json::tryParse("{not json").has_value());
    REQUIRE_FALSE(json::tryParse("").has_value());
    REQUIRE_FALSE(json::tryParse("{\"a\":1} trailing").has_value());
    REQUIRE(json::tryParse("[1,2,3]").has_value());
    REQUIRE_THROWS_AS(json::parse("{\"a\":"), json::JsonParseError);
}

TEST_CASE_SUITE(ArrayIndexing, Json) {
    json::JsonValue arr = json::parse("[\"x\",\"y\"]");
    REQUIRE_EQ(arr.size(), 2u);
    REQUIRE_EQ(arr[0].asString(), "x");
    arr[1] = "z";
    REQUIRE_EQ(arr[1].asString(), "z");
}

// Time

TEST_CASE_SUITE(FormatsMicrosecondsWithZ, Time) {
    auto tp = time_utils::TimePoint(std::chrono::seconds(1736164800)) + std::chrono::microseconds(123456);
    REQUIRE_EQ(time_utils::toISO8601Micros(tp), "2025-01-06T12:00:00.123456Z");
    auto zero = time_utils::TimePoint(std::chrono::seconds(1736164800));
    REQUIRE_EQ(time_utils::toISO8601Micros(zero), "2025-01-06T12:00:00.000000Z");
}

TEST_CASE_SUITE(ParsesFormattedTimestamps, Time) {
    auto tp = time_utils::TimePoint(std::chrono::seconds(1736164800)) + std::chrono::microseconds(42);
    auto parsed = time_utils::parseISO8601(time_utils::toISO8601Micros(tp));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == tp);
}

TEST_CASE_SUITE(ParsesOffsetsAndNaiveTimes, Time) {
    auto utc = time_utils::parseISO8601("2025-01-06T12:00:00Z");
    auto offset = time_utils::parseISO8601("2025-01-06T14:00:00+02:00");
    auto naive = time_utils::parseISO8601("2025-01-06T12:00:00.000000");
    REQUIRE(utc && offset && naive);
    REQUIRE(*utc == *offset);
    REQUIRE(*utc == *naive);
}

TEST_CASE_SUITE(RejectsInvalidTimestamps, Time) {
    REQUIRE_FALSE(time_utils::parseISO8601("").has_value());
    REQUIRE_FALSE(time_utils::parseISO8601("yesterday").has_value());
    REQUIRE_FALSE(time_utils::parseISO8601("2025-13-01T00:00:00Z").has_value());
    REQUIRE_FALSE(time_utils::parseISO8601("2025-02-30T00:00:00Z").has_value());
    REQUIRE_FALSE(time_utils::parseISO8601("2025-01-06T12:00:00Zjunk").has_value());
}

// Strings

TEST_CASE_SUITE(UrlDecodeHandlesPlusAndEscapes, Strings) {
    REQUIRE_EQ(string_utils::urlDecode("a+b%20c"), "a b c");
    REQUIRE_EQ(string_utils::urlDecode("a+b", false), "a+b");
    REQUIRE_EQ(string_utils::urlDecode("https%3A%2F%2Fx.test%2Fa.png"), "https://x.test/a.png");
    REQUIRE_EQ(string_utils::urlDecode("100%"), "100%");
    REQUIRE_EQ(string_utils::urlDecode("%zz%4"), "%zz%4");
    REQUIRE_EQ(string_utils::urlDecode("%41"), "A");
}

TEST_CASE_SUITE(UrlEncodeKeepsUnreserved, Strings) {
    REQUIRE_EQ(string_utils::urlEncode("a b/c~d"), "a%20b%2Fc~d");
    REQUIRE_EQ(string_utils::urlDecode(string_utils::urlEncode("x@y.z?q=1&r")), "x@y.z?q=1&r");
}

TEST_CASE_SUITE(LastPathSegmentStripsDirectories, Strings) {
    REQUIRE_EQ(string_utils::lastPathSegment("../../etc/passwd"), "passwd");
    REQUIRE_EQ(string_utils::lastPathSegment("..\\..\\boot.ini"), "boot.ini");
    REQUIRE_EQ(string_utils::lastPathSegment("photo.png"), "photo.png");
    REQUIRE_EQ(string_utils::lastPathSegment("dir/"), "");
}

TEST_CASE_SUITE(PrefixAndIntegerHelpers, Strings) {
    REQUIRE(string_utils::startsWithIgnoreCase("HTTPS://x", "https://"));
    REQUIRE_FALSE(string_utils::startsWithIgnoreCase("http", "https://"));
    REQUIRE_EQ(string_utils::toInt<int>("42").value_or(-1), 42);
    REQUIRE_FALSE(string_utils::toInt<int>("4x").has_value());
    REQUIRE_FALSE(string_utils::toInt<int>("").has_value());
    REQUIRE_EQ(string_utils::trim("  padded \t"), "padded");
}

// MIME

TEST_CASE_SUITE(GuessesByExtension, Mime) {
    REQUIRE_EQ(mime::guessType("photo.png"), "image/png");
    REQUIRE_EQ(mime::guessType("PHOTO.JPG"), "image/jpeg");
    REQUIRE_EQ(mime::guessType("banner.gif"), "image/gif");
    REQUIRE_EQ(mime::guessType("archive.xyz"), "application/octet-stream");
    REQUIRE_EQ(mime::guessType("noextension"), "application/octet-stream");
}

// Configuration

TEST_CASE_SUITE(DefaultsAreValid, Config) {
    BeaconConfig config;
    REQUIRE_OK(ConfigValidator::validate(config));
    REQUIRE_EQ(config.server.port, 8000);
    REQUIRE_EQ(config.tracking.dedup_window_minutes, 10);
    REQUIRE_EQ(config.tracking.remote_timeout_seconds, 8);
    REQUIRE_EQ(config.tracking.latest_default, 200);
    REQUIRE_EQ(config.tracking.event_log.string(), "tracking_logs.jsonl");
    REQUIRE_EQ(config.tracking.image_read_log.string(), "img_reads.jsonl");
}

TEST_CASE_SUITE(LoadsSectionsFromIni, Config) {
    auto ini = ini::IniFile::parse(
        "; MailBeacon\n"
        "[server]\n"
        "port = 9090\n"
        "bind_address = 127.0.0.1\n"
        "[storage]\n"
        "event_log = /var/lib/mailbeacon/events.jsonl\n"
        "upload_dir = /srv/uploads\n"
        "[tracking]\n"
        "dedup_window_minutes = 30\n"
        "[logging]\n"
        "level = debug\n"
        "console = off\n"
        "[unknown]\n"
        "ignored = yes\n");
    auto config = BeaconConfig::loadFromIni(ini);
    REQUIRE_OK(config);
    REQUIRE_EQ(config->server.port, 9090);
    REQUIRE_EQ(config->server.bind_address, "127.0.0.1");
    REQUIRE_EQ(config->tracking.event_log.string(), "/var/lib/mailbeacon/events.jsonl");
    REQUIRE_EQ(config->tracking.image_read_log.string(), "img_reads.jsonl");
    REQUIRE_EQ(config->tracking.upload_dir.string(), "/srv/uploads");
    REQUIRE_EQ(config->tracking.dedup_window_minutes, 30);
    REQUIRE_EQ(config->logging.level, "DEBUG");
    REQUIRE_FALSE(config->logging.console);
}

TEST_CASE_SUITE(RejectsBadValues, Config) {
    auto notNumber = BeaconConfig::loadFromIni(ini::IniFile::parse("[server]\nport = eighty\n"));
    REQUIRE_ERROR(notNumber, ErrorCode::CONFIG_PARSE_ERROR);

    auto outOfRange = BeaconConfig::loadFromIni(ini::IniFile::parse("[server]\nport = 70000\n"));
    REQUIRE_ERROR(outOfRange, ErrorCode::CONFIG_INVALID);

    auto badTimeout = BeaconConfig::loadFromIni(ini::IniFile::parse("[tracking]\nremote_timeout_seconds = 0\n"));
    REQUIRE_ERROR(badTimeout, ErrorCode::CONFIG_INVALID);

    auto badLevel = BeaconConfig::loadFromIni(ini::IniFile::parse("[logging]\nlevel = LOUD\n"));
    REQUIRE_ERROR(badLevel, ErrorCode::CONFIG_INVALID);
    REQUIRE_CONTAINS(badLevel.error().message, "logging.level");
}

TEST_CASE_SUITE(LoadFromFileReportsMissing, Config) {
    TempDirectory dir;
    auto missing = BeaconConfig::loadFromFile(dir / "absent.ini");
    REQUIRE_ERROR(missing, ErrorCode::CONFIG_MISSING);

    auto path = dir / "mailbeacon.ini";
    {
        std::ofstream out(path);
        out << "[tracking]\nlatest_default = 50\n";
    }
    auto loaded = BeaconConfig::loadFromFile(path);
    REQUIRE_OK(loaded);
    REQUIRE_EQ(loaded->tracking.latest_default, 50);
}

MAILBEACON_TEST_MAIN("Foundation")
