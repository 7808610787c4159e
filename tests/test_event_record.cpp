/*
 * File: tests/test_event_record.cpp
 * Project: Receipt Event Relay
 * Purpose: Event model, wire form and decoding rules
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "common/event_record.hpp"

using nlohmann::json;

namespace
{
std::chrono::system_clock::time_point at(const char *ts)
{
    std::chrono::system_clock::time_point tp;
    REQUIRE(parse_utc_seconds(ts, tp));
    return tp;
}

json valid_wire()
{
    return json{{"type", "receipt_update"},
                {"status", "processed"},
                {"receipt_id", "abc123"},
                {"user_uid", "u1"},
                {"timestamp", "2025-03-04T05:06:07Z"}};
}
} // namespace

TEST_CASE("event serializes to exactly the five wire fields")
{
    EventRecord e{EventKind::receipt_update, EventStatus::processed, "abc123", "u1", at("2025-03-04T05:06:07Z")};
    auto j = json::parse(serialize_event(e));
    REQUIRE(j.size() == 5);
    REQUIRE(j["type"] == "receipt_update");
    REQUIRE(j["status"] == "processed");
    REQUIRE(j["receipt_id"] == "abc123");
    REQUIRE(j["user_uid"] == "u1");
    REQUIRE(j["timestamp"] == "2025-03-04T05:06:07Z");
}

TEST_CASE("all status tags use their wire spelling")
{
    REQUIRE(std::string(to_string(EventStatus::received)) == "received");
    REQUIRE(std::string(to_string(EventStatus::processing_started)) == "processing_started");
    REQUIRE(std::string(to_string(EventStatus::processed)) == "processed");
    REQUIRE(std::string(to_string(EventStatus::failed)) == "failed");
    REQUIRE(std::string(to_string(EventKind::receipt_upload)) == "receipt_upload");
}

TEST_CASE("timestamps are UTC with second precision")
{
    auto tp = at("2024-12-31T23:59:59Z") + std::chrono::milliseconds(870);
    EventRecord e{EventKind::receipt_upload, EventStatus::received, "r1", "u9", tp};
    REQUIRE(format_utc_seconds(e.occurred_at()) == "2024-12-31T23:59:59Z");
    REQUIRE(format_utc_seconds(std::chrono::system_clock::from_time_t(0)) == "1970-01-01T00:00:00Z");
}

TEST_CASE("timestamp parser is strict")
{
    std::chrono::system_clock::time_point tp;
    REQUIRE_FALSE(parse_utc_seconds("2025-03-04 05:06:07Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-03-04T05:06:07", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-03-04T05:06:07.123Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-03-04T05:06:07+00:00", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-13-04T05:06:07Z", tp));
    REQUIRE(parse_utc_seconds("2025-03-04T05:06:07Z", tp));
}

TEST_CASE("timestamp days are checked against the month")
{
    std::chrono::system_clock::time_point tp;
    REQUIRE_FALSE(parse_utc_seconds("2025-02-31T10:00:00Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-02-29T10:00:00Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-04-31T10:00:00Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2100-02-29T10:00:00Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-03-00T10:00:00Z", tp));
    REQUIRE_FALSE(parse_utc_seconds("2025-03-04T10:00:60Z", tp));

    REQUIRE(parse_utc_seconds("2024-02-29T10:00:00Z", tp));
    REQUIRE(format_utc_seconds(tp) == "2024-02-29T10:00:00Z");
    REQUIRE(parse_utc_seconds("2000-02-29T23:59:59Z", tp));
    REQUIRE(format_utc_seconds(tp) == "2000-02-29T23:59:59Z");
    REQUIRE(parse_utc_seconds("2025-12-31T23:59:59Z", tp));
    REQUIRE(format_utc_seconds(tp) == "2025-12-31T23:59:59Z");
}

TEST_CASE("decode accepts a complete record and ignores extra fields")
{
    auto j = valid_wire();
    j["message"] = "No text extracted from image";
    auto e = parse_event(j.dump());
    REQUIRE(e.kind() == EventKind::receipt_update);
    REQUIRE(e.status() == EventStatus::processed);
    REQUIRE(e.subject_id() == "abc123");
    REQUIRE(e.owner_id() == "u1");
    REQUIRE(format_utc_seconds(e.occurred_at()) == "2025-03-04T05:06:07Z");
}

TEST_CASE("decode rejects malformed payloads")
{
    SECTION("not json") { REQUIRE_THROWS_AS(parse_event("{not json"), EventDecodeError); }
    SECTION("not an object") { REQUIRE_THROWS_AS(parse_event("[1,2,3]"), EventDecodeError); }
    SECTION("empty payload") { REQUIRE_THROWS_AS(parse_event(""), EventDecodeError); }

    for (const char *field : {"type", "status", "receipt_id", "user_uid", "timestamp"})
    {
        DYNAMIC_SECTION("missing " << field)
        {
            auto j = valid_wire();
            j.erase(field);
            REQUIRE_THROWS_AS(parse_event(j.dump()), EventDecodeError);
        }
    }

    SECTION("unknown status")
    {
        auto j = valid_wire();
        j["status"] = "success";
        REQUIRE_THROWS_AS(parse_event(j.dump()), EventDecodeError);
    }
    SECTION("non-string type")
    {
        auto j = valid_wire();
        j["type"] = 7;
        REQUIRE_THROWS_AS(parse_event(j.dump()), EventDecodeError);
    }
    SECTION("impossible calendar date")
    {
        auto j = valid_wire();
        j["timestamp"] = "2025-02-31T05:06:07Z";
        REQUIRE_THROWS_AS(parse_event(j.dump()), EventDecodeError);
    }
    SECTION("empty receipt id")
    {
        auto j = valid_wire();
        j["receipt_id"] = "";
        REQUIRE_THROWS_AS(parse_event(j.dump()), EventDecodeError);
    }
}

TEST_CASE("stamp takes the time from its argument")
{
    PartialEvent p{EventKind::receipt_upload, EventStatus::received, "r1", "u9"};
    auto e = stamp(p, at("2026-01-02T03:04:05Z"));
    REQUIRE(format_utc_seconds(e.occurred_at()) == "2026-01-02T03:04:05Z");
    REQUIRE(e.subject_id() == "r1");
    REQUIRE(e.owner_id() == "u9");
}

TEST_CASE("records need both identifiers")
{
    PartialEvent p{EventKind::receipt_upload, EventStatus::received, "", "u9"};
    REQUIRE_THROWS_AS(stamp(p, std::chrono::system_clock::now()), std::invalid_argument);
}
