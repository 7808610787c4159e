/*
 * File: include/common/event_record.hpp
 * Project: Receipt Event Relay
 * Purpose: Receipt lifecycle event model and its JSON wire form
 * Notes:
 *  - Wire field names (type/status/receipt_id/user_uid/timestamp) are
 *    consumed by existing web clients and must not change
 *  - Timestamps are UTC, second precision: YYYY-MM-DDTHH:MM:SSZ
 * Last updated: 2026-10-17
 */

#pragma once
#include <cctype>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

enum class EventKind
{
    receipt_upload,
    receipt_update
};

enum class EventStatus
{
    received,
    processing_started,
    processed,
    failed
};

struct EventDecodeError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

inline const char *to_string(EventKind k)
{
    switch (k)
    {
    case EventKind::receipt_upload:
        return "receipt_upload";
    case EventKind::receipt_update:
        return "receipt_update";
    }
    return "";
}

inline const char *to_string(EventStatus s)
{
    switch (s)
    {
    case EventStatus::received:
        return "received";
    case EventStatus::processing_started:
        return "processing_started";
    case EventStatus::processed:
        return "processed";
    case EventStatus::failed:
        return "failed";
    }
    return "";
}

inline bool parse_kind(const std::string &s, EventKind &out)
{
    for (auto k : {EventKind::receipt_upload, EventKind::receipt_update})
        if (s == to_string(k))
        {
            out = k;
            return true;
        }
    return false;
}

inline bool parse_status(const std::string &s, EventStatus &out)
{
    for (auto st : {EventStatus::received, EventStatus::processing_started,
                    EventStatus::processed, EventStatus::failed})
        if (s == to_string(st))
        {
            out = st;
            return true;
        }
    return false;
}

// -------- timestamps --------

inline std::string format_utc_seconds(std::chrono::system_clock::time_point tp)
{
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline int days_in_month(int year, int month)
{
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : days[month - 1];
}

// Strict YYYY-MM-DDTHH:MM:SSZ; no offsets, no fractions, no out-of-range
// fields (timegm would silently roll 02-31 into March).
inline bool parse_utc_seconds(const std::string &s, std::chrono::system_clock::time_point &out)
{
    static const char layout[] = "dddd-dd-ddTdd:dd:ddZ";
    if (s.size() != sizeof(layout) - 1)
        return false;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (layout[i] == 'd')
        {
            if (!std::isdigit(static_cast<unsigned char>(s[i])))
                return false;
        }
        else if (s[i] != layout[i])
            return false;
    }

    auto num = [&](std::size_t pos, std::size_t len)
    { return std::stoi(s.substr(pos, len)); };
    std::tm tm{};
    tm.tm_year = num(0, 4) - 1900;
    tm.tm_mon = num(5, 2) - 1;
    tm.tm_mday = num(8, 2);
    tm.tm_hour = num(11, 2);
    tm.tm_min = num(14, 2);
    tm.tm_sec = num(17, 2);
    const int year = num(0, 4);
    const int month = num(5, 2);
    if (month < 1 || month > 12 || tm.tm_mday < 1 || tm.tm_mday > days_in_month(year, month))
        return false;
    if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59)
        return false;
    out = std::chrono::system_clock::from_time_t(timegm(&tm));
    return true;
}

// -------- records --------

// What a producer supplies. The timestamp is always assigned on submission.
struct PartialEvent
{
    EventKind kind = EventKind::receipt_update;
    EventStatus status = EventStatus::received;
    std::string subject_id;
    std::string owner_id;
};

class EventRecord
{
    EventKind kind_;
    EventStatus status_;
    std::string subject_id_;
    std::string owner_id_;
    std::chrono::system_clock::time_point occurred_at_;

public:
    EventRecord(EventKind kind, EventStatus status, std::string subject_id, std::string owner_id,
                std::chrono::system_clock::time_point occurred_at)
        : kind_(kind), status_(status), subject_id_(std::move(subject_id)), owner_id_(std::move(owner_id)),
          occurred_at_(std::chrono::time_point_cast<std::chrono::seconds>(occurred_at))
    {
        if (subject_id_.empty())
            throw std::invalid_argument("event subject id is empty");
        if (owner_id_.empty())
            throw std::invalid_argument("event owner id is empty");
    }

    EventKind kind() const { return kind_; }
    EventStatus status() const { return status_; }
    const std::string &subject_id() const { return subject_id_; }
    const std::string &owner_id() const { return owner_id_; }
    std::chrono::system_clock::time_point occurred_at() const { return occurred_at_; }
};

inline EventRecord stamp(const PartialEvent &p, std::chrono::system_clock::time_point now)
{
    return EventRecord{p.kind, p.status, p.subject_id, p.owner_id, now};
}

inline nlohmann::json event_to_json(const EventRecord &e)
{
    return nlohmann::json{
        {"type", to_string(e.kind())},
        {"status", to_string(e.status())},
        {"receipt_id", e.subject_id()},
        {"user_uid", e.owner_id()},
        {"timestamp", format_utc_seconds(e.occurred_at())}};
}

inline std::string serialize_event(const EventRecord &e) { return event_to_json(e).dump(); }

// Throws EventDecodeError on anything that is not a complete, well-formed record.
inline EventRecord parse_event(const std::string &payload)
{
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded())
        throw EventDecodeError("payload is not valid JSON");
    if (!j.is_object())
        throw EventDecodeError("payload is not a JSON object");

    auto field = [&](const char *name) -> std::string
    {
        auto it = j.find(name);
        if (it == j.end())
            throw EventDecodeError(std::string("missing field '") + name + "'");
        if (!it->is_string())
            throw EventDecodeError(std::string("field '") + name + "' is not a string");
        return it->get<std::string>();
    };

    EventKind kind;
    auto type = field("type");
    if (!parse_kind(type, kind))
        throw EventDecodeError("unknown type '" + type + "'");

    EventStatus status;
    auto st = field("status");
    if (!parse_status(st, status))
        throw EventDecodeError("unknown status '" + st + "'");

    auto receipt_id = field("receipt_id");
    auto user_uid = field("user_uid");
    if (receipt_id.empty() || user_uid.empty())
        throw EventDecodeError("empty receipt_id or user_uid");

    std::chrono::system_clock::time_point at;
    auto ts = field("timestamp");
    if (!parse_utc_seconds(ts, at))
        throw EventDecodeError("bad timestamp '" + ts + "'");

    return EventRecord{kind, status, std::move(receipt_id), std::move(user_uid), at};
}
