/*
 * File: src/relay_log.hpp
 * Project: Receipt Event Relay
 * Purpose: spdlog setup for the relay binaries
 * Notes:
 *  - Messages carry a "[component]" prefix (ws, listener, pubsub, ...)
 *  - Level from --log-level or RELAY_LOG_LEVEL
 * Last updated: 2026-10-17
 */

#pragma once
#include <string>

#include <spdlog/spdlog.h>

// Accepts debug|info|warn|error; returns false on anything else.
inline bool parse_log_level(const std::string &s, spdlog::level::level_enum &out)
{
    if (s == "debug")
        out = spdlog::level::debug;
    else if (s == "info")
        out = spdlog::level::info;
    else if (s == "warn" || s == "warning")
        out = spdlog::level::warn;
    else if (s == "error")
        out = spdlog::level::err;
    else
        return false;
    return true;
}

inline void init_logging(spdlog::level::level_enum level)
{
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%dT%H:%M:%S.%eZ] [%^%l%$] %v", spdlog::pattern_time_type::utc);
}
