/*
 * File: src/relay_config.hpp
 * Project: Receipt Event Relay
 * Purpose: Command-line / environment configuration for the relay binary
 * Notes:
 *  - Flags win over environment; environment wins over defaults
 *  - PUBSUB_EMULATOR_HOST switches the channel to the local emulator
 * Last updated: 2026-10-17
 */

#pragma once
#include <chrono>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "relay_log.hpp"

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct RelayConfig
{
    std::string ws_bind = "0.0.0.0:8765";

    std::string project = "receipt-tracking-application";
    std::string topic = "receipt-updates";
    std::string subscription = "webapp-sub";
    std::string pubsub_url = "https://pubsub.googleapis.com";
    std::string access_token;

    int io_threads = 1;
    std::size_t queue_capacity = 64;
    std::size_t max_connections = 10000;
    std::size_t pull_batch = 100;

    std::chrono::seconds ping_interval{20};
    std::chrono::seconds pong_timeout{20};
    std::chrono::seconds handshake_timeout{30};

    std::chrono::milliseconds backoff_initial{500};
    std::chrono::milliseconds backoff_max{30000};

    spdlog::level::level_enum log_level = spdlog::level::info;
};

// "host:port" -> pair; throws ConfigError on a missing or bad port.
inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw ConfigError("expected host:port, got '" + s + "'");
    int port = 0;
    try
    {
        std::size_t used = 0;
        port = std::stoi(s.substr(p + 1), &used);
        if (used != s.size() - p - 1)
            throw ConfigError("bad port in '" + s + "'");
    }
    catch (const std::logic_error &)
    {
        throw ConfigError("bad port in '" + s + "'");
    }
    if (port < 1 || port > 65535)
        throw ConfigError("port out of range in '" + s + "'");
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

inline long parse_positive(const std::string &flag, const std::string &v)
{
    try
    {
        std::size_t used = 0;
        long n = std::stol(v, &used);
        if (used == v.size() && n > 0)
            return n;
    }
    catch (const std::logic_error &)
    {
    }
    throw ConfigError(flag + " expects a positive integer, got '" + v + "'");
}

// getenv is injectable so tests do not touch the process environment.
inline RelayConfig load_config(int argc, char **argv,
                               const std::function<const char *(const char *)> &getenv_fn = std::getenv)
{
    RelayConfig c;

    if (const char *emu = getenv_fn("PUBSUB_EMULATOR_HOST"); emu && *emu)
        c.pubsub_url = std::string("http://") + emu;
    if (const char *tok = getenv_fn("PUBSUB_ACCESS_TOKEN"); tok && *tok)
        c.access_token = tok;
    if (const char *lvl = getenv_fn("RELAY_LOG_LEVEL"); lvl && *lvl)
    {
        if (!parse_log_level(lvl, c.log_level))
            throw ConfigError(std::string("RELAY_LOG_LEVEL: unknown level '") + lvl + "'");
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw ConfigError(a + " requires a value");
            return argv[++i];
        };

        if (a == "--ws")
            c.ws_bind = value();
        else if (a == "--project")
            c.project = value();
        else if (a == "--topic")
            c.topic = value();
        else if (a == "--subscription")
            c.subscription = value();
        else if (a == "--pubsub")
            c.pubsub_url = value();
        else if (a == "--token")
            c.access_token = value();
        else if (a == "--threads")
            c.io_threads = static_cast<int>(parse_positive(a, value()));
        else if (a == "--queue")
            c.queue_capacity = static_cast<std::size_t>(parse_positive(a, value()));
        else if (a == "--max-connections")
            c.max_connections = static_cast<std::size_t>(parse_positive(a, value()));
        else if (a == "--pull-batch")
            c.pull_batch = static_cast<std::size_t>(parse_positive(a, value()));
        else if (a == "--ping-interval")
            c.ping_interval = std::chrono::seconds(parse_positive(a, value()));
        else if (a == "--pong-timeout")
            c.pong_timeout = std::chrono::seconds(parse_positive(a, value()));
        else if (a == "--log-level")
        {
            auto v = value();
            if (!parse_log_level(v, c.log_level))
                throw ConfigError("--log-level: unknown level '" + v + "'");
        }
        else
            throw ConfigError("unknown option '" + a + "'");
    }

    if (c.project.empty() || c.topic.empty() || c.subscription.empty())
        throw ConfigError("project, topic and subscription must be non-empty");
    split_host_port(c.ws_bind); // validate early
    return c;
}

inline const char *relay_usage()
{
    return "usage: receipt_relay [--ws host:port] [--project id] [--topic id] [--subscription id]\n"
           "                     [--pubsub url] [--token bearer] [--threads n] [--queue n]\n"
           "                     [--max-connections n] [--pull-batch n] [--ping-interval s]\n"
           "                     [--pong-timeout s] [--log-level debug|info|warn|error]\n";
}
