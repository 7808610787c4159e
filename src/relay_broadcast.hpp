/*
 * File: src/relay_broadcast.hpp
 * Project: Receipt Event Relay
 * Purpose: Fan one event out to every registered connection
 * Notes:
 *  - Unscoped: every client gets every event and filters on user_uid itself
 *  - A failing peer is dropped and disconnected; the others are unaffected
 * Last updated: 2026-10-17
 */

#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "common/event_record.hpp"
#include "relay_log.hpp"
#include "relay_registry.hpp"

struct BroadcastResult
{
    std::size_t attempted = 0;
    std::size_t delivered = 0;
    std::size_t dropped = 0;
};

class Broadcaster
{
    ConnectionRegistry &registry_;
    std::atomic<std::uint64_t> events_{0};
    std::atomic<std::uint64_t> drops_{0};

public:
    explicit Broadcaster(ConnectionRegistry &registry) : registry_(registry) {}

    BroadcastResult broadcast(const EventRecord &event)
    {
        return broadcast_frame(std::make_shared<const std::string>(serialize_event(event)));
    }

    // Returns once every connection in the snapshot has been handed the frame;
    // writes complete later on each connection's own executor.
    BroadcastResult broadcast_frame(std::shared_ptr<const std::string> frame)
    {
        BroadcastResult r;
        auto members = registry_.snapshot();
        for (const auto &entry : *members)
        {
            const auto &conn = entry.second;
            ++r.attempted;
            bool ok = false;
            try
            {
                ok = conn->deliver(frame);
            }
            catch (const std::exception &e)
            {
                spdlog::warn("[broadcast] conn {} deliver threw: {}", entry.first, e.what());
            }
            if (ok)
            {
                ++r.delivered;
                continue;
            }
            ++r.dropped;
            drop(entry.first, *conn);
        }
        ++events_;
        drops_ += r.dropped;
        spdlog::debug("[broadcast] frame to {}/{} clients", r.delivered, r.attempted);
        return r;
    }

    std::uint64_t events_broadcast() const { return events_.load(); }
    std::uint64_t connections_dropped() const { return drops_.load(); }

private:
    void drop(ConnectionId id, ClientConnection &conn)
    {
        spdlog::warn("[broadcast] conn {} cannot keep up; disconnecting", id);
        registry_.remove(id);
        try
        {
            conn.close();
        }
        catch (const std::exception &e)
        {
            spdlog::warn("[broadcast] conn {} close request failed: {}", id, e.what());
        }
    }
};
