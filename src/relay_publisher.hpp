/*
 * File: src/relay_publisher.hpp
 * Project: Receipt Event Relay
 * Purpose: Producer-side submission of receipt events onto a topic
 * Notes:
 *  - The timestamp is stamped here, never taken from the caller
 * Last updated: 2026-10-17
 */

#pragma once
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

#include "common/event_record.hpp"
#include "relay_log.hpp"
#include "relay_pubsub.hpp"

struct PublishError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

class Publisher
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit Publisher(PubsubChannel &channel, Clock clock = [] { return std::chrono::system_clock::now(); })
        : channel_(channel), clock_(std::move(clock)) {}

    // Returns the channel's message id; throws PublishError on any failure.
    std::string submit(const std::string &project, const std::string &topic, const PartialEvent &partial)
    {
        TopicPath path{project, topic};
        std::string data;
        try
        {
            data = serialize_event(stamp(partial, clock_()));
        }
        catch (const std::exception &e)
        {
            throw PublishError("cannot serialize event for " + path.full_name() + ": " + e.what());
        }

        try
        {
            auto id = channel_.publish(path, data);
            spdlog::info("[publisher] published {} to {}: {}", id, path.full_name(), data);
            return id;
        }
        catch (const std::exception &e)
        {
            throw PublishError("publish to " + path.full_name() + " failed: " + e.what());
        }
    }

private:
    PubsubChannel &channel_;
    Clock clock_;
};
