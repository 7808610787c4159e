/*
 * File: src/relay_listener.hpp
 * Project: Receipt Event Relay
 * Purpose: Background pull loop from the Pub/Sub subscription into the broadcaster
 * Notes:
 *  - At-least-once: redelivered messages are broadcast again
 *  - Malformed payloads are acked so they are not redelivered forever
 *  - Channel errors back off exponentially and never end the loop
 * Last updated: 2026-10-17
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/event_record.hpp"
#include "relay_broadcast.hpp"
#include "relay_log.hpp"
#include "relay_pubsub.hpp"

struct ListenerOptions
{
    TopicPath topic;
    SubscriptionPath subscription;
    std::size_t max_messages = 100;
    std::chrono::milliseconds backoff_initial{500};
    std::chrono::milliseconds backoff_max{30000};
};

struct ListenerStats
{
    std::uint64_t received = 0;
    std::uint64_t broadcast = 0;
    std::uint64_t malformed = 0;
    std::uint64_t channel_errors = 0;
};

// Doubles per consecutive failure, capped; reset() after a successful pull.
class Backoff
{
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds next_;

public:
    Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
        : initial_(initial), max_(std::max(initial, max)), next_(initial) {}

    std::chrono::milliseconds next()
    {
        auto d = next_;
        next_ = std::min(next_ * 2, max_);
        return d;
    }

    void reset() { next_ = initial_; }
};

class ChannelListener
{
    PubsubChannel &channel_;
    Broadcaster &broadcaster_;
    ListenerOptions opts_;

    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> broadcast_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> channel_errors_{0};

public:
    ChannelListener(PubsubChannel &channel, Broadcaster &broadcaster, ListenerOptions opts)
        : channel_(channel), broadcaster_(broadcaster), opts_(std::move(opts)) {}

    ChannelListener(const ChannelListener &) = delete;
    ChannelListener &operator=(const ChannelListener &) = delete;

    ~ChannelListener() { stop(); }

    // Ensures the subscription exists, then starts the pull thread. Throws
    // ChannelError when the channel is unreachable at startup.
    void start()
    {
        channel_.create_subscription(opts_.subscription, opts_.topic);
        spdlog::info("[listener] subscribed {} -> {}", opts_.subscription.full_name(), opts_.topic.full_name());
        stop_ = false;
        thread_ = std::thread([this]
                              { run(); });
    }

    // Cooperative: a blocked pull is cut short, an in-flight ack finishes,
    // then the thread exits.
    void stop()
    {
        {
            std::scoped_lock lk(wait_mtx_);
            stop_ = true;
        }
        wait_cv_.notify_all();
        channel_.cancel_pull();
        if (thread_.joinable())
            thread_.join();
    }

    bool stopping() const { return stop_.load(); }

    // One pull/dispatch/ack round. Returns the number of messages pulled.
    // Throws on channel failure; run() owns the retry policy.
    std::size_t poll_once()
    {
        auto batch = channel_.pull(opts_.subscription, opts_.max_messages);
        received_ += batch.size();

        std::vector<std::string> acks;
        std::vector<std::string> unhandled;
        acks.reserve(batch.size());
        for (auto &m : batch)
        {
            if (stop_)
            {
                unhandled.push_back(m.ack_id);
                continue;
            }
            handle(m);
            acks.push_back(m.ack_id);
        }

        channel_.acknowledge(opts_.subscription, acks);
        if (!unhandled.empty())
        {
            spdlog::info("[listener] returning {} unhandled messages on shutdown", unhandled.size());
            channel_.reject(opts_.subscription, unhandled);
        }
        return batch.size();
    }

    ListenerStats stats() const
    {
        return ListenerStats{received_.load(), broadcast_.load(), malformed_.load(), channel_errors_.load()};
    }

private:
    void handle(const ReceivedMessage &m)
    {
        try
        {
            auto event = parse_event(m.data);
            auto r = broadcaster_.broadcast(event);
            ++broadcast_;
            spdlog::debug("[listener] message {} {}/{} receipt={} -> {} clients", m.message_id, to_string(event.kind()),
                          to_string(event.status()), event.subject_id(), r.delivered);
        }
        catch (const EventDecodeError &e)
        {
            ++malformed_;
            spdlog::warn("[listener] dropping malformed message {} (attempt {}): {}", m.message_id,
                         m.delivery_attempt, e.what());
        }
    }

    void run()
    {
        Backoff backoff(opts_.backoff_initial, opts_.backoff_max);
        while (!stop_)
        {
            try
            {
                poll_once();
                backoff.reset();
            }
            catch (const std::exception &e)
            {
                if (stop_)
                    break;
                ++channel_errors_;
                auto delay = backoff.next();
                spdlog::warn("[listener] channel error: {}; retrying in {}ms", e.what(), delay.count());
                std::unique_lock lk(wait_mtx_);
                wait_cv_.wait_for(lk, delay, [this]
                                  { return stop_.load(); });
            }
        }
        spdlog::info("[listener] stopped");
    }
};
