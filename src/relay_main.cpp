/*
 * File: src/relay_main.cpp
 * Project: Receipt Event Relay
 * Purpose: Relay server binary: Pub/Sub subscription in, WebSocket fan-out
 * Notes:
 *  - Startup fails fast if the port cannot be bound or the channel is
 *    unreachable; everything after that is retried or contained
 *  - SIGINT/SIGTERM close clients with "going away" and stop the pull loop
 * Last updated: 2026-10-17
 */

#include <boost/asio.hpp>

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "relay_broadcast.hpp"
#include "relay_config.hpp"
#include "relay_listener.hpp"
#include "relay_log.hpp"
#include "relay_pubsub.hpp"
#include "relay_registry.hpp"
#include "relay_ws.hpp"

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h")
        {
            std::cout << relay_usage();
            return 0;
        }

    RelayConfig cfg;
    try
    {
        cfg = load_config(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "receipt_relay: " << e.what() << "\n"
                  << relay_usage();
        return 2;
    }
    init_logging(cfg.log_level);

    try
    {
        auto [ws_host, ws_port] = split_host_port(cfg.ws_bind);

        boost::asio::io_context ioc{cfg.io_threads};
        ConnectionRegistry registry{cfg.max_connections};
        Broadcaster broadcaster{registry};

        SessionOptions sopts;
        sopts.queue_capacity = cfg.queue_capacity;
        sopts.ping_interval = cfg.ping_interval;
        sopts.pong_timeout = cfg.pong_timeout;
        sopts.handshake_timeout = cfg.handshake_timeout;

        boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};
        RelayServer server{ioc, ws_ep, registry, sopts};

        PubsubRestClient channel{PubsubEndpoint::parse(cfg.pubsub_url), cfg.access_token};
        ListenerOptions lopts;
        lopts.topic = TopicPath{cfg.project, cfg.topic};
        lopts.subscription = SubscriptionPath{cfg.project, cfg.subscription};
        lopts.max_messages = cfg.pull_batch;
        lopts.backoff_initial = cfg.backoff_initial;
        lopts.backoff_max = cfg.backoff_max;
        ChannelListener listener{channel, broadcaster, lopts};
        listener.start();

        std::mutex stop_mtx;
        std::condition_variable stop_cv;
        bool stop_requested = false;
        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](boost::system::error_code ec, int sig)
                           {
            if (ec)
                return;
            spdlog::info("[main] signal {}; shutting down", sig);
            {
                std::scoped_lock lk(stop_mtx);
                stop_requested = true;
            }
            stop_cv.notify_all(); });

        server.run();
        spdlog::info("[main] relay up: ws={} subscription={} pubsub={}", cfg.ws_bind,
                     lopts.subscription.full_name(), cfg.pubsub_url);

        std::vector<std::thread> pool;
        pool.reserve(cfg.io_threads);
        for (int i = 0; i < cfg.io_threads; ++i)
            pool.emplace_back([&ioc]
                              { ioc.run(); });

        {
            std::unique_lock lk(stop_mtx);
            stop_cv.wait(lk, [&]
                         { return stop_requested; });
        }

        server.shutdown();
        listener.stop();

        // Give clients a moment to finish the close handshake.
        auto deadline = std::chrono::steady_clock::now() + sopts.close_timeout;
        while (registry.size() > 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));

        ioc.stop();
        for (auto &t : pool)
            t.join();

        auto st = listener.stats();
        spdlog::info("[main] stopped: received={} broadcast={} malformed={} channel_errors={} dropped_clients={}",
                     st.received, st.broadcast, st.malformed, st.channel_errors,
                     broadcaster.connections_dropped());
        return 0;
    }
    catch (const std::exception &e)
    {
        spdlog::error("[main] fatal: {}", e.what());
        return 1;
    }
}
