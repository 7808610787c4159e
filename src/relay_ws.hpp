/*
 * File: src/relay_ws.hpp
 * Project: Receipt Event Relay
 * Purpose: WebSocket acceptor and per-client session loop
 * Notes:
 *  - Each session runs on its own strand; deliver() is the only entry
 *    point called from other threads
 *  - All outbound frames (events and pings) go through one write queue
 *  - Keepalive is an explicit ping timer + pong deadline, not Beast's
 *    built-in idle pings
 *  - GET /health is answered on the same port for plain HTTP requests
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "relay_log.hpp"
#include "relay_registry.hpp"

namespace websocket = boost::beast::websocket;
namespace http = boost::beast::http;

struct SessionOptions
{
    std::size_t queue_capacity = 64;
    std::size_t read_message_max = 64 * 1024;
    std::chrono::steady_clock::duration ping_interval = std::chrono::seconds(20);
    std::chrono::steady_clock::duration pong_timeout = std::chrono::seconds(20);
    std::chrono::steady_clock::duration handshake_timeout = std::chrono::seconds(30);
    std::chrono::steady_clock::duration close_timeout = std::chrono::seconds(5);
};

class RelayServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ConnectionRegistry &registry_;
    SessionOptions opts_;
    unsigned short port_ = 0;
    std::atomic<bool> stopped_{false};
    std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

public:
    // Throws boost::system::system_error if the endpoint cannot be bound.
    RelayServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ConnectionRegistry &registry,
                SessionOptions opts = {})
        : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), registry_(registry), opts_(opts)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
    }

    RelayServer(const RelayServer &) = delete;
    RelayServer &operator=(const RelayServer &) = delete;

    void run()
    {
        spdlog::info("[ws] listening on {}:{}", acceptor_.local_endpoint().address().to_string(), port_);
        boost::asio::dispatch(acceptor_.get_executor(), [this]
                              { do_accept(); });
    }

    // Stop accepting and close every registered client with "going away".
    void shutdown()
    {
        stopped_ = true;
        boost::asio::post(acceptor_.get_executor(), [this]
                          {
            boost::system::error_code ec;
            acceptor_.close(ec);
            if (ec)
                spdlog::warn("[ws] acceptor close: {}", ec.message()); });
        auto members = registry_.snapshot();
        spdlog::info("[ws] closing {} clients", members->size());
        for (const auto &entry : *members)
            entry.second->close();
    }

    unsigned short port() const { return port_; }
    bool stopped() const { return stopped_.load(); }
    ConnectionRegistry &registry() { return registry_; }
    const SessionOptions &options() const { return opts_; }

    nlohmann::json health() const
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        return nlohmann::json{{"status", stopped() ? "stopping" : "ok"},
                              {"uptime_s", up},
                              {"connections", registry_.size()}};
    }

private:
    class Session;

    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec,
                                                                      boost::asio::ip::tcp::socket socket)
                               {
            if (ec)
            {
                if (ec == boost::asio::error::operation_aborted || stopped_)
                    return;
                spdlog::warn("[ws] accept: {}", ec.message());
            }
            else
                std::make_shared<Session>(std::move(socket), *this)->run();
            if (!stopped_)
                do_accept(); });
    }

    class Session : public ClientConnection, public std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::beast::tcp_stream> ws_;
        boost::beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        boost::asio::steady_timer ping_timer_;
        boost::asio::steady_timer close_timer_;
        RelayServer &server_;
        const ConnectionId id_;
        std::string remote_;

        // Guarded by queue_mtx_; touched by deliver() from any thread.
        mutable std::mutex queue_mtx_;
        std::deque<std::shared_ptr<const std::string>> queue_;
        ConnectionState state_ = ConnectionState::closed; // open once registered

        // Strand-only.
        bool registered_ = false;
        bool writing_ = false;
        bool ping_pending_ = false;
        bool awaiting_pong_ = false;
        bool close_requested_ = false;
        bool finished_ = false;

    public:
        Session(boost::asio::ip::tcp::socket &&socket, RelayServer &server)
            : ws_(std::move(socket)), ping_timer_(ws_.get_executor()), close_timer_(ws_.get_executor()),
              server_(server), id_(next_connection_id())
        {
            boost::system::error_code ec;
            auto ep = boost::beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
            remote_ = ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        ConnectionId id() const override { return id_; }

        ConnectionState state() const override
        {
            std::scoped_lock lk(queue_mtx_);
            return state_;
        }

        bool deliver(std::shared_ptr<const std::string> frame) override
        {
            {
                std::scoped_lock lk(queue_mtx_);
                if (state_ != ConnectionState::open)
                    return false;
                if (queue_.size() >= server_.options().queue_capacity)
                    return false;
                queue_.push_back(std::move(frame));
            }
            boost::asio::post(ws_.get_executor(), [self = shared_from_this()]
                              { self->pump(); });
            return true;
        }

        void close() override
        {
            boost::asio::post(ws_.get_executor(), [self = shared_from_this()]
                              { self->begin_close(); });
        }

        void run()
        {
            boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this()]
                                  { self->read_request(); });
        }

    private:
        // -------- upgrade / plain HTTP --------

        void read_request()
        {
            boost::beast::get_lowest_layer(ws_).expires_after(server_.options().handshake_timeout);
            http::async_read(ws_.next_layer(), buffer_, req_,
                             [self = shared_from_this()](boost::beast::error_code ec, std::size_t)
                             { self->on_request(ec); });
        }

        void on_request(boost::beast::error_code ec)
        {
            if (ec)
            {
                spdlog::debug("[ws] {} request read failed: {}", remote_, ec.message());
                return;
            }
            if (!websocket::is_upgrade(req_))
                return respond_http();

            boost::beast::get_lowest_layer(ws_).expires_never();
            websocket::stream_base::timeout t{};
            t.handshake_timeout = server_.options().handshake_timeout;
            t.idle_timeout = websocket::stream_base::none();
            t.keep_alive_pings = false;
            ws_.set_option(t);
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                             { res.set(http::field::server, "receipt-relay-beast"); }));
            ws_.read_message_max(server_.options().read_message_max);
            ws_.control_callback([this](websocket::frame_type kind, boost::beast::string_view)
                                 { on_control(kind); });
            ws_.async_accept(req_, [self = shared_from_this()](boost::beast::error_code ec)
                             { self->on_accept(ec); });
        }

        void respond_http()
        {
            http::response<http::string_body> res{http::status::ok, req_.version()};
            res.set(http::field::server, "receipt-relay-beast");
            res.set(http::field::content_type, "application/json");
            if (req_.method() == http::verb::get && req_.target() == "/health")
                res.body() = server_.health().dump();
            else
            {
                res.result(http::status::not_found);
                res.body() = R"({"error":"not found"})";
            }
            res.keep_alive(false);
            res.prepare_payload();

            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            http::async_write(ws_.next_layer(), *sp,
                              [self = shared_from_this(), sp](boost::beast::error_code ec, std::size_t)
                              {
                                  if (ec)
                                      spdlog::debug("[ws] {} http write: {}", self->remote_, ec.message());
                                  boost::system::error_code ignored;
                                  boost::beast::get_lowest_layer(self->ws_).socket().shutdown(
                                      boost::asio::ip::tcp::socket::shutdown_send, ignored);
                              });
        }

        void on_accept(boost::beast::error_code ec)
        {
            if (ec)
            {
                spdlog::warn("[ws] {} handshake failed: {}", remote_, ec.message());
                return;
            }
            if (server_.stopped())
            {
                close_requested_ = true;
                return close_handshake(websocket::close_code::going_away);
            }

            {
                std::scoped_lock lk(queue_mtx_);
                state_ = ConnectionState::open;
            }
            boost::system::error_code reg_ec;
            server_.registry().add(shared_from_this(), reg_ec);
            if (reg_ec)
            {
                spdlog::warn("[ws] {} not registered: {}", remote_, reg_ec.message());
                {
                    std::scoped_lock lk(queue_mtx_);
                    state_ = ConnectionState::closing;
                }
                close_requested_ = true;
                return close_handshake(websocket::close_code::try_again_later);
            }
            registered_ = true;
            spdlog::info("[ws] client {} connected from {} ({} live)", id_, remote_, server_.registry().size());

            arm_ping(server_.options().ping_interval);
            do_read();
        }

        // -------- inbound --------

        void do_read()
        {
            ws_.async_read(buffer_, [self = shared_from_this()](boost::beast::error_code ec, std::size_t n)
                           { self->on_read(ec, n); });
        }

        void on_read(boost::beast::error_code ec, std::size_t n)
        {
            if (ec)
            {
                if (ec == websocket::error::closed)
                    spdlog::info("[ws] client {} closed the connection", id_);
                else if (ec != boost::asio::error::operation_aborted)
                    spdlog::debug("[ws] client {} read: {}", id_, ec.message());
                return finish();
            }
            // Server-to-client only; anything the client sends is dropped.
            spdlog::debug("[ws] client {} sent {} bytes; ignored", id_, n);
            buffer_.consume(buffer_.size());
            do_read();
        }

        void on_control(websocket::frame_type kind)
        {
            if (kind != websocket::frame_type::pong || !awaiting_pong_)
                return;
            awaiting_pong_ = false;
            arm_ping(server_.options().ping_interval);
        }

        // -------- keepalive --------

        void arm_ping(std::chrono::steady_clock::duration after)
        {
            ping_timer_.expires_after(after);
            ping_timer_.async_wait([self = shared_from_this()](boost::system::error_code ec)
                                   { self->on_ping_timer(ec); });
        }

        void on_ping_timer(boost::system::error_code ec)
        {
            if (ec == boost::asio::error::operation_aborted || finished_ || close_requested_)
                return;
            // Completion queued before a pong re-armed the timer.
            if (ping_timer_.expiry() > std::chrono::steady_clock::now())
                return;
            if (awaiting_pong_)
            {
                spdlog::warn("[ws] client {} missed pong; disconnecting", id_);
                return fail();
            }
            awaiting_pong_ = true;
            ping_pending_ = true;
            arm_ping(server_.options().pong_timeout);
            pump();
        }

        // -------- outbound --------

        void pump()
        {
            if (writing_ || finished_)
                return;
            if (close_requested_)
                return close_handshake(websocket::close_code::going_away);

            if (ping_pending_)
            {
                ping_pending_ = false;
                writing_ = true;
                ws_.async_ping({}, [self = shared_from_this()](boost::beast::error_code ec)
                               { self->on_write(ec, false); });
                return;
            }

            std::shared_ptr<const std::string> frame;
            {
                std::scoped_lock lk(queue_mtx_);
                if (queue_.empty())
                    return;
                frame = queue_.front();
            }
            writing_ = true;
            ws_.text(true);
            ws_.async_write(boost::asio::buffer(*frame),
                            [self = shared_from_this(), frame](boost::beast::error_code ec, std::size_t)
                            { self->on_write(ec, true); });
        }

        void on_write(boost::beast::error_code ec, bool was_frame)
        {
            writing_ = false;
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                    spdlog::warn("[ws] client {} write: {}", id_, ec.message());
                return fail();
            }
            if (was_frame)
            {
                std::scoped_lock lk(queue_mtx_);
                if (!queue_.empty())
                    queue_.pop_front();
            }
            pump();
        }

        // -------- teardown --------

        void begin_close()
        {
            if (finished_ || close_requested_)
                return;
            close_requested_ = true;
            {
                std::scoped_lock lk(queue_mtx_);
                state_ = ConnectionState::closing;
                queue_.clear();
            }
            // Registry members are open connections only.
            if (registered_)
                server_.registry().remove(id_);
            // A peer that never drains its socket would keep the write pending forever.
            close_timer_.expires_after(server_.options().close_timeout);
            close_timer_.async_wait([self = shared_from_this()](boost::system::error_code ec)
                                    {
                if (ec == boost::asio::error::operation_aborted || self->finished_)
                    return;
                spdlog::warn("[ws] client {} close timed out", self->id_);
                self->fail(); });
            pump();
        }

        void close_handshake(websocket::close_code code)
        {
            writing_ = true;
            ws_.async_close(code, [self = shared_from_this()](boost::beast::error_code ec)
                            {
                self->writing_ = false;
                if (ec && ec != boost::asio::error::operation_aborted)
                    spdlog::debug("[ws] client {} close: {}", self->id_, ec.message());
                self->finish(); });
        }

        // Abortive close: cancels everything outstanding on the socket.
        void fail()
        {
            boost::beast::get_lowest_layer(ws_).close();
            finish();
        }

        void finish()
        {
            if (finished_)
                return;
            finished_ = true;
            {
                std::scoped_lock lk(queue_mtx_);
                state_ = ConnectionState::closed;
                queue_.clear();
            }
            ping_timer_.cancel();
            close_timer_.cancel();
            boost::beast::get_lowest_layer(ws_).close();
            if (registered_)
            {
                server_.registry().remove(id_);
                spdlog::info("[ws] client {} disconnected ({} live)", id_, server_.registry().size());
            }
        }
    };
};
