/*
 * File: src/relay_pubsub.hpp
 * Project: Receipt Event Relay
 * Purpose: Publish/subscribe channel seam and the Cloud Pub/Sub REST client
 * Notes:
 *  - https://pubsub.googleapis.com by default; plain http when pointed at
 *    the emulator (PUBSUB_EMULATOR_HOST)
 *  - Message data travels base64-encoded inside JSON bodies
 *  - One short-lived connection per call, each bounded by a timeout
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "relay_log.hpp"

namespace http = boost::beast::http;

// Transport, provider or protocol failure talking to the channel.
struct ChannelError : std::runtime_error
{
    int status = 0; // HTTP status when the provider answered, 0 otherwise
    explicit ChannelError(const std::string &what, int http_status = 0)
        : std::runtime_error(what), status(http_status) {}
};

struct TopicPath
{
    std::string project;
    std::string topic;
    std::string full_name() const { return "projects/" + project + "/topics/" + topic; }
};

struct SubscriptionPath
{
    std::string project;
    std::string subscription;
    std::string full_name() const { return "projects/" + project + "/subscriptions/" + subscription; }
};

struct ReceivedMessage
{
    std::string ack_id;
    std::string message_id;
    std::string data;
    int delivery_attempt = 0; // 0 when the provider does not track attempts
};

class PubsubChannel
{
public:
    virtual ~PubsubChannel() = default;

    // Idempotent; an existing subscription is not an error.
    virtual void create_subscription(const SubscriptionPath &sub, const TopicPath &topic) = 0;

    // Blocks until messages arrive or the provider's long poll ends. May return empty.
    virtual std::vector<ReceivedMessage> pull(const SubscriptionPath &sub, std::size_t max_messages) = 0;

    virtual void acknowledge(const SubscriptionPath &sub, const std::vector<std::string> &ack_ids) = 0;

    // Makes the messages immediately eligible for redelivery.
    virtual void reject(const SubscriptionPath &sub, const std::vector<std::string> &ack_ids) = 0;

    // Returns the provider-assigned message id.
    virtual std::string publish(const TopicPath &topic, const std::string &data) = 0;

    // Ends a pull() that is blocked waiting on the provider; later pulls no
    // longer block. Called from another thread on shutdown.
    virtual void cancel_pull() = 0;
};

// -------- base64 --------

inline std::string base64_encode(const std::string &in)
{
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(in.size()), '\0');
    out.resize(b64::encode(&out[0], in.data(), in.size()));
    return out;
}

inline std::string base64_decode(const std::string &in)
{
    namespace b64 = boost::beast::detail::base64;
    // decoded_size() assumes whole 4-character groups; unpadded input has a
    // partial group at the end that still needs room.
    std::string out((in.size() + 3) / 4 * 3, '\0');
    auto r = b64::decode(&out[0], in.data(), in.size());
    // The decoder stops at the first '='; only padding may follow.
    if (in.find_first_not_of('=', r.second) != std::string::npos)
        throw ChannelError("message data is not valid base64");
    out.resize(r.first);
    return out;
}

// -------- endpoint --------

struct PubsubEndpoint
{
    std::string host = "pubsub.googleapis.com";
    std::string port = "443";
    bool tls = true;

    // Accepts http://host[:port], https://host[:port] or a bare host:port
    // (the emulator form, plain http).
    static PubsubEndpoint parse(const std::string &url)
    {
        PubsubEndpoint ep;
        std::string rest = url;
        auto scheme_pos = url.find("://");
        if (scheme_pos != std::string::npos)
        {
            auto scheme = url.substr(0, scheme_pos);
            if (scheme == "http")
                ep.tls = false;
            else if (scheme == "https")
                ep.tls = true;
            else
                throw std::invalid_argument("unsupported pubsub scheme: " + scheme);
            rest = url.substr(scheme_pos + 3);
        }
        else
            ep.tls = false;

        auto slash = rest.find('/');
        if (slash != std::string::npos)
            rest = rest.substr(0, slash);
        auto colon = rest.find(':');
        ep.host = rest.substr(0, colon);
        ep.port = (colon == std::string::npos) ? (ep.tls ? "443" : "80") : rest.substr(colon + 1);
        if (ep.host.empty() || ep.port.empty())
            throw std::invalid_argument("bad pubsub endpoint: " + url);
        return ep;
    }
};

// -------- REST client --------

class PubsubRestClient : public PubsubChannel
{
    PubsubEndpoint ep_;
    std::string token_;
    std::chrono::seconds request_timeout_;
    std::chrono::seconds pull_timeout_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;

    mutable std::mutex cancel_mtx_;
    bool pull_cancelled_ = false;
    boost::asio::io_context *active_pull_ = nullptr; // context of the in-flight pull, if any

public:
    PubsubRestClient(PubsubEndpoint ep, std::string access_token,
                     std::chrono::seconds request_timeout = std::chrono::seconds(30),
                     std::chrono::seconds pull_timeout = std::chrono::seconds(90))
        : ep_(std::move(ep)), token_(std::move(access_token)),
          request_timeout_(request_timeout), pull_timeout_(pull_timeout)
    {
        if (ep_.tls)
        {
            ssl_ctx_ = std::make_unique<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(boost::asio::ssl::verify_peer);
        }
    }

    const PubsubEndpoint &endpoint() const { return ep_; }

    void create_subscription(const SubscriptionPath &sub, const TopicPath &topic) override
    {
        nlohmann::json body{{"topic", topic.full_name()}};
        try
        {
            call(http::verb::put, "/v1/" + sub.full_name(), body, request_timeout_);
            spdlog::info("[pubsub] created subscription {}", sub.full_name());
        }
        catch (const ChannelError &e)
        {
            if (e.status != 409)
                throw;
            spdlog::debug("[pubsub] subscription {} already exists", sub.full_name());
        }
    }

    std::vector<ReceivedMessage> pull(const SubscriptionPath &sub, std::size_t max_messages) override
    {
        nlohmann::json res;
        try
        {
            res = call(http::verb::post, "/v1/" + sub.full_name() + ":pull",
                       nlohmann::json{{"maxMessages", max_messages}}, pull_timeout_, true);
        }
        catch (const ChannelError &e)
        {
            if (!pull_cancelled())
                throw;
            spdlog::debug("[pubsub] pull cancelled: {}", e.what());
            return {};
        }

        std::vector<ReceivedMessage> out;
        auto it = res.find("receivedMessages");
        if (it == res.end() || !it->is_array())
            return out;
        for (const auto &rm : *it)
        {
            ReceivedMessage m;
            m.ack_id = rm.value("ackId", std::string());
            m.delivery_attempt = rm.value("deliveryAttempt", 0);
            if (m.ack_id.empty())
            {
                spdlog::warn("[pubsub] pulled message without ackId; skipping");
                continue;
            }
            const auto msg = rm.value("message", nlohmann::json::object());
            m.message_id = msg.value("messageId", std::string());
            try
            {
                m.data = base64_decode(msg.value("data", std::string()));
            }
            catch (const ChannelError &e)
            {
                // Leave data empty; the listener treats it as malformed and acks it.
                spdlog::warn("[pubsub] message {}: {}", m.message_id, e.what());
                m.data.clear();
            }
            out.push_back(std::move(m));
        }
        return out;
    }

    void acknowledge(const SubscriptionPath &sub, const std::vector<std::string> &ack_ids) override
    {
        if (ack_ids.empty())
            return;
        call(http::verb::post, "/v1/" + sub.full_name() + ":acknowledge",
             nlohmann::json{{"ackIds", ack_ids}}, request_timeout_);
    }

    void reject(const SubscriptionPath &sub, const std::vector<std::string> &ack_ids) override
    {
        if (ack_ids.empty())
            return;
        call(http::verb::post, "/v1/" + sub.full_name() + ":modifyAckDeadline",
             nlohmann::json{{"ackIds", ack_ids}, {"ackDeadlineSeconds", 0}}, request_timeout_);
    }

    std::string publish(const TopicPath &topic, const std::string &data) override
    {
        nlohmann::json msg{{"data", base64_encode(data)}};
        nlohmann::json body{{"messages", nlohmann::json::array({msg})}};
        auto res = call(http::verb::post, "/v1/" + topic.full_name() + ":publish", body, request_timeout_);
        auto ids = res.find("messageIds");
        if (ids == res.end() || !ids->is_array() || ids->empty() || !(*ids)[0].is_string())
            throw ChannelError("publish response carries no message id");
        return (*ids)[0].get<std::string>();
    }

    void cancel_pull() override
    {
        std::scoped_lock lk(cancel_mtx_);
        pull_cancelled_ = true;
        if (active_pull_)
            active_pull_->stop();
    }

    bool pull_cancelled() const
    {
        std::scoped_lock lk(cancel_mtx_);
        return pull_cancelled_;
    }

private:
    using Response = http::response<http::string_body>;

    // Publishes the io_context of a pull so cancel_pull() can stop it.
    class ActivePull
    {
        PubsubRestClient &client_;
        bool on_;

    public:
        ActivePull(PubsubRestClient &client, boost::asio::io_context &ioc, bool on) : client_(client), on_(on)
        {
            if (!on_)
                return;
            std::scoped_lock lk(client_.cancel_mtx_);
            client_.active_pull_ = &ioc;
        }
        ~ActivePull()
        {
            if (!on_)
                return;
            std::scoped_lock lk(client_.cancel_mtx_);
            client_.active_pull_ = nullptr;
        }
        ActivePull(const ActivePull &) = delete;
        ActivePull &operator=(const ActivePull &) = delete;
    };

    // Runs one async step to completion on a private io_context so that the
    // tcp_stream expiry applies. A step that never completes was cut short by
    // cancel_pull().
    template <class Start>
    void await_step(boost::asio::io_context &ioc, Start &&start, const char *what)
    {
        boost::beast::error_code ec;
        bool done = false;
        start([&ec, &done](boost::beast::error_code e, auto &&...)
              {
            ec = e;
            done = true; });
        {
            // restart() must not undo a stop() from cancel_pull().
            std::scoped_lock lk(cancel_mtx_);
            if (active_pull_ == &ioc && pull_cancelled_)
                throw ChannelError(std::string(what) + ": cancelled");
            ioc.restart();
        }
        ioc.run();
        if (!done)
            throw ChannelError(std::string(what) + ": cancelled");
        if (ec)
            throw ChannelError(std::string(what) + ": " + ec.message());
    }

    template <class Stream>
    Response exchange(boost::asio::io_context &ioc, Stream &stream, http::request<http::string_body> &req)
    {
        await_step(ioc, [&](auto h)
                   { http::async_write(stream, req, h); }, "send request");
        boost::beast::flat_buffer buffer;
        Response res;
        await_step(ioc, [&](auto h)
                   { http::async_read(stream, buffer, res, h); }, "read response");
        return res;
    }

    Response perform(http::request<http::string_body> &req, std::chrono::seconds timeout, bool cancellable)
    {
        boost::asio::io_context ioc;
        ActivePull active{*this, ioc, cancellable};
        boost::asio::ip::tcp::resolver resolver{ioc};
        boost::system::error_code ec;
        auto const results = resolver.resolve(ep_.host, ep_.port, ec);
        if (ec)
            throw ChannelError("resolve " + ep_.host + ": " + ec.message());

        if (!ep_.tls)
        {
            boost::beast::tcp_stream stream{ioc};
            stream.expires_after(timeout);
            await_step(ioc, [&](auto h)
                       { stream.async_connect(results, h); }, "connect");
            auto res = exchange(ioc, stream, req);
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::asio::error::not_connected)
                spdlog::debug("[pubsub] shutdown: {}", ec.message());
            return res;
        }

        boost::beast::ssl_stream<boost::beast::tcp_stream> stream{ioc, *ssl_ctx_};
        if (!SSL_set_tlsext_host_name(stream.native_handle(), ep_.host.c_str()))
            throw ChannelError("failed to set TLS server name for " + ep_.host);
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(ep_.host));
        boost::beast::get_lowest_layer(stream).expires_after(timeout);
        await_step(ioc, [&](auto h)
                   { boost::beast::get_lowest_layer(stream).async_connect(results, h); }, "connect");
        await_step(ioc, [&](auto h)
                   { stream.async_handshake(boost::asio::ssl::stream_base::client, h); }, "tls handshake");
        return exchange(ioc, stream, req);
    }

    nlohmann::json call(http::verb verb, const std::string &target, const nlohmann::json &body,
                        std::chrono::seconds timeout, bool cancellable = false)
    {
        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, ep_.host);
        req.set(http::field::user_agent, "receipt-relay/" BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        if (!token_.empty())
            req.set(http::field::authorization, "Bearer " + token_);
        req.body() = body.dump();
        req.prepare_payload();

        auto res = perform(req, timeout, cancellable);

        auto j = res.body().empty() ? nlohmann::json::object()
                                    : nlohmann::json::parse(res.body(), nullptr, false);
        const int status = res.result_int();
        if (status < 200 || status >= 300)
        {
            std::string detail = res.body();
            if (j.is_object() && j.contains("error") && j["error"].is_object())
                detail = j["error"].value("message", detail);
            throw ChannelError(std::string(http::to_string(verb)) + " " + target + " -> " +
                                   std::to_string(status) + ": " + detail,
                               status);
        }
        if (j.is_discarded() || !j.is_object())
            throw ChannelError(target + ": response is not a JSON object");
        return j;
    }
};
