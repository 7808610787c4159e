/*
 * File: src/relay_registry.hpp
 * Project: Receipt Event Relay
 * Purpose: Live client connection set shared by the acceptor and broadcaster
 * Notes:
 *  - A connection is a member if and only if it is open
 *  - snapshot() hands out an immutable map; writers swap in a new copy
 * Last updated: 2026-10-17
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

using ConnectionId = std::uint64_t;

enum class ConnectionState
{
    open,
    closing,
    closed
};

// Ids are unique for the life of the process and never reused.
inline ConnectionId next_connection_id()
{
    static std::atomic<ConnectionId> seq{1};
    return seq.fetch_add(1);
}

// One live peer as seen by the broadcaster. The owning per-connection loop
// holds the socket; deliver() and close() only hand work to that loop.
class ClientConnection
{
public:
    virtual ~ClientConnection() = default;

    virtual ConnectionId id() const = 0;
    virtual ConnectionState state() const = 0;

    // Queue one serialized frame. Returns false when the frame cannot be
    // accepted (queue full, connection no longer open).
    virtual bool deliver(std::shared_ptr<const std::string> frame) = 0;

    // Ask the owning loop to close the socket. Never blocks.
    virtual void close() = 0;
};

class ConnectionRegistry
{
public:
    using Snapshot = std::shared_ptr<const std::map<ConnectionId, std::shared_ptr<ClientConnection>>>;

    explicit ConnectionRegistry(std::size_t max_connections = 10000)
        : max_(max_connections), members_(std::make_shared<Map>()) {}

    ConnectionRegistry(const ConnectionRegistry &) = delete;
    ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

    ConnectionId add(std::shared_ptr<ClientConnection> conn, boost::system::error_code &ec)
    {
        ec = {};
        const auto id = conn->id();
        std::scoped_lock lk(mtx_);
        if (members_->size() >= max_)
        {
            ec = boost::asio::error::no_buffer_space;
            return id;
        }
        if (members_->count(id))
        {
            ec = boost::asio::error::already_open;
            return id;
        }
        auto next = std::make_shared<Map>(*members_);
        next->emplace(id, std::move(conn));
        members_ = std::move(next);
        return id;
    }

    // Idempotent.
    void remove(ConnectionId id)
    {
        std::scoped_lock lk(mtx_);
        if (!members_->count(id))
            return;
        auto next = std::make_shared<Map>(*members_);
        next->erase(id);
        members_ = std::move(next);
    }

    Snapshot snapshot() const
    {
        std::scoped_lock lk(mtx_);
        return members_;
    }

    std::size_t size() const { return snapshot()->size(); }

    std::size_t capacity() const { return max_; }

private:
    using Map = std::map<ConnectionId, std::shared_ptr<ClientConnection>>;

    const std::size_t max_;
    mutable std::mutex mtx_;
    std::shared_ptr<const Map> members_;
};
