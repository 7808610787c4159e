/*
 * File: tests/test_registry.cpp
 * Project: Receipt Event Relay
 * Purpose: Connection registry membership and snapshot consistency
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "relay_registry.hpp"
#include "relay_test_support.hpp"

TEST_CASE("add, remove and snapshot")
{
    ConnectionRegistry reg;
    auto a = std::make_shared<FakeConnection>();
    auto b = std::make_shared<FakeConnection>();
    boost::system::error_code ec;

    REQUIRE(reg.add(a, ec) == a->id());
    REQUIRE_FALSE(ec);
    reg.add(b, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(reg.size() == 2);

    auto before = reg.snapshot();
    reg.remove(a->id());
    REQUIRE(reg.size() == 1);
    REQUIRE(reg.snapshot()->count(b->id()) == 1);
    REQUIRE(reg.snapshot()->count(a->id()) == 0);

    // An older snapshot is a frozen view.
    REQUIRE(before->size() == 2);
    REQUIRE(before->count(a->id()) == 1);
}

TEST_CASE("remove is idempotent")
{
    ConnectionRegistry reg;
    auto a = std::make_shared<FakeConnection>();
    boost::system::error_code ec;
    reg.add(a, ec);
    reg.remove(a->id());
    reg.remove(a->id());
    reg.remove(999999);
    REQUIRE(reg.size() == 0);
}

TEST_CASE("registry reports exhaustion instead of growing")
{
    ConnectionRegistry reg{2};
    std::vector<std::shared_ptr<FakeConnection>> conns;
    for (int i = 0; i < 3; ++i)
        conns.push_back(std::make_shared<FakeConnection>());

    boost::system::error_code ec;
    reg.add(conns[0], ec);
    REQUIRE_FALSE(ec);
    reg.add(conns[1], ec);
    REQUIRE_FALSE(ec);
    reg.add(conns[2], ec);
    REQUIRE(ec == boost::asio::error::no_buffer_space);
    REQUIRE(reg.size() == 2);
    REQUIRE(reg.snapshot()->count(conns[2]->id()) == 0);

    reg.remove(conns[0]->id());
    reg.add(conns[2], ec);
    REQUIRE_FALSE(ec);
}

TEST_CASE("the same connection cannot be registered twice")
{
    ConnectionRegistry reg;
    auto a = std::make_shared<FakeConnection>();
    boost::system::error_code ec;
    reg.add(a, ec);
    reg.add(a, ec);
    REQUIRE(ec == boost::asio::error::already_open);
    REQUIRE(reg.size() == 1);
}

TEST_CASE("connection ids are unique")
{
    std::set<ConnectionId> ids;
    for (int i = 0; i < 1000; ++i)
        REQUIRE(ids.insert(next_connection_id()).second);
}

TEST_CASE("snapshots stay consistent under concurrent add/remove")
{
    ConnectionRegistry reg{100000};
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    // Writer i owns ids it adds; each writer keeps at most one of its own live
    // at a time, so a consistent snapshot never has more than one per writer.
    constexpr int writers = 4;
    std::vector<std::vector<ConnectionId>> owned(writers);
    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w)
    {
        threads.emplace_back([&, w]
                             {
            for (int i = 0; i < 2000; ++i)
            {
                auto c = std::make_shared<FakeConnection>();
                boost::system::error_code ec;
                reg.add(c, ec);
                if (ec)
                    ++bad;
                owned[w].push_back(c->id());
                reg.remove(c->id());
            } });
    }

    std::thread reader([&]
                       {
        while (!done)
        {
            auto snap = reg.snapshot();
            if (snap->size() > static_cast<std::size_t>(writers))
                ++bad;
            for (const auto &entry : *snap)
                if (!entry.second || entry.second->id() != entry.first)
                    ++bad;
        } });

    for (auto &t : threads)
        t.join();
    done = true;
    reader.join();

    REQUIRE(bad == 0);
    REQUIRE(reg.size() == 0);
}
