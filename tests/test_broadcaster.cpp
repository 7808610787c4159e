/*
 * File: tests/test_broadcaster.cpp
 * Project: Receipt Event Relay
 * Purpose: Fan-out isolation between peers and drop-and-disconnect policy
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "relay_broadcast.hpp"
#include "relay_test_support.hpp"

namespace
{
EventRecord sample(const std::string &receipt = "r1")
{
    return EventRecord{EventKind::receipt_upload, EventStatus::received, receipt, "u9",
                       std::chrono::system_clock::now()};
}

std::shared_ptr<FakeConnection> join(ConnectionRegistry &reg, std::size_t capacity = 1000)
{
    auto c = std::make_shared<FakeConnection>(capacity);
    boost::system::error_code ec;
    reg.add(c, ec);
    REQUIRE_FALSE(ec);
    return c;
}
} // namespace

TEST_CASE("every registered connection gets the serialized event")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    auto c1 = join(reg), c2 = join(reg), c3 = join(reg);

    auto r = b.broadcast(sample("r1"));
    REQUIRE(r.attempted == 3);
    REQUIRE(r.delivered == 3);
    REQUIRE(r.dropped == 0);
    for (auto &c : {c1, c2, c3})
    {
        auto got = c->received();
        REQUIRE(got.size() == 1);
        auto j = nlohmann::json::parse(got[0]);
        REQUIRE(j["receipt_id"] == "r1");
        REQUIRE(j["status"] == "received");
    }
}

TEST_CASE("broadcast with no clients is a no-op")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    auto r = b.broadcast(sample());
    REQUIRE(r.attempted == 0);
    REQUIRE(b.events_broadcast() == 1);
}

TEST_CASE("a failing peer does not stop delivery to the others")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    auto a = join(reg);
    auto bconn = join(reg);
    auto c = join(reg);
    a->fail_writes();

    auto r = b.broadcast(sample());
    REQUIRE(r.attempted == 3);
    REQUIRE(r.delivered == 2);
    REQUIRE(r.dropped == 1);
    REQUIRE(bconn->received().size() == 1);
    REQUIRE(c->received().size() == 1);

    REQUIRE(reg.snapshot()->count(a->id()) == 0);
    REQUIRE(a->close_calls() == 1);
    REQUIRE(b.connections_dropped() == 1);
}

TEST_CASE("a peer that throws is treated as failed, not propagated")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    auto bad = join(reg);
    auto good = join(reg);
    bad->throw_on_write();

    BroadcastResult r;
    REQUIRE_NOTHROW(r = b.broadcast(sample()));
    REQUIRE(r.dropped == 1);
    REQUIRE(good->received().size() == 1);
    REQUIRE(reg.size() == 1);
}

TEST_CASE("a full outbound queue disconnects only that peer")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    auto stuck = join(reg, 1); // never drained
    auto healthy = join(reg, 1);

    b.broadcast(sample("first"));
    healthy->drain();
    REQUIRE(reg.size() == 2);

    auto r = b.broadcast(sample("second"));
    REQUIRE(r.dropped == 1);
    REQUIRE(reg.snapshot()->count(stuck->id()) == 0);
    healthy->drain();

    // The dropped peer is not in the next recipient set.
    auto r3 = b.broadcast(sample("third"));
    REQUIRE(r3.attempted == 1);
    REQUIRE(r3.delivered == 1);
    REQUIRE(stuck->received().size() == 1);
    REQUIRE(healthy->received().size() == 3);
}

TEST_CASE("a connection registered after a broadcast gets nothing retroactively")
{
    ConnectionRegistry reg;
    Broadcaster b{reg};
    join(reg);
    b.broadcast(sample());
    auto late = join(reg);
    REQUIRE(late->received().empty());
}
