#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <gtest/gtest.h>
#include "../../src/engine/concurrency/concurrency_gate.hpp"

using namespace OpenCrawl::Engine;

namespace {

struct Tracker {
    int              active     = 0;
    int              max_active = 0;
    std::vector<int> order;
    int              aborted = 0;
};

boost::asio::awaitable<void> hold_slot(ConcurrencyGate& gate, Tracker& tracker, int id, int hold_ms) {
    try {
        auto permit = co_await gate.acquire();
        tracker.order.push_back(id);
        tracker.max_active = std::max(tracker.max_active, ++tracker.active);

        auto                      executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor, std::chrono::milliseconds(hold_ms));
        co_await timer.async_wait(boost::asio::use_awaitable);
        --tracker.active;
    } catch (const boost::system::system_error&) {
        ++tracker.aborted;
    }
}

}  // namespace

TEST(ConcurrencyGateTest, NeverExceedsCapacity) {
    boost::asio::io_context ioc;
    ConcurrencyGate         gate(3);
    Tracker                 tracker;
    EXPECT_EQ(gate.capacity(), 3u);

    for (int i = 0; i < 10; ++i)
        boost::asio::co_spawn(ioc, hold_slot(gate, tracker, i, 5), boost::asio::detached);
    ioc.run();

    EXPECT_EQ(tracker.max_active, 3);
    EXPECT_EQ(tracker.order.size(), 10u);
    EXPECT_EQ(gate.in_use(), 0u);
    EXPECT_EQ(gate.waiting(), 0u);
}

TEST(ConcurrencyGateTest, WaitersAdmittedInFifoOrder) {
    boost::asio::io_context ioc;
    ConcurrencyGate         gate(1);
    Tracker                 tracker;

    for (int i = 0; i < 5; ++i)
        boost::asio::co_spawn(ioc, hold_slot(gate, tracker, i, 1), boost::asio::detached);
    ioc.run();

    EXPECT_EQ(tracker.order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ConcurrencyGateTest, PermitReleasesOnScopeExit) {
    boost::asio::io_context ioc;
    ConcurrencyGate         gate(2);

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            {
                auto first  = co_await gate.acquire();
                auto second = co_await gate.acquire();
                EXPECT_EQ(gate.in_use(), 2u);
                auto moved = std::move(second);
                EXPECT_FALSE(second.held());
                EXPECT_TRUE(moved.held());
            }
            EXPECT_EQ(gate.in_use(), 0u);
        },
        boost::asio::detached);
    ioc.run();
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ConcurrencyGateTest, CancelWaitersFailsPendingAcquires) {
    boost::asio::io_context ioc;
    ConcurrencyGate         gate(1);
    Tracker                 tracker;

    for (int i = 0; i < 4; ++i)
        boost::asio::co_spawn(ioc, hold_slot(gate, tracker, i, 20), boost::asio::detached);

    boost::asio::steady_timer cancel_timer(ioc, std::chrono::milliseconds(5));
    cancel_timer.async_wait([&](const boost::system::error_code&) { gate.cancel_waiters(); });
    ioc.run();

    EXPECT_EQ(tracker.order, (std::vector<int>{0}));
    EXPECT_EQ(tracker.aborted, 3);
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ConcurrencyGateTest, ZeroCapacityRejected) {
    EXPECT_THROW(ConcurrencyGate(0), std::invalid_argument);
}
