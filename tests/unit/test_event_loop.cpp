#include <gtest/gtest.h>

#include "ui/event_loop.hpp"
#include "util/manual_clock.hpp"

#include <stdexcept>
#include <thread>

using namespace tabsync;
using namespace std::chrono_literals;
using tabsync::test::ManualClock;

TEST(EventLoop, PostedTasksRunInOrder)
{
    EventLoop        loop;
    std::vector<int> seen;
    loop.post([&] { seen.push_back(1); });
    loop.post([&] { seen.push_back(2); });
    EXPECT_EQ(loop.pending_tasks(), 2u);
    EXPECT_TRUE(seen.empty());

    EXPECT_EQ(loop.run_pending(), 2u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(EventLoop, TaskPostedFromTaskRunsNextPass)
{
    EventLoop loop;
    int       runs = 0;
    loop.post([&] { loop.post([&] { ++runs; }); });

    loop.run_pending();
    EXPECT_EQ(runs, 0);
    loop.run_until_idle();
    EXPECT_EQ(runs, 1);
}

TEST(EventLoop, PostFromOtherThread)
{
    EventLoop loop;
    bool      ran = false;
    std::thread([&] { loop.post([&] { ran = true; }); }).join();
    loop.run_until_idle();
    EXPECT_TRUE(ran);
}

TEST(EventLoop, TimersFireWhenDue)
{
    ManualClock clock;
    EventLoop   loop(clock.now_fn());
    int         fired = 0;
    auto        id    = loop.schedule(100ms, [&] { ++fired; });
    EXPECT_TRUE(loop.is_scheduled(id));
    EXPECT_EQ(loop.time_until_next_timer(), 100ms);

    clock.advance(99ms);
    loop.run_until_idle();
    EXPECT_EQ(fired, 0);

    clock.advance(1ms);
    loop.run_until_idle();
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(loop.is_scheduled(id));
    EXPECT_FALSE(loop.time_until_next_timer().has_value());
}

TEST(EventLoop, TimersRunEarliestFirst)
{
    ManualClock      clock;
    EventLoop        loop(clock.now_fn());
    std::vector<int> order;
    loop.schedule(30ms, [&] { order.push_back(3); });
    loop.schedule(10ms, [&] { order.push_back(1); });
    loop.schedule(10ms, [&] { order.push_back(2); });

    clock.advance(50ms);
    loop.run_until_idle();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, CancelledTimerNeverFires)
{
    ManualClock clock;
    EventLoop   loop(clock.now_fn());
    bool        fired = false;
    auto        id    = loop.schedule(10ms, [&] { fired = true; });
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.cancel(id));

    clock.advance(20ms);
    loop.run_until_idle();
    EXPECT_FALSE(fired);
}

TEST(EventLoop, TimerCancelledByEarlierTimerIsSkipped)
{
    ManualClock clock;
    EventLoop   loop(clock.now_fn());
    bool        second = false;
    EventLoop::TimerId later = EventLoop::INVALID_TIMER;
    loop.schedule(5ms, [&] { loop.cancel(later); });
    later = loop.schedule(6ms, [&] { second = true; });

    clock.advance(10ms);
    loop.run_until_idle();
    EXPECT_FALSE(second);
}

TEST(EventLoop, ThrowingTaskDoesNotStopTheLoop)
{
    EventLoop loop;
    bool      after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });
    loop.run_until_idle();
    EXPECT_TRUE(after);
}

TEST(EventLoop, NonStandardThrowDoesNotStopTheLoop)
{
    ManualClock clock;
    EventLoop   loop(clock.now_fn());
    int         ran = 0;
    loop.post([] { throw 42; });
    loop.schedule(5ms, [] { throw "timer"; });
    loop.schedule(5ms, [&] { ++ran; });
    loop.post([&] { ++ran; });

    EXPECT_NO_THROW(loop.run_until_idle());
    clock.advance(5ms);
    EXPECT_NO_THROW(loop.run_until_idle());
    EXPECT_EQ(ran, 2);
}
