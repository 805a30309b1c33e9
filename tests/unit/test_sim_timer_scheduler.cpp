// tests/unit/test_sim_timer_scheduler.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/core/sim/timer_scheduler.hpp"
#include <vector>

using namespace NetSim::Core::Sim;
using namespace testing;

class TimerSchedulerTest : public ::testing::Test
{
protected:
    VirtualClock clock;
    TimerScheduler scheduler{clock};
    std::vector<std::string> fired;
};

// ==================== Ordering tests ====================
TEST_F(TimerSchedulerTest, ClockStartsAtZero)
{
    EXPECT_EQ(clock.nowMs(), 0u);
    EXPECT_EQ(scheduler.pendingCount(), 0u);
    EXPECT_EQ(scheduler.advance(1000), 0u);
    EXPECT_EQ(clock.nowMs(), 1000u);
    EXPECT_EQ(clock.nowSeconds(), 1u);
    EXPECT_EQ(clock.nowUs(), 1000000u);
}

TEST_F(TimerSchedulerTest, RunsInDueOrder)
{
    scheduler.schedule(300, [this]() { fired.push_back("c"); });
    scheduler.schedule(100, [this]() { fired.push_back("a"); });
    scheduler.schedule(200, [this]() { fired.push_back("b"); });

    EXPECT_EQ(scheduler.advance(1000), 3u);
    EXPECT_THAT(fired, ElementsAre("a", "b", "c"));
}

TEST_F(TimerSchedulerTest, SameDueTimeKeepsRegistrationOrder)
{
    scheduler.schedule(50, [this]() { fired.push_back("first"); });
    scheduler.schedule(50, [this]() { fired.push_back("second"); });
    scheduler.schedule(50, [this]() { fired.push_back("third"); });

    scheduler.advance(50);
    EXPECT_THAT(fired, ElementsAre("first", "second", "third"));
}

TEST_F(TimerSchedulerTest, ClockSetToDueTimeDuringCallback)
{
    uint64_t seen = 0;
    scheduler.schedule(4000, [&]() { seen = clock.nowMs(); });

    scheduler.advance(10000);
    EXPECT_EQ(seen, 4000u);
    EXPECT_EQ(clock.nowMs(), 10000u);
}

TEST_F(TimerSchedulerTest, TaskNotDueDoesNotRun)
{
    scheduler.schedule(1000, [this]() { fired.push_back("late"); });

    scheduler.advance(999);
    EXPECT_TRUE(fired.empty());
    scheduler.advance(1);
    EXPECT_THAT(fired, ElementsAre("late"));
}

// ==================== Cancel tests ====================
TEST_F(TimerSchedulerTest, CancelPreventsRun)
{
    TimerId id = scheduler.schedule(100, [this]() { fired.push_back("x"); });

    EXPECT_TRUE(scheduler.isPending(id));
    EXPECT_EQ(scheduler.dueTime(id), 100u);
    EXPECT_TRUE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.isPending(id));
    EXPECT_FALSE(scheduler.cancel(id));
    EXPECT_EQ(scheduler.dueTime(id), 0u);

    scheduler.advance(200);
    EXPECT_TRUE(fired.empty());
}

TEST_F(TimerSchedulerTest, CancelAfterFireIsNoop)
{
    TimerId id = scheduler.schedule(10, []() {});
    scheduler.advance(10);
    EXPECT_FALSE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(INVALID_TIMER));
}

TEST_F(TimerSchedulerTest, CallbackCanCancelAnother)
{
    TimerId victim = INVALID_TIMER;
    scheduler.schedule(100, [&]() { scheduler.cancel(victim); });
    victim = scheduler.schedule(200, [this]() { fired.push_back("victim"); });

    scheduler.advance(500);
    EXPECT_TRUE(fired.empty());
}

// ==================== Re-entrancy tests ====================
TEST_F(TimerSchedulerTest, CallbackSchedulesWithinWindow)
{
    // Timer tự lặp lại mỗi 10 ms
    std::function<void()> tick;
    tick = [&]()
    {
        fired.push_back(std::to_string(clock.nowMs()));
        if (fired.size() < 5)
            scheduler.schedule(10, tick);
    };
    scheduler.schedule(10, tick);

    EXPECT_EQ(scheduler.advance(100), 5u);
    EXPECT_THAT(fired, ElementsAre("10", "20", "30", "40", "50"));
}

TEST_F(TimerSchedulerTest, ZeroDelayRunsOnRunDue)
{
    scheduler.advance(500);
    scheduler.schedule(0, [this]() { fired.push_back("now"); });

    EXPECT_EQ(scheduler.runDue(), 1u);
    EXPECT_THAT(fired, ElementsAre("now"));
    EXPECT_EQ(clock.nowMs(), 500u);
}
