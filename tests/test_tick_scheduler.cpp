#include <diagram_jobs/tick_scheduler.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

TEST(TickSchedulerTest, ZeroDelayTimerFiresOnNextAdvance) {
    diagram_jobs::TickScheduler scheduler;
    int calls = 0;
    ASSERT_TRUE(scheduler.start_timer(0ms, 0ms, [&]() { ++calls; }));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(scheduler.advance(0ms), 1u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler.active_timers(), 0u);
}

TEST(TickSchedulerTest, RepeatingTimerFiresEveryInterval) {
    diagram_jobs::TickScheduler scheduler;
    int calls = 0;
    auto id = scheduler.start_timer(0ms, 100ms, [&]() { ++calls; });
    ASSERT_TRUE(id);

    scheduler.advance(350ms); // 0, 100, 200, 300
    EXPECT_EQ(calls, 4);
    EXPECT_TRUE(scheduler.is_active(*id));
    EXPECT_TRUE(scheduler.stop_timer(*id));
    EXPECT_FALSE(scheduler.stop_timer(*id));
    scheduler.advance(1000ms);
    EXPECT_EQ(calls, 4);
}

TEST(TickSchedulerTest, TimersRunInDueOrder) {
    diagram_jobs::TickScheduler scheduler;
    std::vector<std::string> order;
    scheduler.start_timer(30ms, 0ms, [&]() { order.push_back("c"); });
    scheduler.start_timer(10ms, 0ms, [&]() { order.push_back("a"); });
    scheduler.start_timer(20ms, 0ms, [&]() { order.push_back("b"); });
    scheduler.advance(50ms);
    EXPECT_EQ(order, (std::vector<std::string>{ "a", "b", "c" }));
    EXPECT_EQ(scheduler.now(), 50ms);
}

TEST(TickSchedulerTest, CallbackMayStopItsOwnTimer) {
    diagram_jobs::TickScheduler scheduler;
    int calls = 0;
    diagram_jobs::Scheduler::TimerId id = 0;
    id = *scheduler.start_timer(0ms, 10ms, [&]() {
        ++calls;
        if (calls == 3) scheduler.stop_timer(id);
    });
    scheduler.advance(100ms);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(scheduler.active_timers(), 0u);
}

TEST(TickSchedulerTest, CreationFailsBeyondCapacity) {
    diagram_jobs::TickScheduler scheduler(1);
    EXPECT_TRUE(scheduler.start_timer(0ms, 10ms, []() {}));
    EXPECT_FALSE(scheduler.start_timer(0ms, 10ms, []() {}));
    EXPECT_FALSE(diagram_jobs::TickScheduler().start_timer(0ms, 0ms, nullptr));
}

} // namespace
