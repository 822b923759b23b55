#include <gtest/gtest.h>
#include "core/scheduler.h"

static int g_fastRuns = 0;
static int g_slowRuns = 0;
static int g_feeds = 0;

static void fastTask() { g_fastRuns++; }
static void slowTask() { g_slowRuns++; }
static void feed() { g_feeds++; }

class SchedulerTest : public ::testing::Test {
protected:
  void SetUp() {
    g_fastRuns = 0;
    g_slowRuns = 0;
    g_feeds = 0;
    scheduler.init(feed);
  }

  Scheduler scheduler;
};

TEST_F(SchedulerTest, RunsTasksOnTheirIntervals) {
  scheduler.registerTask(fastTask, 10, "fast");
  scheduler.registerTask(slowTask, 100, "slow");

  for (uint32_t now = 1000; now < 1200; now++) {
    scheduler.run(now);
  }

  EXPECT_EQ(20, g_fastRuns);
  EXPECT_EQ(2, g_slowRuns);
}

TEST_F(SchedulerTest, FirstRunIsImmediate) {
  scheduler.registerTask(slowTask, 5000, "slow");
  scheduler.run(3);
  EXPECT_EQ(1, g_slowRuns);
}

TEST_F(SchedulerTest, DisabledTaskIsSkipped) {
  int8_t id = scheduler.registerTask(fastTask, 1, "fast");
  ASSERT_GE(id, 0);
  scheduler.disableTask((uint8_t)id);
  EXPECT_FALSE(scheduler.isTaskEnabled((uint8_t)id));
  scheduler.run(0);
  scheduler.run(5);
  EXPECT_EQ(0, g_fastRuns);

  scheduler.enableTask((uint8_t)id);
  scheduler.run(10);
  EXPECT_EQ(1, g_fastRuns);
}

TEST_F(SchedulerTest, TableIsBounded) {
  for (int i = 0; i < 8; i++) {
    EXPECT_EQ(i, scheduler.registerTask(fastTask, 10, "t"));
  }
  EXPECT_EQ(-1, scheduler.registerTask(fastTask, 10, "overflow"));
  EXPECT_EQ(-1, scheduler.registerTask(nullptr, 10, "null"));
  EXPECT_EQ(8, scheduler.getTaskCount());
}

TEST_F(SchedulerTest, FeedsWatchdogAroundTasks) {
  scheduler.registerTask(fastTask, 10, "fast");
  scheduler.run(0);
  EXPECT_EQ(3, g_feeds);  // loop entry, before, after
}

TEST_F(SchedulerTest, IntervalSurvivesMillisRollover) {
  scheduler.registerTask(fastTask, 100, "fast");
  scheduler.run(0xFFFFFFC0UL);
  scheduler.run(0x00000010UL);  // 0x50 elapsed
  EXPECT_EQ(1, g_fastRuns);
  scheduler.run(0x00000024UL);  // 0x64 elapsed
  EXPECT_EQ(2, g_fastRuns);
}

TEST_F(SchedulerTest, TaskNames) {
  scheduler.registerTask(fastTask, 10, "rx");
  EXPECT_STREQ("rx", scheduler.getTaskName(0));
  EXPECT_TRUE(scheduler.getTaskName(1) == nullptr);
}
