/*
 * Cooperative Scheduler
 *
 * Fixed-interval task execution on a single thread.
 * Tasks run to completion; the watchdog hook is fed around each one.
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <stdint.h>

// Task function pointer type
typedef void (*TaskFunction)();

// Watchdog feed hook (wdt_reset on AVR, nullptr on host)
typedef void (*WatchdogFeed)();

// Task structure
struct Task {
  TaskFunction func;
  uint32_t intervalMs;
  uint32_t lastRunTime;
  bool enabled;
  bool hasRun;
  const char* name;
};

class Scheduler {
public:
  Scheduler();

  // Initialize scheduler (clears the task table)
  void init(WatchdogFeed feed = nullptr);

  // Register a task, returns its index or -1 if the table is full
  int8_t registerTask(TaskFunction func, uint32_t intervalMs, const char* name);

  // Enable/disable task
  void enableTask(uint8_t index);
  void disableTask(uint8_t index);
  bool isTaskEnabled(uint8_t index) const;

  // Run every due task once (call from main loop with millis())
  void run(uint32_t now);

  uint8_t getTaskCount() const { return taskCount; }
  const char* getTaskName(uint8_t index) const;

private:
  static const uint8_t MAX_TASKS = 8;
  Task tasks[MAX_TASKS];
  uint8_t taskCount;

  WatchdogFeed watchdogFeed;

  void feedWatchdog();
};

#endif // SCHEDULER_H
