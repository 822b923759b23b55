/*
 * Scheduler Implementation
 */

#include "core/scheduler.h"

Scheduler::Scheduler()
  : taskCount(0)
  , watchdogFeed(nullptr)
{
  for (uint8_t i = 0; i < MAX_TASKS; i++) {
    tasks[i].func = nullptr;
    tasks[i].intervalMs = 0;
    tasks[i].lastRunTime = 0;
    tasks[i].enabled = false;
    tasks[i].hasRun = false;
    tasks[i].name = nullptr;
  }
}

void Scheduler::init(WatchdogFeed feed) {
  taskCount = 0;
  watchdogFeed = feed;
}

int8_t Scheduler::registerTask(TaskFunction func, uint32_t intervalMs, const char* name) {
  if (taskCount >= MAX_TASKS || func == nullptr) {
    return -1;
  }

  tasks[taskCount].func = func;
  tasks[taskCount].intervalMs = intervalMs;
  tasks[taskCount].lastRunTime = 0;
  tasks[taskCount].enabled = true;
  tasks[taskCount].hasRun = false;
  tasks[taskCount].name = name;

  return (int8_t)taskCount++;
}

void Scheduler::enableTask(uint8_t index) {
  if (index < taskCount) {
    tasks[index].enabled = true;
  }
}

void Scheduler::disableTask(uint8_t index) {
  if (index < taskCount) {
    tasks[index].enabled = false;
  }
}

bool Scheduler::isTaskEnabled(uint8_t index) const {
  return index < taskCount && tasks[index].enabled;
}

const char* Scheduler::getTaskName(uint8_t index) const {
  return index < taskCount ? tasks[index].name : nullptr;
}

void Scheduler::feedWatchdog() {
  if (watchdogFeed) {
    watchdogFeed();
  }
}

void Scheduler::run(uint32_t now) {
  feedWatchdog();

  for (uint8_t i = 0; i < taskCount; i++) {
    if (!tasks[i].enabled || tasks[i].func == nullptr) {
      continue;
    }

    // Unsigned subtraction keeps this correct across millis() rollover.
    // First call always runs so periodic tasks start at boot.
    uint32_t elapsed = now - tasks[i].lastRunTime;
    if (!tasks[i].hasRun || elapsed >= tasks[i].intervalMs) {
      feedWatchdog();
      tasks[i].func();
      tasks[i].lastRunTime = now;
      tasks[i].hasRun = true;
      feedWatchdog();
    }
  }
}
