/*
 * Command Dispatcher Implementation
 */

#include "dispatcher.h"
#include "core/log.h"

Dispatcher::Dispatcher()
  : executor(nullptr)
  , channel(nullptr)
  , stats(nullptr)
  , mode(DISPATCH_QUEUED)
  , busyPolicy(BUSY_WHEN_QUEUE_FULL)
  , capacity(DISPATCH_QUEUE_CAPACITY)
  , ackDelayMs(0)
  , head(0)
  , count(0)
  , state(STATE_IDLE)
  , holdStart(0)
  , holdMs(0)
  , executions(0)
{
  currentResult.error = ERR_NONE;
  currentResult.holdMs = 0;
  currentResult.completionTelemetry = TELEM_NONE;
}

void Dispatcher::init(Executor* e, ReplyChannel* c, EngineStats* s) {
  executor = e;
  channel = c;
  stats = s;
  head = 0;
  count = 0;
  state = STATE_IDLE;
  executions = 0;
}

void Dispatcher::configure(const Profile& profile) {
  mode = profile.dispatch;
  busyPolicy = profile.busyPolicy;
  capacity = profile.queueCapacity;
  if (capacity == 0 || capacity > DISPATCH_QUEUE_CAPACITY) {
    capacity = DISPATCH_QUEUE_CAPACITY;
  }
  ackDelayMs = profile.ackDelayMs;
  head = 0;
  count = 0;
  state = STATE_IDLE;
}

bool Dispatcher::enqueue(const Command& cmd) {
  if (count >= capacity) {
    return false;
  }
  uint8_t tail = (uint8_t)((head + count) % DISPATCH_QUEUE_CAPACITY);
  queue[tail] = cmd;
  count++;
  return true;
}

bool Dispatcher::dequeue(Command& cmd) {
  if (count == 0) {
    return false;
  }
  cmd = queue[head];
  head = (uint8_t)((head + 1) % DISPATCH_QUEUE_CAPACITY);
  count--;
  return true;
}

void Dispatcher::reject(const Command& cmd) {
  if (stats) {
    stats->busy_rejections++;
  }
  LOG_V("DISP", "busy, dropped seq %02X", cmd.seq);
  if (channel) {
    channel->send(ReplyEncoder::busy(cmd.seq));
  }
}

bool Dispatcher::submit(const Command& cmd, uint32_t now) {
  if (mode == DISPATCH_IMMEDIATE) {
    // Finish a held completion first so replies keep arrival order
    if (state == STATE_EXECUTING) {
      completeExecution();
    }
    startExecution(cmd, now);
    if (holdElapsed(now)) {
      completeExecution();
    }
    return true;
  }

  if (busyPolicy == BUSY_WHEN_EXECUTING && (state == STATE_EXECUTING || count > 0)) {
    reject(cmd);
    return false;
  }
  if (!enqueue(cmd)) {
    reject(cmd);
    return false;
  }
  return true;
}

void Dispatcher::pump(uint32_t now) {
  for (;;) {
    if (state == STATE_EXECUTING) {
      if (!holdElapsed(now)) {
        return;
      }
      completeExecution();
    }

    if (mode == DISPATCH_IMMEDIATE) {
      return;  // Nothing is ever queued
    }

    Command next;
    if (!dequeue(next)) {
      return;
    }
    startExecution(next, now);
  }
}

void Dispatcher::startExecution(const Command& cmd, uint32_t now) {
  state = STATE_EXECUTING;
  current = cmd;
  executions++;

  if (executor) {
    currentResult = executor->execute(cmd, now);
  } else {
    currentResult.error = ERR_NONE;
    currentResult.holdMs = 0;
    currentResult.completionTelemetry = TELEM_NONE;
  }

  holdStart = now;
  holdMs = currentResult.holdMs > ackDelayMs ? currentResult.holdMs : ackDelayMs;
}

void Dispatcher::completeExecution() {
  state = STATE_IDLE;
  if (!channel) {
    return;
  }

  if (currentResult.error != ERR_NONE) {
    channel->send(ReplyEncoder::error(current.seq, currentResult.error, current.opText));
    return;
  }
  if (currentResult.completionTelemetry != TELEM_NONE) {
    channel->send(ReplyEncoder::telemetry(currentResult.completionTelemetry, 0));
  }
  channel->send(ReplyEncoder::ack(current));
}

bool Dispatcher::holdElapsed(uint32_t now) const {
  return (uint32_t)(now - holdStart) >= holdMs;
}
