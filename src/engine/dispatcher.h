/*
 * Command Dispatcher
 *
 * Owns the command queue and the busy flag. At most one command executes
 * at a time; its completion reply is an explicit state step
 *
 *   IDLE --pop/submit--> EXECUTING --hold elapsed--> IDLE
 *
 * advanced by pump(), never by nested callbacks.
 *
 * Queued mode:    bounded FIFO, BUSY when the busy policy rejects.
 * Immediate mode: execute on arrival, always accepted.
 */

#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <stdint.h>
#include "config.h"
#include "protocol/protocol_types.h"
#include "protocol/profile.h"
#include "engine_stats.h"
#include "executor.h"
#include "reply_channel.h"

class Dispatcher {
public:
  Dispatcher();

  void init(Executor* executor, ReplyChannel* channel, EngineStats* stats);

  // Apply dispatch mode, busy policy, capacity and ACK delay.
  // Drops anything queued.
  void configure(const Profile& profile);

  // Accept a command. Returns false if it was rejected with BUSY.
  bool submit(const Command& cmd, uint32_t now);

  // Complete a due execution and start queued ones until idle or empty
  void pump(uint32_t now);

  bool isBusy() const { return state == STATE_EXECUTING; }
  uint8_t getQueueLength() const { return count; }
  uint8_t getCapacity() const { return capacity; }

  // Number of executions started since init (diagnostics/tests)
  uint16_t getExecutionCount() const { return executions; }

private:
  enum State {
    STATE_IDLE,
    STATE_EXECUTING
  };

  Executor* executor;
  ReplyChannel* channel;
  EngineStats* stats;

  DispatchMode mode;
  BusyPolicy busyPolicy;
  uint8_t capacity;
  uint16_t ackDelayMs;

  // Ring buffer queue
  Command queue[DISPATCH_QUEUE_CAPACITY];
  uint8_t head;
  uint8_t count;

  State state;
  Command current;
  ExecResult currentResult;
  uint32_t holdStart;
  uint32_t holdMs;

  uint16_t executions;

  bool enqueue(const Command& cmd);
  bool dequeue(Command& cmd);
  void reject(const Command& cmd);

  void startExecution(const Command& cmd, uint32_t now);
  void completeExecution();
  bool holdElapsed(uint32_t now) const;
};

#endif // DISPATCHER_H
