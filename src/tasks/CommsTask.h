#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "comms/SerialLink.h"
#include "sched/Share.h"
#include "sched/Task.h"
#include "sched/TaskList.h"
#include "tasks/MotorTask.h"
#include "utils/Rate.h"

/*
===============================================================================
  CommsTask.h
===============================================================================

  PURPOSE
  -------
  Data collection and host communication, as its own low-priority task.

  Every activation:
    1. Reads serial input and handles every queued command
         run    -> store Kp, set controller periods, raise start flags
         stop   -> raise the stop share
         status -> log task table, shares, link stats, traces
       Every command with a seq gets exactly one ack.
    2. Streams finished data sets: at most SAMPLES_PER_TX_TICK sample
       lines per activation, then one end line per motor
    3. When there was nothing to stream, sends a heartbeat at
       HEARTBEAT_PERIOD_MS

  A run is refused while any motor is still running or still has data
  waiting to be streamed.
===============================================================================
*/

// One controlled motor as seen by the comms task
struct MotorSlot {
  Task* task;
  MotorLink* link;
};

class CommsTask : public TaskBody {
public:
  enum State : uint8_t {
    LISTEN = 0,
    STREAM = 1,
  };

  /*
    slots      : motors to drive, slot_count clamped to MOTOR_COUNT
    kp_share   : gain handed to the motor tasks at the start of each run
    stop_share : abort request seen by the motor tasks
  */
  CommsTask(SerialLink& link,
            TaskList& tasks,
            const MotorSlot* slots,
            size_t slot_count,
            Share<float>& kp_share,
            Share<bool>& stop_share);

  uint8_t step(uint32_t now_ms) override;

  // True while any motor is running or has unsent data
  bool busy() const;

  uint32_t runsStarted() const { return _runs_started; }
  uint32_t txErrors() const { return _tx_errors; }

private:
  void handleCommand_(const CommandFrame& cmd);
  void ack_(uint32_t seq, bool ok, const char* error = nullptr);
  void startRun_(const CommandFrame& cmd);
  void reportStatus_();
  bool streamData_();

  SerialLink& _link;
  TaskList& _tasks;

  MotorSlot _slots[MOTOR_COUNT];
  size_t _slot_count = 0;

  Share<float>& _kp_share;
  Share<bool>& _stop_share;

  // Samples sent so far in the current data set, per slot
  uint32_t _sent[MOTOR_COUNT];

  Rate _heartbeat_rate;

  uint32_t _runs_started = 0;
  uint32_t _tx_errors = 0;
};
