#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "utils/Rate.h"

/*
===============================================================================
  Task.h
===============================================================================

  PURPOSE
  -------
  One cooperatively scheduled activity.

  A Task pairs a TaskBody (the code) with its scheduling data: name,
  priority, period, and optional profiling / state tracing. The body runs
  one short activation per call and returns; it keeps whatever it needs
  between activations in its own members.

  Bodies report a small state number after each activation. The Task
  records transitions between state numbers when tracing is enabled, which
  is how a stuck or misbehaving state machine is usually found.

  NOTES
  -----
  - Higher priority number = runs first.
  - Timing uses the caller's millisecond clock (see Rate).
  - Profiling uses the TaskList's microsecond clock.
===============================================================================
*/

class TaskBody {
public:
  virtual ~TaskBody() {}

  // Runs one activation and returns the body's current state number.
  virtual uint8_t step(uint32_t now_ms) = 0;
};

class Task {
public:
  struct Profile {
    uint32_t runs = 0;
    uint64_t total_us = 0;
    uint32_t max_us = 0;
  };

  struct TraceEntry {
    uint32_t time_ms = 0;
    uint8_t from_state = 0;
    uint8_t to_state = 0;
  };

  /*
    body     : code to run; must outlive the Task
    name     : label for diagnostics (not copied)
    priority : higher runs first
    period_ms: time between activations, 0 is treated as 1
    profile  : keep run count and run-time statistics
    trace    : keep the last TASK_TRACE_LEN state transitions
  */
  Task(TaskBody& body,
       const char* name,
       uint8_t priority,
       uint32_t period_ms,
       bool profile = true,
       bool trace = false);

  // True if the task should run now. Does not change any state.
  bool due(uint32_t now_ms) const { return _rate.due(now_ms); }

  // Consumes the activation and runs the body once. Returns false, without
  // running the body, when the task is not due.
  // clock_us may be nullptr when profiling is off.
  bool run(uint32_t now_ms, uint32_t (*clock_us)());

  // Rejects 0. The new period applies from the next activation.
  bool setPeriodMs(uint32_t period_ms);

  // Makes the task due immediately (used when a run restarts)
  void restartSchedule() { _rate.restart(); }

  const char* name() const { return _name; }
  uint8_t priority() const { return _priority; }
  uint32_t periodMs() const { return _rate.periodMs(); }
  uint8_t state() const { return _state; }
  uint32_t lateCount() const { return _rate.lateCount(); }

  const Profile& profile() const { return _profile; }
  uint32_t avgRunUs() const {
    return _profile.runs ? (uint32_t)(_profile.total_us / _profile.runs) : 0;
  }

  // Oldest-first access to recorded transitions
  size_t traceCount() const { return _trace_count; }
  const TraceEntry& traceAt(size_t i) const;

  // Logs the recorded transitions
  void logTrace() const;

  // Bookkeeping for round-robin among equal priorities (TaskList only)
  uint32_t lastRunSeq() const { return _last_run_seq; }
  void setLastRunSeq(uint32_t seq) { _last_run_seq = seq; }

private:
  void recordTransition_(uint32_t now_ms, uint8_t from, uint8_t to);

  TaskBody& _body;
  const char* _name;
  uint8_t _priority;

  Rate _rate;

  bool _profiling;
  bool _tracing;
  Profile _profile;

  uint8_t _state = 0;
  uint32_t _last_run_seq = 0;

  TraceEntry _trace[TASK_TRACE_LEN];
  size_t _trace_head = 0;
  size_t _trace_count = 0;
};
