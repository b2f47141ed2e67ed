#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "sched/Task.h"

/*
===============================================================================
  TaskList.h
===============================================================================

  PURPOSE
  -------
  Cooperative scheduler over a fixed set of Tasks.

  Tasks are kept sorted by descending priority. The main loop calls one of
  the schedulers as often as it can with the current millisecond time:

    priSched(now) : run the highest-priority task that is due (one task per
                    call). Tasks of equal priority take turns.
    rrSched(now)  : run every due task once, in list order.

  Nothing here preempts anything: a task that takes too long delays all
  others, which shows up as late activations in report().
===============================================================================
*/

class TaskList {
public:
  typedef uint32_t (*MicrosFn)();

  // clock_us is used for task profiling; nullptr disables timing.
  explicit TaskList(MicrosFn clock_us = nullptr);

  // Adds a task in priority order. Returns false if the list is full
  // or the task is already present.
  bool append(Task& task);

  // Runs at most one task. Returns the task that ran, or nullptr.
  Task* priSched(uint32_t now_ms);

  // Runs every due task once. Returns how many ran.
  size_t rrSched(uint32_t now_ms);

  size_t size() const { return _count; }
  Task* at(size_t i) const { return i < _count ? _tasks[i] : nullptr; }

  // Logs one line per task: priority, period, runs, timing, lateness
  void report() const;

private:
  MicrosFn _clock_us;

  Task* _tasks[MAX_TASKS];
  size_t _count = 0;

  // Increments every time a task runs; used for round-robin fairness
  uint32_t _run_seq = 0;
};
