#include "sched/Task.h"

#include "utils/Log.h"

Task::Task(TaskBody& body,
           const char* name,
           uint8_t priority,
           uint32_t period_ms,
           bool profile,
           bool trace)
: _body(body),
  _name(name ? name : "?"),
  _priority(priority),
  _profiling(profile),
  _tracing(trace)
{
  _rate.setPeriodMs(period_ms);
}

bool Task::setPeriodMs(uint32_t period_ms) {
  if (period_ms == 0) return false;
  _rate.setPeriodMs(period_ms);
  return true;
}

bool Task::run(uint32_t now_ms, uint32_t (*clock_us)()) {
  if (!_rate.ready(now_ms)) return false;

  const bool timed = _profiling && clock_us != nullptr;
  const uint32_t start_us = timed ? clock_us() : 0;

  const uint8_t prev = _state;
  _state = _body.step(now_ms);

  if (timed) {
    const uint32_t dt_us = clock_us() - start_us;
    _profile.total_us += dt_us;
    if (dt_us > _profile.max_us) _profile.max_us = dt_us;
  }
  _profile.runs++;

  if (_tracing && _state != prev) {
    recordTransition_(now_ms, prev, _state);
  }
  return true;
}

void Task::recordTransition_(uint32_t now_ms, uint8_t from, uint8_t to) {
  TraceEntry& e = _trace[(_trace_head + _trace_count) % TASK_TRACE_LEN];
  e.time_ms = now_ms;
  e.from_state = from;
  e.to_state = to;

  if (_trace_count < TASK_TRACE_LEN) {
    _trace_count++;
  } else {
    // Ring is full: the slot just written was the oldest one
    _trace_head = (_trace_head + 1) % TASK_TRACE_LEN;
  }
}

const Task::TraceEntry& Task::traceAt(size_t i) const {
  return _trace[(_trace_head + i) % TASK_TRACE_LEN];
}

void Task::logTrace() const {
  if (!_tracing) {
    LOG_INFO("%s: trace off", _name);
    return;
  }

  LOG_INFO("%s: %u transitions", _name, (unsigned)_trace_count);
  for (size_t i = 0; i < _trace_count; i++) {
    const TraceEntry& e = traceAt(i);
    LOG_INFO("  %lu ms: %u -> %u",
             (unsigned long)e.time_ms,
             (unsigned)e.from_state,
             (unsigned)e.to_state);
  }
}
