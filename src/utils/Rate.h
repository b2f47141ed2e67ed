#pragma once

#include <stdint.h>

/*
  Rate

  Fixed-period activation timer driven by an external millisecond clock.
  Due times advance by exactly one period from the previous due time, so a
  task that runs a little late does not push its whole schedule back. If a
  caller falls more than a full period behind, the schedule restarts from
  now and the miss is counted.
*/
class Rate {
public:
  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // True when it's time to run. Does not consume the activation.
  bool due(uint32_t now_ms) const {
    if (!_initialized) return true;

    // Safe with millis() rollover because of signed subtraction trick
    return (int32_t)(now_ms - _next_ms) >= 0;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    if ((int32_t)(now_ms - _next_ms) < 0) {
      return false;
    }

    _next_ms += _period_ms;
    if ((int32_t)(now_ms - _next_ms) > 0) {
      // Missed more than one whole period; resync instead of bursting
      _late++;
      _next_ms = now_ms + _period_ms;
    }
    return true;
  }

  // Next ready() call runs immediately.
  void restart() { _initialized = false; }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t nextMs() const { return _next_ms; }
  uint32_t lateCount() const { return _late; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  uint32_t _late = 0;
  bool _initialized = false;
};
