#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "comms/ByteStream.h"
#include "comms/LineBuffer.h"
#include "comms/Messages.h"

/*
===============================================================================
  StepClient.h
===============================================================================

  PURPOSE
  -------
  Laptop side of one step-response run:

    1. send {"type":"run","seq":N,"kp":..,"period_ms":..}
    2. wait for the matching ack (a NACK ends the run with its error)
    3. collect "sample" lines for the requested motor until its "end" line

  Board log lines are relayed to the local logger. Heartbeats are noted.
  Anything that is not a protocol frame is logged and discarded.

  Time comes from an injected millisecond clock, and idle() is called
  whenever a poll found nothing to read, so the same code runs against a
  real port (idle sleeps) or a scripted stream in tests.
===============================================================================
*/

class StepClient {
public:
  typedef uint32_t (*ClockFn)();
  typedef void (*IdleFn)();

  StepClient(ByteStream& port, ClockFn now_ms, IdleFn idle = nullptr);

  // Runs one step response and fills out with the reported motor's data.
  // timeout_ms bounds the wait for the ack, and the quiet time allowed
  // after the run's expected length (STEP_SAMPLES * period_ms) and between
  // lines while data streams.
  // Returns false on NACK, write failure or timeout; see lastError().
  bool runStep(float kp,
               uint32_t period_ms,
               uint8_t motor,
               uint32_t timeout_ms,
               std::vector<Sample>& out);

  // Sends stop and waits for its ack
  bool stop(uint32_t timeout_ms);

  // Sends status, waits for its ack, then relays board log lines for
  // linger_ms more
  bool status(uint32_t timeout_ms, uint32_t linger_ms);

  const char* lastError() const { return _error; }

  uint32_t heartbeats() const { return _heartbeats; }
  uint32_t discardedLines() const { return _discarded; }
  bool boardBusy() const { return _board_busy; }

private:
  enum class Poll : uint8_t {
    NONE = 0,     // nothing complete yet
    FRAME,        // _reply holds a protocol frame
    OTHER,        // a line was read and handled internally
  };

  // Reads available bytes until one line completes or input runs out
  Poll poll_();

  bool sendLine_(size_t len);
  bool waitAck_(uint32_t seq, uint32_t deadline_ms);
  void relayLog_(const ReplyFrame& r);
  void setError_(const char* msg);

  bool expired_(uint32_t deadline_ms) const;

  ByteStream& _port;
  ClockFn _now_ms;
  IdleFn _idle;

  LineBuffer<256> _rx;
  ReplyFrame _reply;

  char _tx_buf[128];
  char _error[48];

  uint32_t _next_seq = 1;

  uint32_t _heartbeats = 0;
  uint32_t _discarded = 0;
  bool _board_busy = false;
};
