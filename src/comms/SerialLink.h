#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "comms/ByteStream.h"
#include "comms/LineBuffer.h"
#include "comms/Messages.h"
#include "sched/Queue.h"
#include "utils/Log.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Nucleo-side serial link handler:

    - Non-blocking read from a ByteStream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode command frames and queue them for the comms task
    - Encode and write reply frames (ack, sample, end, heartbeat, log)

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

  Frames that fail to decode but carry a readable seq are still queued
  (valid == false) so the comms task can NACK them.
===============================================================================
*/

class SerialLink {
public:
  explicit SerialLink(ByteStream& stream);

  void begin();

  // Call frequently. Reads any available bytes and decodes complete lines.
  // Never blocks waiting for input.
  void tick(uint32_t now_ms);

  // Pops the oldest decoded command. Returns false if none is waiting.
  bool takeCommand(CommandFrame& out);
  bool hasCommand() const { return _commands.any(); }

  // Each send writes one full line. Returns false if encoding failed or the
  // stream did not accept the whole line.
  bool sendAck(uint32_t seq, bool ok, const char* error = nullptr);
  bool sendSample(uint8_t motor, const Sample& sample);
  bool sendEnd(uint8_t motor, uint32_t count);
  bool sendHeartbeat(uint32_t now_ms, bool busy);
  bool sendLog(LogLevel level, const char* msg);

  // Log sink that forwards to sendLog(); ctx must be a SerialLink*
  static void logSink(LogLevel level, const char* msg, void* ctx);

  // Short RX debug note (valid for a while after the event)
  const char* debugNote(uint32_t now_ms) const {
    return (now_ms <= _note_until_ms) ? _note_buf : nullptr;
  }

  // RX / TX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _rx.overflows(); }
  uint32_t rxDropped() const { return _commands.overflows(); }
  size_t rxMaxLenSeen() const { return _rx.maxLenSeen(); }
  uint32_t txFail() const { return _tx_fail; }

  // Logs the counters above
  void logStats() const;

private:
  void handleLine_(uint32_t now_ms);
  bool writeLine_(size_t len);
  void note_(uint32_t now_ms, const char* fmt, ...)
      __attribute__((format(printf, 3, 4)));

  ByteStream& _stream;

  LineBuffer<SERIAL_LINE_BUFFER_BYTES> _rx;
  Queue<CommandFrame, COMMAND_QUEUE_LEN> _commands;

  char _tx_buf[TELEMETRY_BUFFER_BYTES];

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _tx_fail = 0;

  // Debug note buffer
  char _note_buf[96];
  uint32_t _note_until_ms = 0;
};
