#include "comms/SerialLink.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "comms/Protocol.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Line framing (CR ignored, LF ends a frame, overflow resync) is done by
    LineBuffer
  - Decoded commands go into a small queue; if the comms task falls behind
    and the queue fills, the newest command is dropped and counted
===============================================================================
*/

SerialLink::SerialLink(ByteStream& stream)
: _stream(stream),
  _commands("CMD_QUEUE")
{
  memset(_tx_buf, 0, sizeof(_tx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
}

void SerialLink::begin() {
  _rx.reset();
  _commands.clear();

  _lines = _ok = _fail = _tx_fail = 0;

  memset(_note_buf, 0, sizeof(_note_buf));
  _note_until_ms = 0;
  note_(0, "BOOT RX_BUF_SIZE=%u", (unsigned)SERIAL_LINE_BUFFER_BYTES);
}

void SerialLink::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + 1500;
}

void SerialLink::tick(uint32_t now_ms) {
  while (_stream.available() > 0) {
    int c = _stream.read();
    if (c < 0) break;

    switch (_rx.push((char)c)) {
      case LineBuffer<SERIAL_LINE_BUFFER_BYTES>::Push::LINE:
        _lines++;
        handleLine_(now_ms);
        break;

      case LineBuffer<SERIAL_LINE_BUFFER_BYTES>::Push::TOO_LONG:
        // line() holds the head of the frame, which is useful
        note_(now_ms,
              "RX OVF lines=%lu ok=%lu fail=%lu ovf=%lu head=%.24s",
              (unsigned long)_lines,
              (unsigned long)_ok,
              (unsigned long)_fail,
              (unsigned long)_rx.overflows(),
              _rx.line());
        LOG_WARN("rx line too long, dropping until newline");
        break;

      case LineBuffer<SERIAL_LINE_BUFFER_BYTES>::Push::PENDING:
      default:
        break;
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  CommandFrame cmd;
  if (protocol::decodeCommandLine(_rx.line(), cmd)) {
    _ok++;
    note_(now_ms, "RX OK seq=%lu len=%u",
          (unsigned long)cmd.seq,
          (unsigned)_rx.lineLength());
  } else {
    _fail++;

    // Show head + reason so we can tell if schema/JSON is weird
    note_(now_ms,
          "RX FAIL (%s) lines=%lu ok=%lu fail=%lu head=%.24s",
          cmd.error ? cmd.error : "?",
          (unsigned long)_lines,
          (unsigned long)_ok,
          (unsigned long)_fail,
          _rx.line());
    LOG_DEBUG("rx reject: %s", cmd.error ? cmd.error : "?");

    // Nothing to answer without a seq
    if (!cmd.has_seq) return;
  }

  if (!_commands.put(cmd)) {
    LOG_WARN("command queue full, dropped seq=%lu", (unsigned long)cmd.seq);
  }
}

bool SerialLink::takeCommand(CommandFrame& out) {
  return _commands.get(out);
}

bool SerialLink::writeLine_(size_t len) {
  if (len == 0 || len + 1 >= sizeof(_tx_buf)) {
    _tx_fail++;
    return false;
  }

  _tx_buf[len] = '\n';
  const size_t written = _stream.write((const uint8_t*)_tx_buf, len + 1);
  if (written != len + 1) {
    _tx_fail++;
    return false;
  }
  return true;
}

bool SerialLink::sendAck(uint32_t seq, bool ok, const char* error) {
  AckFrame a;
  a.seq = seq;
  a.ok = ok;
  a.error = error;
  // Leave a byte for the newline
  return writeLine_(protocol::encodeAck(a, _tx_buf, sizeof(_tx_buf) - 1));
}

bool SerialLink::sendSample(uint8_t motor, const Sample& sample) {
  SampleFrame s;
  s.motor = motor;
  s.sample = sample;
  return writeLine_(protocol::encodeSample(s, _tx_buf, sizeof(_tx_buf) - 1));
}

bool SerialLink::sendEnd(uint8_t motor, uint32_t count) {
  EndFrame e;
  e.motor = motor;
  e.count = count;
  return writeLine_(protocol::encodeEnd(e, _tx_buf, sizeof(_tx_buf) - 1));
}

bool SerialLink::sendHeartbeat(uint32_t now_ms, bool busy) {
  HeartbeatFrame h;
  h.time_ms = now_ms;
  h.busy = busy;
  return writeLine_(protocol::encodeHeartbeat(h, _tx_buf, sizeof(_tx_buf) - 1));
}

bool SerialLink::sendLog(LogLevel level, const char* msg) {
  LogFrame l;
  l.level = logLevelName(level);
  l.msg = msg;
  return writeLine_(protocol::encodeLog(l, _tx_buf, sizeof(_tx_buf) - 1));
}

void SerialLink::logSink(LogLevel level, const char* msg, void* ctx) {
  SerialLink* link = static_cast<SerialLink*>(ctx);
  if (link) link->sendLog(level, msg);
}

void SerialLink::logStats() const {
  LOG_INFO("link rx lines=%lu ok=%lu fail=%lu ovf=%lu dropped=%lu max_len=%u tx_fail=%lu",
           (unsigned long)_lines,
           (unsigned long)_ok,
           (unsigned long)_fail,
           (unsigned long)_rx.overflows(),
           (unsigned long)_commands.overflows(),
           (unsigned)_rx.maxLenSeen(),
           (unsigned long)_tx_fail);
}
