#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "actuators/BridgeOutput.h"
#include "comms/ByteStream.h"
#include "control/ControlIo.h"
#include "utils/Log.h"

// Scripted byte pipe: tests feed() what the other end sends and read back
// everything written in tx.
class FakeStream : public ByteStream {
public:
  void feed(const std::string& bytes) { rx += bytes; }

  int available() override { return (int)(rx.size() - rx_pos); }

  int read() override {
    if (rx_pos >= rx.size()) return -1;
    return (uint8_t)rx[rx_pos++];
  }

  size_t write(const uint8_t* data, size_t len) override {
    const size_t n = len < accept_limit ? len : accept_limit;
    tx.append((const char*)data, n);
    return n;
  }

  // Complete lines written so far, without the '\n'
  std::vector<std::string> txLines() const {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < tx.size(); i++) {
      if (tx[i] == '\n') {
        lines.push_back(tx.substr(start, i - start));
        start = i + 1;
      }
    }
    return lines;
  }

  std::string rx;
  size_t rx_pos = 0;
  std::string tx;

  // Bytes accepted per write() call
  size_t accept_limit = (size_t)-1;
};

// Motor + encoder stand-in: speed proportional to the clamped duty.
// advance() integrates position over elapsed milliseconds.
class FakePlant : public DutyActuator, public PositionSensor {
public:
  explicit FakePlant(double counts_per_ms_per_pct = 1.0)
  : _gain(counts_per_ms_per_pct) {}

  void setDutyPercent(float duty_pct) override {
    duty = clampDutyPercent(duty_pct);
    duty_writes++;
  }

  int32_t read() override { return (int32_t)(position - offset); }

  void zero() override {
    offset = position;
    zeros++;
  }

  void advance(uint32_t dt_ms) { position += duty * _gain * (double)dt_ms; }

  void setPosition(double counts) {
    position = counts;
    offset = 0.0;
  }

  float duty = 0.0f;
  double position = 0.0;
  double offset = 0.0;
  uint32_t duty_writes = 0;
  uint32_t zeros = 0;

private:
  double _gain;
};

// Routes the logger into a vector for the lifetime of the object
class LogCapture {
public:
  struct Entry {
    LogLevel level;
    std::string msg;
  };

  explicit LogCapture(LogLevel level = LogLevel::DBG) {
    logSetSink(&LogCapture::sink, this);
    logSetLevel(level);
  }

  ~LogCapture() {
    logSetSink(nullptr, nullptr);
    logSetLevel(LogLevel::INFO);
  }

  bool contains(const std::string& text) const {
    for (size_t i = 0; i < entries.size(); i++) {
      if (entries[i].msg.find(text) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<Entry> entries;

private:
  static void sink(LogLevel level, const char* msg, void* ctx) {
    LogCapture* self = static_cast<LogCapture*>(ctx);
    Entry e;
    e.level = level;
    e.msg = msg;
    self->entries.push_back(e);
  }
};
