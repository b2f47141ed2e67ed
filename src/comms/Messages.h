#pragma once

#include <math.h>
#include <stdint.h>

#include "Params.h"

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines command and reply data structures exchanged between the host
  tool and the Nucleo over newline-delimited JSON.

  Laptop -> Nucleo:
    {"type":"run","seq":N,"kp":F,"period_ms":I}
    {"type":"stop","seq":N}
    {"type":"status","seq":N}

  Nucleo -> Laptop:
    {"type":"ack","seq":N,"ok":B,"error":S|null}
    {"type":"sample","motor":M,"t_ms":T,"pos":P}
    {"type":"end","motor":M,"count":C}
    {"type":"heartbeat","time_ms":T,"busy":B}
    {"type":"log","level":S,"msg":S}

  Notes:
  - Error strings point at string literals owned by Protocol.cpp.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Laptop -> Nucleo)
=============================================================================*/

enum class CommandType : uint8_t {
  UNKNOWN = 0,
  RUN,
  STOP,
  STATUS,
};

// Full command frame
struct CommandFrame {
  CommandType type = CommandType::UNKNOWN;

  uint32_t seq = 0;
  bool has_seq = false;     // seq parsed, so a failure can still be ACKed

  // RUN only
  float kp = DEFAULT_KP;
  uint32_t period_ms = DEFAULT_PERIOD_MS;

  bool valid = false;          // set true after successful decode
  const char* error = nullptr; // reason when !valid
};


/*=============================================================================
  REPLY STRUCTURES (Nucleo -> Laptop)
=============================================================================*/

struct AckFrame {
  uint32_t seq = 0;
  bool ok = true;
  const char* error = nullptr;
};

// One step-response data point
struct Sample {
  uint32_t t_ms = 0;       // time since the step started
  int32_t position = 0;    // encoder counts
};

struct SampleFrame {
  uint8_t motor = 0;
  Sample sample;
};

// Terminates one motor's data set
struct EndFrame {
  uint8_t motor = 0;
  uint32_t count = 0;
};

struct HeartbeatFrame {
  uint32_t time_ms = 0;
  bool busy = false;
};

struct LogFrame {
  const char* level = nullptr;
  const char* msg = nullptr;
};


/*=============================================================================
  HOST-SIDE DECODED REPLY
=============================================================================*/

enum class ReplyType : uint8_t {
  UNKNOWN = 0,
  ACK,
  SAMPLE,
  END,
  HEARTBEAT,
  LOG,
};

// Strings are copied out of the parse buffer
struct ReplyFrame {
  ReplyType type = ReplyType::UNKNOWN;

  // ACK
  uint32_t seq = 0;
  bool ok = false;
  char error[48] = {};

  // SAMPLE / END
  uint8_t motor = 0;
  Sample sample;
  uint32_t count = 0;

  // HEARTBEAT
  uint32_t time_ms = 0;
  bool busy = false;

  // LOG
  char level[8] = {};
  char msg[LOG_LINE_BYTES] = {};
};
