#include "comms/Protocol.h"
#include <math.h>

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Notes:
  - Both directions use ArduinoJson; the same file builds for the board
    and for the host tool.
  - Decoders reject a frame as soon as a required field is missing or
    has the wrong type. Range checks live here too, so the tasks only
    ever see values they can apply directly.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Convert type string -> enum
static CommandType parseCommandType(const char* s) {
  if (!s) return CommandType::UNKNOWN;
  if (strcmp(s, "run") == 0)    return CommandType::RUN;
  if (strcmp(s, "stop") == 0)   return CommandType::STOP;
  if (strcmp(s, "status") == 0) return CommandType::STATUS;
  return CommandType::UNKNOWN;
}

static ReplyType parseReplyType(const char* s) {
  if (!s) return ReplyType::UNKNOWN;
  if (strcmp(s, "ack") == 0)       return ReplyType::ACK;
  if (strcmp(s, "sample") == 0)    return ReplyType::SAMPLE;
  if (strcmp(s, "end") == 0)       return ReplyType::END;
  if (strcmp(s, "heartbeat") == 0) return ReplyType::HEARTBEAT;
  if (strcmp(s, "log") == 0)       return ReplyType::LOG;
  return ReplyType::UNKNOWN;
}

// Serialize doc into buf if it fits (with terminator), else write nothing
static size_t finishLine(const JsonDocument& doc, char* buf, size_t cap) {
  if (!buf || cap == 0) return 0;

  if (measureJson(doc) + 1 > cap) {
    buf[0] = '\0';
    return 0;
  }
  return serializeJson(doc, buf, cap);
}

static void copyString(char* dst, size_t cap, const char* src) {
  if (!src) {
    dst[0] = '\0';
    return;
  }
  strncpy(dst, src, cap - 1);
  dst[cap - 1] = '\0';
}


namespace protocol {

/*=============================================================================
  ENCODE (Nucleo -> Laptop)
=============================================================================*/

size_t encodeAck(const AckFrame& a, char* buf, size_t cap) {
  StaticJsonDocument<192> doc;

  doc["type"] = "ack";
  doc["seq"] = a.seq;
  doc["ok"] = a.ok;
  if (a.error)
    doc["error"] = a.error;
  else
    doc["error"] = (const char*)nullptr;

  return finishLine(doc, buf, cap);
}

size_t encodeSample(const SampleFrame& s, char* buf, size_t cap) {
  StaticJsonDocument<192> doc;

  doc["type"] = "sample";
  doc["motor"] = s.motor;
  doc["t_ms"] = s.sample.t_ms;
  doc["pos"] = s.sample.position;

  return finishLine(doc, buf, cap);
}

size_t encodeEnd(const EndFrame& e, char* buf, size_t cap) {
  StaticJsonDocument<128> doc;

  doc["type"] = "end";
  doc["motor"] = e.motor;
  doc["count"] = e.count;

  return finishLine(doc, buf, cap);
}

size_t encodeHeartbeat(const HeartbeatFrame& h, char* buf, size_t cap) {
  StaticJsonDocument<128> doc;

  doc["type"] = "heartbeat";
  doc["time_ms"] = h.time_ms;
  doc["busy"] = h.busy;

  return finishLine(doc, buf, cap);
}

size_t encodeLog(const LogFrame& l, char* buf, size_t cap) {
  StaticJsonDocument<128> doc;

  doc["type"] = "log";
  doc["level"] = l.level ? l.level : "info";
  doc["msg"] = l.msg ? l.msg : "";

  return finishLine(doc, buf, cap);
}


/*=============================================================================
  DECODE (Laptop -> Nucleo)
=============================================================================*/

bool decodeCommandLine(const char* line, CommandFrame& out_cmd) {
  out_cmd = CommandFrame();   // reset everything
  if (!line) {
    out_cmd.error = "empty line";
    return false;
  }

  StaticJsonDocument<256> doc;

  if (deserializeJson(doc, line)) {
    out_cmd.error = "bad json";
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) {
    out_cmd.error = "not an object";
    return false;
  }

  // seq first, so every later failure can be ACKed
  JsonVariant seq = obj["seq"];
  if (!seq.is<uint32_t>()) {
    out_cmd.error = "seq missing";
    return false;
  }
  out_cmd.seq = seq.as<uint32_t>();
  out_cmd.has_seq = true;

  out_cmd.type = parseCommandType(obj["type"]);

  switch (out_cmd.type) {
    case CommandType::RUN: {
      JsonVariant kp = obj["kp"];
      if (!kp.is<float>()) {
        out_cmd.error = "kp missing";
        return false;
      }
      const float kp_val = kp.as<float>();
      if (!isfinite(kp_val) || kp_val <= 0.0f) {
        out_cmd.error = "kp must be > 0";
        return false;
      }

      JsonVariant period = obj["period_ms"];
      if (!period.is<long>()) {
        out_cmd.error = "period_ms missing";
        return false;
      }
      const long period_val = period.as<long>();
      if (period_val < (long)MIN_PERIOD_MS || period_val > (long)MAX_PERIOD_MS) {
        out_cmd.error = "period_ms out of range";
        return false;
      }

      out_cmd.kp = kp_val;
      out_cmd.period_ms = (uint32_t)period_val;
      break;
    }

    case CommandType::STOP:
    case CommandType::STATUS:
      break;

    case CommandType::UNKNOWN:
    default:
      out_cmd.error = "unknown type";
      return false;
  }

  out_cmd.valid = true;
  return true;
}


/*=============================================================================
  HOST SIDE
=============================================================================*/

size_t encodeRunCommand(uint32_t seq, float kp, uint32_t period_ms,
                        char* buf, size_t cap) {
  StaticJsonDocument<192> doc;

  doc["type"] = "run";
  doc["seq"] = seq;
  doc["kp"] = kp;
  doc["period_ms"] = period_ms;

  return finishLine(doc, buf, cap);
}

size_t encodeStopCommand(uint32_t seq, char* buf, size_t cap) {
  StaticJsonDocument<128> doc;

  doc["type"] = "stop";
  doc["seq"] = seq;

  return finishLine(doc, buf, cap);
}

size_t encodeStatusCommand(uint32_t seq, char* buf, size_t cap) {
  StaticJsonDocument<128> doc;

  doc["type"] = "status";
  doc["seq"] = seq;

  return finishLine(doc, buf, cap);
}

bool decodeReplyLine(const char* line, ReplyFrame& out) {
  out = ReplyFrame();
  if (!line) return false;

  // Log messages are copied into the document, so size for the longest
  StaticJsonDocument<256 + LOG_LINE_BYTES> doc;

  if (deserializeJson(doc, line)) return false;

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  const ReplyType type = parseReplyType(obj["type"]);

  switch (type) {
    case ReplyType::ACK:
      if (!obj["seq"].is<uint32_t>() || !obj["ok"].is<bool>()) return false;
      out.seq = obj["seq"].as<uint32_t>();
      out.ok = obj["ok"].as<bool>();
      copyString(out.error, sizeof(out.error), obj["error"].as<const char*>());
      break;

    case ReplyType::SAMPLE:
      if (!obj["motor"].is<uint8_t>() ||
          !obj["t_ms"].is<uint32_t>() ||
          !obj["pos"].is<int32_t>()) return false;
      out.motor = obj["motor"].as<uint8_t>();
      out.sample.t_ms = obj["t_ms"].as<uint32_t>();
      out.sample.position = obj["pos"].as<int32_t>();
      break;

    case ReplyType::END:
      if (!obj["motor"].is<uint8_t>() || !obj["count"].is<uint32_t>()) return false;
      out.motor = obj["motor"].as<uint8_t>();
      out.count = obj["count"].as<uint32_t>();
      break;

    case ReplyType::HEARTBEAT:
      if (!obj["time_ms"].is<uint32_t>()) return false;
      out.time_ms = obj["time_ms"].as<uint32_t>();
      out.busy = obj["busy"] | false;
      break;

    case ReplyType::LOG:
      if (!obj["msg"].is<const char*>()) return false;
      copyString(out.level, sizeof(out.level), obj["level"] | "info");
      copyString(out.msg, sizeof(out.msg), obj["msg"].as<const char*>());
      break;

    case ReplyType::UNKNOWN:
    default:
      return false;
  }

  out.type = type;
  return true;
}

}  // namespace protocol
