#include "utils/Log.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "Params.h"

/*
  Log.cpp

  Single global sink. Everything runs from the cooperative loop, so the
  shared line buffer is never written by two callers at once.
*/

static LogSinkFn s_sink = nullptr;
static void* s_sink_ctx = nullptr;
static LogLevel s_level = ENABLE_SERIAL_DEBUG ? LogLevel::DBG : LogLevel::INFO;
static char s_line[LOG_LINE_BYTES];

void logSetSink(LogSinkFn sink, void* ctx) {
  s_sink = sink;
  s_sink_ctx = ctx;
}

void logSetLevel(LogLevel level) {
  s_level = level;
}

LogLevel logLevel() {
  return s_level;
}

bool logEnabled(LogLevel level) {
  if (level == LogLevel::OFF) return false;
  return s_sink != nullptr && (uint8_t)level >= (uint8_t)s_level;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DBG:  return "debug";
    case LogLevel::INFO: return "info";
    case LogLevel::WARN: return "warn";
    case LogLevel::ERR:  return "error";
    case LogLevel::OFF:  return "off";
  }
  return "?";
}

bool logLevelFromName(const char* name, LogLevel& out) {
  if (!name) return false;
  if (strcmp(name, "debug") == 0) { out = LogLevel::DBG;  return true; }
  if (strcmp(name, "info") == 0)  { out = LogLevel::INFO; return true; }
  if (strcmp(name, "warn") == 0)  { out = LogLevel::WARN; return true; }
  if (strcmp(name, "error") == 0) { out = LogLevel::ERR;  return true; }
  if (strcmp(name, "off") == 0)   { out = LogLevel::OFF;  return true; }
  return false;
}

void logPrintf(LogLevel level, const char* fmt, ...) {
  if (!logEnabled(level)) return;

  va_list args;
  va_start(args, fmt);
  vsnprintf(s_line, sizeof(s_line), fmt, args);
  va_end(args);

  s_sink(level, s_line, s_sink_ctx);
}
