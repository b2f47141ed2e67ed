#pragma once

#include <stdint.h>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Small leveled logger shared by firmware and host code.

    - printf-style formatting into a fixed line buffer (no heap)
    - one registered sink (function + context) receives finished lines
    - a global threshold drops anything below it before formatting

  On the board the sink wraps each line in a {"type":"log"} frame on the
  serial link. On the host it goes to stderr.

  USAGE
  -----
    logSetSink(mySink, &ctx);
    LOG_INFO("run started kp=%.3f", kp);
===============================================================================
*/

enum class LogLevel : uint8_t {
  DBG = 0,
  INFO,
  WARN,
  ERR,
  OFF,
};

typedef void (*LogSinkFn)(LogLevel level, const char* msg, void* ctx);

// Replace the sink. Passing nullptr discards all output.
void logSetSink(LogSinkFn sink, void* ctx);

void logSetLevel(LogLevel level);
LogLevel logLevel();

bool logEnabled(LogLevel level);

// "debug", "info", "warn", "error"
const char* logLevelName(LogLevel level);

// Parses a name produced by logLevelName(). Returns false if unknown.
bool logLevelFromName(const char* name, LogLevel& out);

void logPrintf(LogLevel level, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

#define LOG_DEBUG(fmt, ...) \
  do { if (logEnabled(LogLevel::DBG)) logPrintf(LogLevel::DBG, fmt, ##__VA_ARGS__); } while (0)

#define LOG_INFO(fmt, ...) \
  do { if (logEnabled(LogLevel::INFO)) logPrintf(LogLevel::INFO, fmt, ##__VA_ARGS__); } while (0)

#define LOG_WARN(fmt, ...) \
  do { if (logEnabled(LogLevel::WARN)) logPrintf(LogLevel::WARN, fmt, ##__VA_ARGS__); } while (0)

#define LOG_ERROR(fmt, ...) \
  do { if (logEnabled(LogLevel::ERR)) logPrintf(LogLevel::ERR, fmt, ##__VA_ARGS__); } while (0)
