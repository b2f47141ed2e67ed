#include "HostOptions.h"

#include <errno.h>
#include <stdlib.h>

#include "Params.h"
#include "control/ProportionalController.h"
#include "utils/Log.h"

bool parseKpOrDefault(const char* text, float& kp) {
  kp = DEFAULT_KP;
  if (!text || !*text) return false;

  char* end = nullptr;
  errno = 0;
  const float v = strtof(text, &end);

  if (errno != 0 || end == text || *end != '\0' ||
      !ProportionalController::isValidKp(v)) {
    LOG_WARN("kp '%s' is not a positive number, using %.4f",
             text, (double)DEFAULT_KP);
    return false;
  }

  kp = v;
  return true;
}

bool parsePeriodOrDefault(const char* text, uint32_t& period_ms) {
  period_ms = DEFAULT_PERIOD_MS;
  if (!text || !*text) return false;

  char* end = nullptr;
  errno = 0;
  const long v = strtol(text, &end, 10);

  if (errno != 0 || end == text || *end != '\0' ||
      v < (long)MIN_PERIOD_MS || v > (long)MAX_PERIOD_MS) {
    LOG_WARN("period '%s' is not a whole number in [%lu, %lu], using %lu ms",
             text,
             (unsigned long)MIN_PERIOD_MS,
             (unsigned long)MAX_PERIOD_MS,
             (unsigned long)DEFAULT_PERIOD_MS);
    return false;
  }

  period_ms = (uint32_t)v;
  return true;
}

bool parseUnsigned(const char* text, uint32_t& out) {
  if (!text || !*text || *text == '-') return false;

  char* end = nullptr;
  errno = 0;
  const unsigned long v = strtoul(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v == 0 || v > 0xFFFFFFFFUL) {
    return false;
  }

  out = (uint32_t)v;
  return true;
}
