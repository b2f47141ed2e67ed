#pragma once

#include <stdint.h>

/*
  HostOptions

  Run parameters typed by the user. Anything that is not a usable number
  falls back to the firmware default with a warning, so a typo still
  produces a run instead of an error.
*/

// Positive finite gain, else DEFAULT_KP. Returns true if text was used.
bool parseKpOrDefault(const char* text, float& kp);

// Whole number in [MIN_PERIOD_MS, MAX_PERIOD_MS], else DEFAULT_PERIOD_MS.
// Returns true if text was used.
bool parsePeriodOrDefault(const char* text, uint32_t& period_ms);

// Whole positive number. Returns false and leaves out untouched otherwise.
bool parseUnsigned(const char* text, uint32_t& out);
