#include "actuators/BridgeOutput.h"

#include <math.h>  // fabsf

#include "Params.h"

float clampDutyPercent(float duty_pct) {
  if (duty_pct != duty_pct) return 0.0f;  // NaN
  if (duty_pct > DUTY_MAX_PCT) return DUTY_MAX_PCT;
  if (duty_pct < -DUTY_MAX_PCT) return -DUTY_MAX_PCT;
  return duty_pct;
}

BridgeOutput bridgeOutputFor(float duty_pct, uint8_t pwm_max) {
  BridgeOutput out;

  const float duty = clampDutyPercent(duty_pct);
  if (duty == 0.0f) return out;

  int pwm = (int)(fabsf(duty) * (float)pwm_max / DUTY_MAX_PCT + 0.5f);
  if (pwm > pwm_max) pwm = pwm_max;

  if (duty > 0.0f) {
    out.in1_pwm = (uint8_t)pwm;
  } else {
    out.in2_pwm = (uint8_t)pwm;
  }
  return out;
}
