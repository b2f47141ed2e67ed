#pragma once

#include <stdint.h>

/*
===============================================================================
  BridgeOutput.h
===============================================================================

  L6206 truth table (bridge enabled):
    - IN1=0,   IN2=0   -> Stop (both low-side on)
    - IN1=PWM, IN2=0   -> Forward
    - IN1=0,   IN2=PWM -> Reverse

  bridgeOutputFor() turns a signed duty in percent into the two PWM levels.
  It is kept free of Arduino calls so the mapping can be checked on a PC.
===============================================================================
*/

struct BridgeOutput {
  uint8_t in1_pwm = 0;
  uint8_t in2_pwm = 0;
};

// Clamps to [-100, 100]. NaN maps to 0.
float clampDutyPercent(float duty_pct);

// pwm_max is the analogWrite() value for 100 %.
BridgeOutput bridgeOutputFor(float duty_pct, uint8_t pwm_max);
