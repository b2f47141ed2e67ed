#pragma once
#include <Arduino.h>

#include "actuators/BridgeOutput.h"
#include "control/ControlIo.h"

/*
===============================================================================
  L6206Motor.h
===============================================================================

  PURPOSE
  -------
  Thin hardware wrapper for one brushed DC motor on one L6206 bridge.

  Wiring (see Pins.h):
    - EN  = bridge enable GPIO
    - IN1 = PWM GPIO, drives forward
    - IN2 = PWM GPIO, drives reverse

  Responsibilities:
    - Initialize bridge pins and leave the motor stopped
    - Accept signed duty in percent [-100, +100]
    - Be the only code that writes this bridge's pins

  Notes:
    - This class does NOT do closed-loop control.
===============================================================================
*/

class L6206Motor : public DutyActuator {
public:
  /*
    invert:
      If true, flips sign of commanded duty
      (useful when motor leads are swapped relative to the encoder)
  */
  L6206Motor(uint32_t pin_en,
             uint32_t pin_in1,
             uint32_t pin_in2,
             bool invert = false,
             uint8_t pwm_max = 255);

  // Configure GPIO, enable the bridge, force stopped state.
  void begin();

  /*
    Set duty in percent.
      -100 = full reverse
         0 = stop
      +100 = full forward
  */
  void setDutyPercent(float duty_pct) override;

  // Both inputs low
  void stop();

  // Disconnects the bridge entirely (motor coasts, EN low)
  void disable();

  // Debug/introspection
  float dutyCmd() const { return _duty_cmd; }
  bool enabled() const { return _enabled; }

private:
  void write_(const BridgeOutput& out);

  uint32_t _pin_en;
  uint32_t _pin_in1;
  uint32_t _pin_in2;

  bool _invert;
  uint8_t _pwm_max;

  bool _enabled = false;

  // Last command value (for telemetry/debug)
  float _duty_cmd = 0.0f;
};
