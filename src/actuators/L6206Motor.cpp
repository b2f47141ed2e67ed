#include "actuators/L6206Motor.h"

/*
===============================================================================
  L6206Motor.cpp
===============================================================================

  This implementation maps:
    duty > 0  -> IN1 PWM, IN2 LOW
    duty < 0  -> IN1 LOW, IN2 PWM
    duty = 0  -> stop()
  The duty -> PWM math lives in BridgeOutput.cpp.
===============================================================================
*/

L6206Motor::L6206Motor(uint32_t pin_en,
                       uint32_t pin_in1,
                       uint32_t pin_in2,
                       bool invert,
                       uint8_t pwm_max)
: _pin_en(pin_en),
  _pin_in1(pin_in1),
  _pin_in2(pin_in2),
  _invert(invert),
  _pwm_max(pwm_max == 0 ? 255 : pwm_max)
{
}

void L6206Motor::begin() {
  pinMode(_pin_en, OUTPUT);
  pinMode(_pin_in1, OUTPUT);
  pinMode(_pin_in2, OUTPUT);

  // Safe default state at startup
  stop();

  digitalWrite(_pin_en, HIGH);
  _enabled = true;
}

void L6206Motor::setDutyPercent(float duty_pct) {
  float duty = clampDutyPercent(duty_pct);
  if (_invert) duty = -duty;

  _duty_cmd = duty;
  write_(bridgeOutputFor(duty, _pwm_max));
}

void L6206Motor::stop() {
  _duty_cmd = 0.0f;
  write_(BridgeOutput());
}

void L6206Motor::disable() {
  stop();
  digitalWrite(_pin_en, LOW);
  _enabled = false;
}

void L6206Motor::write_(const BridgeOutput& out) {
  analogWrite(_pin_in1, out.in1_pwm);
  analogWrite(_pin_in2, out.in2_pwm);
}
