#pragma once

#include <stdint.h>

#include "control/ControlIo.h"

/*
===============================================================================
  ProportionalController.h
===============================================================================

  PURPOSE
  -------
  Position loop with a single gain:

      duty = Kp * (setpoint - position)

  Each update reads the sensor once, computes the duty and sends it to the
  actuator. The controller does not clamp; the actuator saturates at
  +/-100 %, and the unclamped value is returned for logging.

  Usage:
    - construct once with the actuator and sensor it drives
    - call run(setpoint) or update() at a fixed period (scheduler task)
===============================================================================
*/

class ProportionalController {
public:
  /*
    kp       : gain in duty-percent per count; must be > 0
               (an invalid value is replaced by DEFAULT_KP)
    setpoint : target position in counts
  */
  ProportionalController(float kp,
                         int32_t setpoint,
                         DutyActuator& actuator,
                         PositionSensor& sensor);

  // Stores the setpoint and runs one update. Returns the computed duty.
  float run(int32_t setpoint);

  // One update toward the stored setpoint
  float update();

  // Gain must be a positive, finite number. Returns false and keeps the
  // previous gain otherwise.
  bool setKp(float kp);

  void setSetpoint(int32_t setpoint) { _setpoint = setpoint; }

  float kp() const { return _kp; }
  int32_t setpoint() const { return _setpoint; }

  // Values from the most recent update
  int32_t lastPosition() const { return _last_position; }
  float lastOutput() const { return _last_output; }

  static bool isValidKp(float kp);

private:
  float _kp;
  int32_t _setpoint;

  DutyActuator& _actuator;
  PositionSensor& _sensor;

  int32_t _last_position = 0;
  float _last_output = 0.0f;
};
