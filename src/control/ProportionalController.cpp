#include "control/ProportionalController.h"

#include <math.h>  // isfinite

#include "Params.h"

ProportionalController::ProportionalController(float kp,
                                               int32_t setpoint,
                                               DutyActuator& actuator,
                                               PositionSensor& sensor)
: _kp(isValidKp(kp) ? kp : DEFAULT_KP),
  _setpoint(setpoint),
  _actuator(actuator),
  _sensor(sensor)
{
}

bool ProportionalController::isValidKp(float kp) {
  return isfinite(kp) && kp > 0.0f;
}

bool ProportionalController::setKp(float kp) {
  if (!isValidKp(kp)) return false;
  _kp = kp;
  return true;
}

float ProportionalController::run(int32_t setpoint) {
  _setpoint = setpoint;
  return update();
}

float ProportionalController::update() {
  const int32_t position = _sensor.read();

  // 64-bit difference so extreme counts cannot overflow
  const int64_t error = (int64_t)_setpoint - (int64_t)position;
  const float duty = _kp * (float)error;

  _actuator.setDutyPercent(duty);

  _last_position = position;
  _last_output = duty;
  return duty;
}
