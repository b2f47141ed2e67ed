#pragma once

#include <stdint.h>

/*
===============================================================================
  ControlIo.h
===============================================================================

  Interfaces between a controller and the hardware it closes the loop on.

    DutyActuator   : anything taking a signed duty in percent (-100 .. 100)
    PositionSensor : anything reporting a signed position in counts

  The motor and encoder drivers implement these on the board; host tests
  implement them with a simulated plant.
===============================================================================
*/

class DutyActuator {
public:
  virtual ~DutyActuator() {}

  // Out-of-range values are clamped by the implementation.
  virtual void setDutyPercent(float duty_pct) = 0;
};

class PositionSensor {
public:
  virtual ~PositionSensor() {}

  virtual int32_t read() = 0;

  // Redefines the current position as 0
  virtual void zero() = 0;
};
