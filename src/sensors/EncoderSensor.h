#pragma once
#include <Arduino.h>
#include <Encoder.h>  // Paul Stoffregen Encoder library

#include "control/ControlIo.h"

/*
===============================================================================
  EncoderSensor.h
===============================================================================

  PURPOSE
  -------
  Wrapper around the Encoder library that provides the signed count the
  position controller closes its loop on.

  USAGE
  -----
  - Call begin() once in setup()
  - read() any time; zero() before each step response
===============================================================================
*/

class EncoderSensor : public PositionSensor {
public:
  /*
    pin_a / pin_b:
      Quadrature encoder channels A and B

    invert_direction:
      Set true if forward motor duty reads as negative count
  */
  EncoderSensor(uint8_t pin_a,
                uint8_t pin_b,
                bool invert_direction = false);

  void begin();

  int32_t read() override;
  void zero() override;

private:
  int32_t applySign_(int32_t raw_count) const;

  Encoder _enc;
  bool _invert_direction;
};
