#include "sensors/EncoderSensor.h"

/*
===============================================================================
  EncoderSensor.cpp
===============================================================================

  The Encoder library decodes both channels in its pin interrupts and keeps
  a signed 32-bit count. Reads are atomic inside the library.
===============================================================================
*/

EncoderSensor::EncoderSensor(uint8_t pin_a,
                             uint8_t pin_b,
                             bool invert_direction)
: _enc(pin_a, pin_b),
  _invert_direction(invert_direction)
{
}

void EncoderSensor::begin() {
  _enc.write(0);
}

int32_t EncoderSensor::applySign_(int32_t raw_count) const {
  if (_invert_direction) {
    return -raw_count;
  }
  return raw_count;
}

int32_t EncoderSensor::read() {
  int32_t raw = (int32_t)_enc.read();
  return applySign_(raw);
}

void EncoderSensor::zero() {
  _enc.write(0);
}
