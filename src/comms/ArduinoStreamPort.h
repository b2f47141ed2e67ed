#pragma once
#include <Arduino.h>

#include "comms/ByteStream.h"

/*
  ArduinoStreamPort

  Adapts an Arduino Stream (normally the USB Serial) to ByteStream.
  write() behaves like Print::write: it waits for TX buffer space, so keep
  lines short and few per tick.
*/
class ArduinoStreamPort : public ByteStream {
public:
  explicit ArduinoStreamPort(Stream& serial) : _serial(serial) {}

  int available() override { return _serial.available(); }

  int read() override { return _serial.read(); }

  size_t write(const uint8_t* data, size_t len) override {
    return _serial.write(data, len);
  }

private:
  Stream& _serial;
};
