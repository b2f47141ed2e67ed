#pragma once

#include <stddef.h>
#include <stdint.h>

#include "comms/ByteStream.h"

/*
===============================================================================
  PosixSerialPort.h
===============================================================================

  PURPOSE
  -------
  Laptop-side end of the USB serial link, as a ByteStream, so the host tool
  frames and parses lines with the same code the board uses.

  The port is opened in raw 8N1 mode, non-blocking. read() never waits;
  write() retries until the whole buffer is out or the port errors.

  The descriptor is closed when the object goes away.
===============================================================================
*/

class PosixSerialPort : public ByteStream {
public:
  PosixSerialPort() {}
  ~PosixSerialPort() override;

  // Opens and configures the port. Returns false (and logs why) on failure.
  bool open(const char* path, uint32_t baud);
  void close();

  bool isOpen() const { return _fd >= 0; }

  // Discards anything the board sent before we started listening
  void flushInput();

  int available() override;
  int read() override;
  size_t write(const uint8_t* data, size_t len) override;

private:
  PosixSerialPort(const PosixSerialPort&) = delete;
  PosixSerialPort& operator=(const PosixSerialPort&) = delete;

  int _fd = -1;
};
