#pragma once

#include <stddef.h>
#include <stdint.h>

/*
  ByteStream

  Minimal non-blocking byte pipe the serial link runs on. It mirrors the
  parts of Arduino's Stream that SerialLink uses, so the same link code
  runs over the board's USB serial, a POSIX tty, or a test buffer.
*/
class ByteStream {
public:
  virtual ~ByteStream() {}

  // Bytes ready to read without blocking
  virtual int available() = 0;

  // Next byte, or -1 if none is ready
  virtual int read() = 0;

  // Returns how many bytes were accepted
  virtual size_t write(const uint8_t* data, size_t len) = 0;
};
