#pragma once

#include <stddef.h>
#include <stdint.h>

/*
===============================================================================
  LineBuffer.h
===============================================================================

  Accumulates bytes into newline-delimited frames.

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame (empty frames are skipped)
  - If a frame would overflow the buffer, enters "dropping" mode and
    discards bytes until the next '\n', so tail fragments are never
    mistaken for a frame

  The finished line returned after LINE stays valid until the next push().
===============================================================================
*/

template <size_t N>
class LineBuffer {
  static_assert(N >= 2, "LineBuffer needs room for one char and the terminator");

public:
  enum class Push : uint8_t {
    PENDING = 0,   // byte consumed, no complete frame yet
    LINE,          // line() holds a complete frame
    TOO_LONG,      // frame too long; now dropping until '\n'
  };

  Push push(char ch) {
    if (ch == '\r') return Push::PENDING;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _len = 0;
      }
      return Push::PENDING;
    }

    if (ch == '\n') {
      if (_len == 0) return Push::PENDING;

      _buf[_len] = '\0';
      _line_len = _len;
      if (_len > _max_len_seen) _max_len_seen = _len;
      _len = 0;
      return Push::LINE;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_len + 1 < N) {
      _buf[_len++] = ch;
      return Push::PENDING;
    }

    _buf[_len] = '\0';
    _dropping = true;
    _overflows++;
    return Push::TOO_LONG;
  }

  void reset() {
    _len = 0;
    _line_len = 0;
    _dropping = false;
    _buf[0] = '\0';
  }

  // After LINE: the frame. After TOO_LONG: the head that did fit.
  const char* line() const { return _buf; }
  size_t lineLength() const { return _line_len; }

  bool dropping() const { return _dropping; }
  uint32_t overflows() const { return _overflows; }
  size_t maxLenSeen() const { return _max_len_seen; }
  static constexpr size_t capacity() { return N; }

private:
  char _buf[N] = {};
  size_t _len = 0;
  size_t _line_len = 0;
  size_t _max_len_seen = 0;
  uint32_t _overflows = 0;
  bool _dropping = false;
};
