#pragma once

#include <stdio.h>

#include "sched/SharedItem.h"

/*
===============================================================================
  Queue.h
===============================================================================

  PURPOSE
  -------
  Named fixed-capacity FIFO for passing a stream of items between tasks.
  Storage is a static ring buffer of N items; nothing is allocated.

  When full:
    - default        put() refuses the new item and returns false
    - overwrite mode put() drops the oldest item and keeps the new one
  Both cases count as an overflow.
===============================================================================
*/

template <typename T, size_t N>
class Queue : public SharedItem {
  static_assert(N > 0, "Queue capacity must be nonzero");

public:
  explicit Queue(const char* name, bool overwrite = false)
  : SharedItem(name), _overwrite(overwrite) {}

  bool put(const T& item) {
    if (_count == N) {
      _overflows++;
      if (!_overwrite) return false;

      _head = (_head + 1) % N;
      _count--;
    }

    _buf[(_head + _count) % N] = item;
    _count++;
    if (_count > _max_fill) _max_fill = _count;
    return true;
  }

  // Removes the oldest item. Returns false if empty (out untouched).
  bool get(T& out) {
    if (_count == 0) return false;

    out = _buf[_head];
    _head = (_head + 1) % N;
    _count--;
    return true;
  }

  bool peek(T& out) const {
    if (_count == 0) return false;
    out = _buf[_head];
    return true;
  }

  void clear() {
    _head = 0;
    _count = 0;
  }

  bool any() const { return _count > 0; }
  bool full() const { return _count == N; }
  size_t available() const { return _count; }
  static constexpr size_t capacity() { return N; }

  uint32_t overflows() const { return _overflows; }
  size_t maxFill() const { return _max_fill; }

  void describe(char* buf, size_t cap) const override {
    snprintf(buf, cap, "Queue %-12s %u/%u max=%u ovf=%lu%s",
             name(),
             (unsigned)_count,
             (unsigned)N,
             (unsigned)_max_fill,
             (unsigned long)_overflows,
             _overwrite ? " (overwrite)" : "");
  }

private:
  T _buf[N];
  size_t _head = 0;
  size_t _count = 0;
  size_t _max_fill = 0;
  uint32_t _overflows = 0;
  bool _overwrite;
};
