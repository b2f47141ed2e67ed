#pragma once

#include <stdio.h>

#include "sched/SharedItem.h"

/*
  Share<T>

  Named single-value mailbox between tasks. The writer put()s, any reader
  get()s the latest value. There is no locking: tasks are cooperative and
  never interrupt each other mid-access. Do not touch shares from ISRs.

  T must be one of the types formatShareValue() knows (bool, int32_t,
  uint32_t, float).
*/
template <typename T>
class Share : public SharedItem {
public:
  explicit Share(const char* name, T initial = T())
  : SharedItem(name), _value(initial) {}

  void put(const T& value) {
    _value = value;
    _puts++;
  }

  T get() const { return _value; }

  uint32_t putCount() const { return _puts; }

  void describe(char* buf, size_t cap) const override {
    char val[24];
    formatShareValue(val, sizeof(val), _value);
    snprintf(buf, cap, "Share %-12s = %-10s puts=%lu",
             name(), val, (unsigned long)_puts);
  }

private:
  T _value;
  uint32_t _puts = 0;
};
