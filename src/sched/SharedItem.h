#pragma once

#include <stddef.h>
#include <stdint.h>

/*
===============================================================================
  SharedItem.h
===============================================================================

  PURPOSE
  -------
  Common base for data passed between tasks (Share and Queue).

  Every item links itself into one global list when constructed and unlinks
  when destroyed, so showAllShares() can print every share and queue without
  the application keeping its own table.

  Items are meant to be globals created before the scheduler starts. The
  list is not protected against concurrent modification.
===============================================================================
*/

class SharedItem {
public:
  explicit SharedItem(const char* name);
  virtual ~SharedItem();

  const char* name() const { return _name; }

  // One-line summary for diagnostics (type, name, current contents)
  virtual void describe(char* buf, size_t cap) const = 0;

  // Registry iteration in creation order
  static const SharedItem* first() { return s_head; }
  const SharedItem* next() const { return _next; }
  static size_t count();

private:
  SharedItem(const SharedItem&) = delete;
  SharedItem& operator=(const SharedItem&) = delete;

  const char* _name;
  SharedItem* _next = nullptr;

  static SharedItem* s_head;
};

// Logs one INFO line per registered share and queue
void showAllShares();

// Value formatting used by Share<T>::describe
void formatShareValue(char* buf, size_t cap, bool v);
void formatShareValue(char* buf, size_t cap, int32_t v);
void formatShareValue(char* buf, size_t cap, uint32_t v);
void formatShareValue(char* buf, size_t cap, float v);
