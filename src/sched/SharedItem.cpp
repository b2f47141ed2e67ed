#include "sched/SharedItem.h"

#include <stdio.h>

#include "Params.h"
#include "utils/Log.h"

SharedItem* SharedItem::s_head = nullptr;

SharedItem::SharedItem(const char* name)
: _name(name ? name : "?")
{
  // Append so the listing follows creation order
  if (!s_head) {
    s_head = this;
    return;
  }

  SharedItem* tail = s_head;
  while (tail->_next) tail = tail->_next;
  tail->_next = this;
}

SharedItem::~SharedItem() {
  SharedItem** link = &s_head;
  while (*link) {
    if (*link == this) {
      *link = _next;
      break;
    }
    link = &(*link)->_next;
  }
}

size_t SharedItem::count() {
  size_t n = 0;
  for (const SharedItem* it = s_head; it; it = it->_next) n++;
  return n;
}

void showAllShares() {
  char line[LOG_LINE_BYTES];
  for (const SharedItem* it = SharedItem::first(); it; it = it->next()) {
    it->describe(line, sizeof(line));
    LOG_INFO("%s", line);
  }
}

void formatShareValue(char* buf, size_t cap, bool v) {
  snprintf(buf, cap, "%s", v ? "true" : "false");
}

void formatShareValue(char* buf, size_t cap, int32_t v) {
  snprintf(buf, cap, "%ld", (long)v);
}

void formatShareValue(char* buf, size_t cap, uint32_t v) {
  snprintf(buf, cap, "%lu", (unsigned long)v);
}

void formatShareValue(char* buf, size_t cap, float v) {
  snprintf(buf, cap, "%.4f", (double)v);
}
