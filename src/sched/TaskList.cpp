#include "sched/TaskList.h"

#include "utils/Log.h"

TaskList::TaskList(MicrosFn clock_us)
: _clock_us(clock_us)
{
  for (size_t i = 0; i < MAX_TASKS; i++) _tasks[i] = nullptr;
}

bool TaskList::append(Task& task) {
  if (_count >= MAX_TASKS) return false;

  for (size_t i = 0; i < _count; i++) {
    if (_tasks[i] == &task) return false;
  }

  // Insert after every task with priority >= ours (stable for ties)
  size_t pos = _count;
  while (pos > 0 && _tasks[pos - 1]->priority() < task.priority()) {
    _tasks[pos] = _tasks[pos - 1];
    pos--;
  }
  _tasks[pos] = &task;
  _count++;
  return true;
}

Task* TaskList::priSched(uint32_t now_ms) {
  Task* chosen = nullptr;

  for (size_t i = 0; i < _count; i++) {
    Task* t = _tasks[i];

    // List is sorted, so once something is chosen only its peers matter
    if (chosen && t->priority() != chosen->priority()) break;
    if (!t->due(now_ms)) continue;

    // Equal priority: least recently run goes first
    if (!chosen || t->lastRunSeq() < chosen->lastRunSeq()) {
      chosen = t;
    }
  }

  if (!chosen) return nullptr;

  chosen->setLastRunSeq(++_run_seq);
  chosen->run(now_ms, _clock_us);
  return chosen;
}

size_t TaskList::rrSched(uint32_t now_ms) {
  size_t ran = 0;
  for (size_t i = 0; i < _count; i++) {
    Task* t = _tasks[i];
    if (!t->due(now_ms)) continue;

    t->setLastRunSeq(++_run_seq);
    t->run(now_ms, _clock_us);
    ran++;
  }
  return ran;
}

void TaskList::report() const {
  LOG_INFO("%-14s %3s %6s %8s %8s %8s %5s",
           "task", "pri", "per_ms", "runs", "avg_us", "max_us", "late");

  for (size_t i = 0; i < _count; i++) {
    const Task* t = _tasks[i];
    LOG_INFO("%-14s %3u %6lu %8lu %8lu %8lu %5lu",
             t->name(),
             (unsigned)t->priority(),
             (unsigned long)t->periodMs(),
             (unsigned long)t->profile().runs,
             (unsigned long)t->avgRunUs(),
             (unsigned long)t->profile().max_us,
             (unsigned long)t->lateCount());
  }
}
