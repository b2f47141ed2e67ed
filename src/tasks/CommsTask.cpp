#include "tasks/CommsTask.h"

#include "sched/SharedItem.h"
#include "utils/Log.h"

CommsTask::CommsTask(SerialLink& link,
                     TaskList& tasks,
                     const MotorSlot* slots,
                     size_t slot_count,
                     Share<float>& kp_share,
                     Share<bool>& stop_share)
: _link(link),
  _tasks(tasks),
  _kp_share(kp_share),
  _stop_share(stop_share)
{
  if (slots == nullptr) slot_count = 0;
  if (slot_count > MOTOR_COUNT) slot_count = MOTOR_COUNT;

  for (size_t i = 0; i < MOTOR_COUNT; i++) {
    if (i < slot_count) {
      _slots[i] = slots[i];
    } else {
      _slots[i].task = nullptr;
      _slots[i].link = nullptr;
    }
    _sent[i] = 0;
  }
  _slot_count = slot_count;

  _heartbeat_rate.setPeriodMs(HEARTBEAT_PERIOD_MS);
}

uint8_t CommsTask::step(uint32_t now_ms) {
  // RX: read serial and handle command frames
  _link.tick(now_ms);

  CommandFrame cmd;
  while (_link.takeCommand(cmd)) {
    handleCommand_(cmd);
  }

  // TX: finished data sets first, heartbeat only when idle on the wire
  const bool streamed = streamData_();

  if (!streamed && _heartbeat_rate.ready(now_ms)) {
    if (!_link.sendHeartbeat(now_ms, busy())) _tx_errors++;
  }

  return streamed ? STREAM : LISTEN;
}

bool CommsTask::busy() const {
  for (size_t i = 0; i < _slot_count; i++) {
    const MotorLink* m = _slots[i].link;
    if (m->start.get() || m->done.get()) return true;
  }
  return false;
}

void CommsTask::handleCommand_(const CommandFrame& cmd) {
  if (!cmd.valid) {
    ack_(cmd.seq, false, cmd.error ? cmd.error : "invalid command");
    return;
  }

  switch (cmd.type) {
    case CommandType::RUN:
      startRun_(cmd);
      break;

    case CommandType::STOP:
      _stop_share.put(true);
      ack_(cmd.seq, true);
      LOG_INFO("stop requested");
      break;

    case CommandType::STATUS:
      ack_(cmd.seq, true);
      reportStatus_();
      break;

    case CommandType::UNKNOWN:
    default:
      ack_(cmd.seq, false, "unknown type");
      break;
  }
}

void CommsTask::ack_(uint32_t seq, bool ok, const char* error) {
  if (!_link.sendAck(seq, ok, error)) _tx_errors++;
}

void CommsTask::startRun_(const CommandFrame& cmd) {
  if (busy()) {
    ack_(cmd.seq, false, "busy");
    return;
  }

  // Stop must be clear before any start flag goes up
  _stop_share.put(false);
  _kp_share.put(cmd.kp);

  for (size_t i = 0; i < _slot_count; i++) {
    Task* t = _slots[i].task;
    if (!t->setPeriodMs(cmd.period_ms)) {
      ack_(cmd.seq, false, "bad period");
      return;
    }
    t->restartSchedule();
  }

  for (size_t i = 0; i < _slot_count; i++) {
    _sent[i] = 0;
    _slots[i].link->done.put(false);
    _slots[i].link->start.put(true);
  }

  _runs_started++;
  ack_(cmd.seq, true);
  LOG_INFO("run %lu: kp=%.4f period=%lu ms",
           (unsigned long)_runs_started,
           (double)cmd.kp,
           (unsigned long)cmd.period_ms);
}

void CommsTask::reportStatus_() {
  _tasks.report();
  showAllShares();
  _link.logStats();

  for (size_t i = 0; i < _slot_count; i++) {
    _slots[i].task->logTrace();
  }
}

bool CommsTask::streamData_() {
  size_t quota = SAMPLES_PER_TX_TICK;
  bool streamed = false;

  for (size_t i = 0; i < _slot_count; i++) {
    MotorLink* m = _slots[i].link;
    if (!m->done.get()) continue;

    if (!m->reported) {
      m->samples.clear();
      m->done.put(false);
      continue;
    }

    Sample s;
    while (quota > 0 && m->samples.get(s)) {
      if (!_link.sendSample(m->motor_id, s)) _tx_errors++;
      _sent[i]++;
      quota--;
      streamed = true;
    }

    if (!m->samples.any()) {
      if (!_link.sendEnd(m->motor_id, _sent[i])) _tx_errors++;
      _sent[i] = 0;
      m->done.put(false);
      streamed = true;
    }

    if (quota == 0) break;
  }

  return streamed;
}
