#include "StepClient.h"

#include <string.h>

#include "Params.h"
#include "comms/Protocol.h"
#include "utils/Log.h"

StepClient::StepClient(ByteStream& port, ClockFn now_ms, IdleFn idle)
: _port(port),
  _now_ms(now_ms),
  _idle(idle)
{
  memset(_tx_buf, 0, sizeof(_tx_buf));
  memset(_error, 0, sizeof(_error));
}

void StepClient::setError_(const char* msg) {
  strncpy(_error, msg ? msg : "?", sizeof(_error) - 1);
  _error[sizeof(_error) - 1] = '\0';
}

bool StepClient::expired_(uint32_t deadline_ms) const {
  return (int32_t)(_now_ms() - deadline_ms) >= 0;
}

bool StepClient::sendLine_(size_t len) {
  if (len == 0 || len + 1 >= sizeof(_tx_buf)) {
    setError_("encode failed");
    return false;
  }

  _tx_buf[len] = '\n';
  if (_port.write((const uint8_t*)_tx_buf, len + 1) != len + 1) {
    setError_("write failed");
    return false;
  }
  return true;
}

StepClient::Poll StepClient::poll_() {
  while (_port.available() > 0) {
    const int c = _port.read();
    if (c < 0) break;

    switch (_rx.push((char)c)) {
      case LineBuffer<256>::Push::LINE:
        if (!protocol::decodeReplyLine(_rx.line(), _reply)) {
          _discarded++;
          LOG_WARN("discarding line: %.48s", _rx.line());
          return Poll::OTHER;
        }

        if (_reply.type == ReplyType::LOG) {
          relayLog_(_reply);
          return Poll::OTHER;
        }
        if (_reply.type == ReplyType::HEARTBEAT) {
          _heartbeats++;
          _board_busy = _reply.busy;
          LOG_DEBUG("heartbeat t=%lu busy=%d",
                    (unsigned long)_reply.time_ms, (int)_reply.busy);
          return Poll::OTHER;
        }
        return Poll::FRAME;

      case LineBuffer<256>::Push::TOO_LONG:
        _discarded++;
        LOG_WARN("discarding oversized line");
        break;

      case LineBuffer<256>::Push::PENDING:
      default:
        break;
    }
  }
  return Poll::NONE;
}

void StepClient::relayLog_(const ReplyFrame& r) {
  LogLevel level = LogLevel::INFO;
  if (!logLevelFromName(r.level, level) || level == LogLevel::OFF) {
    level = LogLevel::INFO;
  }
  logPrintf(level, "board: %s", r.msg);
}

bool StepClient::waitAck_(uint32_t seq, uint32_t deadline_ms) {
  while (!expired_(deadline_ms)) {
    const Poll p = poll_();
    if (p == Poll::NONE) {
      if (_idle) _idle();
      continue;
    }
    if (p != Poll::FRAME) continue;

    if (_reply.type == ReplyType::ACK && _reply.seq == seq) {
      if (!_reply.ok) {
        setError_(_reply.error[0] ? _reply.error : "rejected");
        return false;
      }
      return true;
    }

    LOG_DEBUG("ignoring frame type %u before ack", (unsigned)_reply.type);
  }

  setError_("timeout waiting for ack");
  return false;
}

bool StepClient::runStep(float kp,
                         uint32_t period_ms,
                         uint8_t motor,
                         uint32_t timeout_ms,
                         std::vector<Sample>& out) {
  out.clear();
  _error[0] = '\0';

  const uint32_t seq = _next_seq++;
  uint32_t deadline = _now_ms() + timeout_ms;

  if (!sendLine_(protocol::encodeRunCommand(seq, kp, period_ms,
                                            _tx_buf, sizeof(_tx_buf) - 1))) {
    return false;
  }
  LOG_INFO("run seq=%lu kp=%.4f period=%lu ms",
           (unsigned long)seq, (double)kp, (unsigned long)period_ms);

  if (!waitAck_(seq, deadline)) return false;

  // Data only flows once the board has taken every sample
  const uint32_t run_ms = (uint32_t)STEP_SAMPLES * period_ms;
  deadline = _now_ms() + run_ms + timeout_ms;

  while (!expired_(deadline)) {
    const Poll p = poll_();
    if (p == Poll::NONE) {
      if (_idle) _idle();
      continue;
    }

    // Any traffic from the board restarts the quiet-time allowance
    const uint32_t quiet_until = _now_ms() + timeout_ms;
    if ((int32_t)(quiet_until - deadline) > 0) deadline = quiet_until;

    if (p != Poll::FRAME) continue;

    switch (_reply.type) {
      case ReplyType::SAMPLE:
        if (_reply.motor == motor) out.push_back(_reply.sample);
        break;

      case ReplyType::END:
        if (_reply.motor != motor) break;
        if (_reply.count != out.size()) {
          LOG_WARN("end says %lu samples, received %u",
                   (unsigned long)_reply.count, (unsigned)out.size());
        }
        LOG_INFO("received %u samples from motor %u",
                 (unsigned)out.size(), (unsigned)motor);
        return true;

      default:
        LOG_DEBUG("ignoring frame type %u", (unsigned)_reply.type);
        break;
    }
  }

  setError_("timeout waiting for data");
  return false;
}

bool StepClient::stop(uint32_t timeout_ms) {
  _error[0] = '\0';

  const uint32_t seq = _next_seq++;
  const uint32_t deadline = _now_ms() + timeout_ms;

  if (!sendLine_(protocol::encodeStopCommand(seq, _tx_buf, sizeof(_tx_buf) - 1))) {
    return false;
  }
  return waitAck_(seq, deadline);
}

bool StepClient::status(uint32_t timeout_ms, uint32_t linger_ms) {
  _error[0] = '\0';

  const uint32_t seq = _next_seq++;
  const uint32_t deadline = _now_ms() + timeout_ms;

  if (!sendLine_(protocol::encodeStatusCommand(seq, _tx_buf, sizeof(_tx_buf) - 1))) {
    return false;
  }
  if (!waitAck_(seq, deadline)) return false;

  // The report arrives as log lines after the ack
  const uint32_t linger_until = _now_ms() + linger_ms;
  while (!expired_(linger_until)) {
    if (poll_() == Poll::NONE && _idle) _idle();
  }
  return true;
}
