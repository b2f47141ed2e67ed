#include "tasks/MotorTask.h"

#include "utils/Log.h"

MotorTask::MotorTask(MotorLink& link,
                     ProportionalController& controller,
                     DutyActuator& motor,
                     PositionSensor& encoder,
                     int32_t setpoint,
                     Share<float>& kp_share,
                     Share<bool>& stop_share,
                     size_t sample_count)
: _link(link),
  _controller(controller),
  _motor(motor),
  _encoder(encoder),
  _setpoint(setpoint),
  _kp_share(kp_share),
  _stop_share(stop_share),
  _sample_count(sample_count)
{
  if (_sample_count == 0) _sample_count = 1;
  if (_sample_count > SampleQueue::capacity()) _sample_count = SampleQueue::capacity();
}

uint8_t MotorTask::step(uint32_t now_ms) {
  switch (_state) {
    case IDLE:
      if (!_link.start.get()) break;

      prepare_(now_ms);

      // A stop that came in with the start ends the run before any duty
      if (_stop_share.get()) {
        finish_(true);
        break;
      }

      _state = RUN;

      // First sample belongs to the activation that starts the run
      sample_(now_ms);
      if (_taken >= _sample_count) finish_(false);
      break;

    case RUN:
      if (_stop_share.get()) {
        finish_(true);
        break;
      }

      sample_(now_ms);
      if (_taken >= _sample_count) finish_(false);
      break;
  }

  return (uint8_t)_state;
}

void MotorTask::prepare_(uint32_t now_ms) {
  _motor.setDutyPercent(0.0f);
  _encoder.zero();

  const float kp = _kp_share.get();
  if (!_controller.setKp(kp)) {
    LOG_WARN("motor %u: rejected kp=%.4f, keeping %.4f",
             (unsigned)_link.motor_id, (double)kp, (double)_controller.kp());
  }
  _controller.setSetpoint(_setpoint);

  _link.samples.clear();
  _link.done.put(false);

  _start_ms = now_ms;
  _taken = 0;
  _aborted = false;

  LOG_DEBUG("motor %u: step to %ld, kp=%.4f",
            (unsigned)_link.motor_id, (long)_setpoint, (double)_controller.kp());
}

void MotorTask::sample_(uint32_t now_ms) {
  _controller.run(_setpoint);

  Sample s;
  s.t_ms = now_ms - _start_ms;
  s.position = _controller.lastPosition();

  if (!_link.samples.put(s)) {
    LOG_WARN("motor %u: sample queue full at %u",
             (unsigned)_link.motor_id, (unsigned)_taken);
  }
  _taken++;
}

void MotorTask::finish_(bool aborted) {
  _motor.setDutyPercent(0.0f);

  _aborted = aborted;
  _state = IDLE;

  _link.start.put(false);
  _link.done.put(true);

  LOG_INFO("motor %u: %s after %u samples, pos=%ld",
           (unsigned)_link.motor_id,
           aborted ? "stopped" : "done",
           (unsigned)_taken,
           (long)_controller.lastPosition());
}
