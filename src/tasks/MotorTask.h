#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "comms/Messages.h"
#include "control/ControlIo.h"
#include "control/ProportionalController.h"
#include "sched/Queue.h"
#include "sched/Share.h"
#include "sched/Task.h"

/*
===============================================================================
  MotorTask.h
===============================================================================

  PURPOSE
  -------
  Runs one step response on one motor, one controller update per
  activation.

  States:
    IDLE : motor stopped, waiting for the start share
    RUN  : each activation runs the controller once and records
           (elapsed ms, position) into the motor's sample queue

  Start of a run (on the activation that sees start == true):
    - stop the motor and zero the encoder
    - load Kp from the gain share (keep the old gain if it is rejected)
    - clear the sample queue, take the first sample right away

  End of a run (sample count reached, or the stop share is set):
    - stop the motor
    - set done, clear start, go back to IDLE

  The comms task owns everything that happens to the samples afterwards.
===============================================================================
*/

typedef Queue<Sample, STEP_SAMPLES> SampleQueue;

// Shares between one MotorTask and the CommsTask
struct MotorLink {
  MotorLink(uint8_t motor_id,
            bool reported,
            const char* start_name,
            const char* done_name,
            const char* samples_name)
  : motor_id(motor_id),
    reported(reported),
    start(start_name, false),
    done(done_name, false),
    samples(samples_name) {}

  const uint8_t motor_id;

  // When false, the data set is discarded instead of streamed
  bool reported;

  Share<bool> start;     // set by comms; cleared by the motor task when finished
  Share<bool> done;      // set by the motor task; cleared by comms once handled
  SampleQueue samples;
};

class MotorTask : public TaskBody {
public:
  enum State : uint8_t {
    IDLE = 0,
    RUN = 1,
  };

  /*
    setpoint     : step destination in encoder counts
    sample_count : activations per run, clamped to [1, STEP_SAMPLES]
  */
  MotorTask(MotorLink& link,
            ProportionalController& controller,
            DutyActuator& motor,
            PositionSensor& encoder,
            int32_t setpoint,
            Share<float>& kp_share,
            Share<bool>& stop_share,
            size_t sample_count = STEP_SAMPLES);

  uint8_t step(uint32_t now_ms) override;

  State state() const { return _state; }
  size_t samplesTaken() const { return _taken; }
  bool lastRunAborted() const { return _aborted; }

private:
  void prepare_(uint32_t now_ms);
  void sample_(uint32_t now_ms);
  void finish_(bool aborted);

  MotorLink& _link;
  ProportionalController& _controller;
  DutyActuator& _motor;
  PositionSensor& _encoder;

  int32_t _setpoint;
  Share<float>& _kp_share;
  Share<bool>& _stop_share;
  size_t _sample_count;

  State _state = IDLE;
  uint32_t _start_ms = 0;
  size_t _taken = 0;
  bool _aborted = false;
};
