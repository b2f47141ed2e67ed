/*
  MotorLab Nucleo Controller

  Purpose:
  Step-response bench for one or two DC motors under proportional
  position control, run by a cooperative priority scheduler.

  Tasks (higher priority first):
  - Motor_Task_2 : controller for motor 2 (data not reported)
  - Motor_Task_1 : controller for motor 1 (data reported to the host)
  - Comms_Task   : serial commands in, samples / acks / heartbeat out

  The host tool sends {"type":"run","kp":..,"period_ms":..}; both motors
  step to their setpoints and motor 1's samples are streamed back,
  terminated by an "end" line.
*/

#include <Arduino.h>

#include "Pins.h"
#include "Params.h"

#include "actuators/L6206Motor.h"
#include "comms/ArduinoStreamPort.h"
#include "comms/SerialLink.h"
#include "control/ProportionalController.h"
#include "sched/Share.h"
#include "sched/Task.h"
#include "sched/TaskList.h"
#include "sensors/EncoderSensor.h"
#include "tasks/CommsTask.h"
#include "tasks/MotorTask.h"
#include "utils/Log.h"


/*=============================================================================
  GLOBALS
=============================================================================*/

static uint32_t boardMicros() {
  return (uint32_t)micros();
}

// Serial link (USB)
ArduinoStreamPort g_port(SERIAL_USB);
SerialLink g_link(g_port);

// Motors and encoders
L6206Motor g_motor1(PIN_M1_EN, PIN_M1_IN1, PIN_M1_IN2, false, PWM_MAX);
L6206Motor g_motor2(PIN_M2_EN, PIN_M2_IN1, PIN_M2_IN2, false, PWM_MAX);

EncoderSensor g_encoder1(PIN_ENC1_A, PIN_ENC1_B);
EncoderSensor g_encoder2(PIN_ENC2_A, PIN_ENC2_B);

// Controllers
ProportionalController g_control1(INITIAL_KP, 0, g_motor1, g_encoder1);
ProportionalController g_control2(INITIAL_KP, 0, g_motor2, g_encoder2);

// Shares
Share<float> g_kp_share("KP", DEFAULT_KP);
Share<bool> g_stop_share("STOP", false);

MotorLink g_motor1_link(1, true,  "M1_START", "M1_DONE", "M1_SAMPLES");
MotorLink g_motor2_link(2, false, "M2_START", "M2_DONE", "M2_SAMPLES");

// Task bodies
MotorTask g_motor1_body(g_motor1_link, g_control1, g_motor1, g_encoder1,
                        MOTOR1_SETPOINT_COUNTS, g_kp_share, g_stop_share);
MotorTask g_motor2_body(g_motor2_link, g_control2, g_motor2, g_encoder2,
                        MOTOR2_SETPOINT_COUNTS, g_kp_share, g_stop_share);

// Tasks. Tracing costs RAM per task; leave it off unless debugging a
// state machine.
Task g_motor1_task(g_motor1_body, "Motor_Task_1", MOTOR1_TASK_PRIORITY,
                   DEFAULT_PERIOD_MS, true, false);
Task g_motor2_task(g_motor2_body, "Motor_Task_2", MOTOR2_TASK_PRIORITY,
                   DEFAULT_PERIOD_MS, true, false);

TaskList g_tasks(&boardMicros);

const MotorSlot g_slots[MOTOR_COUNT] = {
  { &g_motor1_task, &g_motor1_link },
  { &g_motor2_task, &g_motor2_link },
};

CommsTask g_comms_body(g_link, g_tasks, g_slots, MOTOR_COUNT,
                       g_kp_share, g_stop_share);
Task g_comms_task(g_comms_body, "Comms_Task", COMMS_TASK_PRIORITY,
                  COMMS_PERIOD_MS, true, false);


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  // Serial Comms Setup
  SERIAL_USB.begin(SERIAL_BAUD);
  g_link.begin();
  logSetSink(&SerialLink::logSink, &g_link);

  // Motor / Encoder Setup
  g_motor1.begin();
  g_motor2.begin();
  g_encoder1.begin();
  g_encoder2.begin();

  // Scheduler Setup
  bool ok = g_tasks.append(g_motor1_task);
  ok = g_tasks.append(g_motor2_task) && ok;
  ok = g_tasks.append(g_comms_task) && ok;
  if (!ok) {
    LOG_ERROR("task list full, MAX_TASKS=%u", (unsigned)MAX_TASKS);
  }

  LOG_INFO("motorlab ready: %u tasks, period=%lu ms, kp=%.4f",
           (unsigned)g_tasks.size(),
           (unsigned long)DEFAULT_PERIOD_MS,
           (double)g_kp_share.get());
}

/*=============================================================================
  LOOP
=============================================================================*/

void loop() {
  g_tasks.priSched(millis());
}
