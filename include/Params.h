#pragma once
#include <stddef.h>
#include <stdint.h>

/*
  Params.h

  Purpose:
  Central location for MotorLab constants and tunable parameters.
  Plain integer / float constants only, so the scheduler, controller and
  protocol code can be built for the board and for host tests alike.

  Board:
  STM32 Nucleo L476RG + X-NUCLEO-IHM04A1 (L6206 dual H-bridge)

  Convention:
  - Positions: encoder counts
  - Duty: percent, -100 .. 100
  - Times: milliseconds unless the name says _US
*/

/* ============================================================================
   STEP RESPONSE
============================================================================ */

// Number of controller activations (and samples) per step response.
// 100 samples at a 10 ms period covers one second of motion.
constexpr size_t STEP_SAMPLES = 100;

// Destination positions for each motor's step
constexpr int32_t MOTOR1_SETPOINT_COUNTS = 8150;
constexpr int32_t MOTOR2_SETPOINT_COUNTS = 32000;

/* ============================================================================
   PROPORTIONAL CONTROL
============================================================================ */

// Gain the controllers are constructed with, replaced at the start of a run
constexpr float INITIAL_KP = 2.0f;

// Gain used when the host does not provide a usable one.
// Recommended: 0.06 with no load, 0.05 with the flywheel attached.
constexpr float DEFAULT_KP = 0.05f;

/* ============================================================================
   MOTOR LIMITS
============================================================================ */

constexpr float DUTY_MAX_PCT = 100.0f;

// analogWrite() resolution on the Nucleo (8 bit)
constexpr uint8_t PWM_MAX = 255;

/* ============================================================================
   TASKS / TIMING
============================================================================ */

// Controller period. 10 ms is the lab default; the step settles without
// oscillation up to ~30 ms and overshoots from ~40 ms.
constexpr uint32_t DEFAULT_PERIOD_MS = 10;
constexpr uint32_t MIN_PERIOD_MS = 1;
constexpr uint32_t MAX_PERIOD_MS = 1000;

constexpr uint32_t COMMS_PERIOD_MS = 10;
constexpr uint32_t HEARTBEAT_PERIOD_MS = 1000;

// Higher number runs first
constexpr uint8_t COMMS_TASK_PRIORITY = 0;
constexpr uint8_t MOTOR1_TASK_PRIORITY = 1;
constexpr uint8_t MOTOR2_TASK_PRIORITY = 2;

constexpr size_t MOTOR_COUNT = 2;
constexpr size_t MAX_TASKS = 8;

// State transitions kept per traced task
constexpr size_t TASK_TRACE_LEN = 16;

/* ============================================================================
   TELEMETRY / COMMS
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 115200;
constexpr size_t SERIAL_LINE_BUFFER_BYTES = 128;
constexpr size_t TELEMETRY_BUFFER_BYTES = 160;

// Commands buffered between two comms ticks
constexpr size_t COMMAND_QUEUE_LEN = 4;

// Sample lines written per comms activation while streaming a data set
constexpr size_t SAMPLES_PER_TX_TICK = 5;

/* ============================================================================
   LOGGING
============================================================================ */

constexpr size_t LOG_LINE_BYTES = 96;

constexpr bool ENABLE_SERIAL_DEBUG = false;
