#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for all Nucleo pin assignments for the MotorLab bench.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Board:
  STM32 Nucleo L476RG with the L6206 motor shield

  Notes:
  - The L6206 enable and input lines are routed internally by the shield
  - Encoder channels need timer-capable pins for hardware decoding, but the
    Encoder library only needs interrupt-capable ones
*/

/* ============================================================================
   L6206 MOTOR DRIVER PINS
   EN  = Bridge enable
   IN1 = PWM, forward
   IN2 = PWM, reverse
============================================================================ */

// Motor 1
constexpr uint32_t PIN_M1_EN  = PC1;
constexpr uint32_t PIN_M1_IN1 = PA0;
constexpr uint32_t PIN_M1_IN2 = PA1;

// Motor 2
constexpr uint32_t PIN_M2_EN  = PA10;
constexpr uint32_t PIN_M2_IN1 = PB4;
constexpr uint32_t PIN_M2_IN2 = PB5;

/* ============================================================================
   QUADRATURE ENCODER PINS

   Harness colors:
     Yellow = Channel A
     Blue   = Channel B
     Red    = Encoder supply (connect to 3.3V, not 5V)
     Black  = Encoder ground
     Orange = Motor + (L6206 output +)
     Green  = Motor - (L6206 output -)
============================================================================ */

// Encoder 1
constexpr uint32_t PIN_ENC1_A = PC6;
constexpr uint32_t PIN_ENC1_B = PC7;

// Encoder 2
constexpr uint32_t PIN_ENC2_A = PB6;
constexpr uint32_t PIN_ENC2_B = PB7;

/* ============================================================================
   SERIAL INTERFACES
============================================================================ */

// ST-LINK virtual COM port (Laptop <-> Nucleo)
#define SERIAL_USB Serial
