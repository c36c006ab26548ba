#pragma once
// =====================================================
// Board Configuration
// =====================================================
// Central location for hardware wiring definitions.
// Override any value via build flags:
//   -DBARGRAPH_I2C_ADDRESS=0x71
//
// For STM32CubeIDE migration, define these in main.h
// using HAL constants.
// =====================================================

#include <stdint.h>

// For Arduino builds, include Arduino.h to get pin definitions (A0, PA0, etc.)
#ifdef ARDUINO
#include <Arduino.h>
#endif

// =====================================================
// Bar-Graph Display (HT16K33 backpack)
// =====================================================
// 7-bit address; A0-A2 solder jumpers select 0x70-0x77

#ifndef BARGRAPH_I2C_ADDRESS
#define BARGRAPH_I2C_ADDRESS 0x70
#endif

// Max attempts per physical write before BusWriteError
#ifndef BARGRAPH_RETRY_LIMIT
#define BARGRAPH_RETRY_LIMIT 3
#endif

#ifndef BARGRAPH_I2C_CLOCK_HZ
#define BARGRAPH_I2C_CLOCK_HZ 400000
#endif

// =====================================================
// Level Input
// =====================================================
// Analog pin sampled in auto mode

#ifndef LEVEL_INPUT_PIN
#ifdef A0
#define LEVEL_INPUT_PIN A0    // Arduino: A0 (PA0 on NUCLEO-L053R8)
#else
#define LEVEL_INPUT_PIN 0     // Generic: channel 0
#endif
#endif

#ifndef LEVEL_INPUT_ADC_BITS
#define LEVEL_INPUT_ADC_BITS 12
#endif

// =====================================================
// USB Serial Console
// =====================================================

#ifndef USB_SERIAL_BAUD
#define USB_SERIAL_BAUD 115200
#endif
