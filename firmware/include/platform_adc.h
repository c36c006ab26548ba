#pragma once
#include <stdint.h>

// =====================================================
// Platform ADC Abstraction
// =====================================================
// This abstraction layer allows easy migration between
// Arduino analogRead() and STM32 HAL ADC.
//
// Usage:
//   - Call platform_adc_begin() once at startup
//   - Use platform_adc_read(pin) to sample a channel
// =====================================================

// Configure conversion resolution (e.g. 12 for 0-4095)
void platform_adc_begin(uint8_t resolutionBits);

// Read one conversion from the given analog pin
uint32_t platform_adc_read(uint32_t pin);
