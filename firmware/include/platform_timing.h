#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// Millisecond clock used by the meter's decay timer and
// the application's sampling cadence. Host tests link a
// fake implementation with a controllable clock.
//
// Usage:
//   - Call platform_timing_init() once at startup
//   - Compare platform_millis() deltas with unsigned
//     subtraction so wraparound is harmless
// =====================================================

// Initialize timing system (call once at startup)
void platform_timing_init();

// Get milliseconds since startup (wraps every ~49 days)
uint32_t platform_millis();

// Blocking delay in milliseconds
void platform_delay_ms(uint32_t ms);
