#pragma once
// =====================================================
// Level Meter Defaults
// =====================================================
// Power-on configuration of the meter. Every value can
// be changed at runtime from the USB console; these are
// what the device starts with. Override via build flags.
// =====================================================

#ifndef METER_BAR_COUNT
#define METER_BAR_COUNT 24
#endif

// Input range (integer bounds: raw ADC counts)
#ifndef METER_INPUT_MIN
#define METER_INPUT_MIN 0
#endif

#ifndef METER_INPUT_MAX
#define METER_INPUT_MAX 4095
#endif

// Warning thresholds in bars (0 disables a threshold)
#ifndef METER_LOW_WARN
#define METER_LOW_WARN 6
#endif

#ifndef METER_LOW_CRIT
#define METER_LOW_CRIT 3
#endif

#ifndef METER_HIGH_WARN
#define METER_HIGH_WARN 19
#endif

#ifndef METER_HIGH_CRIT
#define METER_HIGH_CRIT 22
#endif

// Bright "rising" highlight holds this long after the last rise
#ifndef METER_FILLUP_DECAY_MS
#define METER_FILLUP_DECAY_MS 15000
#endif

// Analog sampling period in auto mode
#ifndef METER_SAMPLE_INTERVAL_MS
#define METER_SAMPLE_INTERVAL_MS 50
#endif
