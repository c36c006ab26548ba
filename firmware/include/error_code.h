#pragma once
#include <stdint.h>

// =====================================================
// Error Codes
// =====================================================
// Status returned by every display and meter operation.
// None of these are recoverable at the point they occur;
// callers propagate them up to the application, which
// logs them and reports them on the console.
// =====================================================

enum class ErrorCode : uint8_t {
    None = 0,
    ConfigError,    // meter bounds invalid (max must exceed min)
    RangeError,     // argument outside the hardware-valid range
    BusWriteError   // retries exhausted on a bus write
};

// Stable short name for logs and console replies
const char* errorCodeName(ErrorCode code);
