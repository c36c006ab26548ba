#include "error_code.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:          return "none";
        case ErrorCode::ConfigError:   return "config_error";
        case ErrorCode::RangeError:    return "range_error";
        case ErrorCode::BusWriteError: return "bus_write_error";
        default:
            return "unknown";
    }
}
