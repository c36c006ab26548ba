#pragma once

// =====================================================
// Debug Log
// =====================================================
// Compile-time level-gated log macros written to the
// platform serial port. Levels below DEBUG_LEVEL compile
// to nothing, so VERBOSE output costs no flash in
// production builds.
//
//   0 = NONE    - all output disabled
//   1 = ERROR   - unrecoverable failures
//   2 = WARN    - errors + bus retries (default)
//   3 = INFO    - + configuration and startup
//   4 = VERBOSE - + per-redraw details
//
// Override with a build flag: -DDEBUG_LEVEL=4
//
// Console replies are JSON lines; log lines are prefixed
// with "# " so host tools can tell them apart.
// =====================================================

#include "platform_serial.h"

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL 2
#endif

#define DEBUG_LOG_LINE_(tag, x) \
    do { \
        platform_serial_print("# " tag " "); \
        platform_serial_println(x); \
    } while (0)

#define DEBUG_LOG_FMT_(tag, fmt, ...) \
    do { \
        platform_serial_print("# " tag " "); \
        platform_serial_printf(fmt, __VA_ARGS__); \
        platform_serial_println(""); \
    } while (0)

#if DEBUG_LEVEL >= 1
  #define DEBUG_ERROR(x) DEBUG_LOG_LINE_("E", x)
  #define DEBUG_ERROR_F(fmt, ...) DEBUG_LOG_FMT_("E", fmt, __VA_ARGS__)
#else
  #define DEBUG_ERROR(x) ((void)0)
  #define DEBUG_ERROR_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 2
  #define DEBUG_WARN(x) DEBUG_LOG_LINE_("W", x)
  #define DEBUG_WARN_F(fmt, ...) DEBUG_LOG_FMT_("W", fmt, __VA_ARGS__)
#else
  #define DEBUG_WARN(x) ((void)0)
  #define DEBUG_WARN_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 3
  #define DEBUG_INFO(x) DEBUG_LOG_LINE_("I", x)
  #define DEBUG_INFO_F(fmt, ...) DEBUG_LOG_FMT_("I", fmt, __VA_ARGS__)
#else
  #define DEBUG_INFO(x) ((void)0)
  #define DEBUG_INFO_F(fmt, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 4
  #define DEBUG_VERBOSE(x) DEBUG_LOG_LINE_("V", x)
  #define DEBUG_VERBOSE_F(fmt, ...) DEBUG_LOG_FMT_("V", fmt, __VA_ARGS__)
#else
  #define DEBUG_VERBOSE(x) ((void)0)
  #define DEBUG_VERBOSE_F(fmt, ...) ((void)0)
#endif
