#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Serial/USB Abstraction
// =====================================================
// Carries the command console and the debug log.
// Arduino builds map onto Serial (USB CDC on STM32);
// host tests capture output in a buffer instead.
// =====================================================

// Initialize serial/USB communication
// baud: baud rate (ignored for USB CDC, kept for compatibility)
void platform_serial_begin(uint32_t baud);

// Returns: number of bytes available (0 if none)
int platform_serial_available();

// Returns: byte value (0-255) or -1 if no data available
int platform_serial_read();

// Print without newline
void platform_serial_print(const char* str);
void platform_serial_print(int num);
void platform_serial_print(uint32_t num);
void platform_serial_print_hex(uint8_t byte);

// Print a real value with the given number of decimals
void platform_serial_print_float(float value, uint8_t decimals);

// Print a string with newline (\r\n)
void platform_serial_println(const char* str);

// Formatted print (printf semantics, output truncated to 128 bytes)
void platform_serial_printf(const char* fmt, ...);

// Flush output buffer (wait for transmission to complete)
void platform_serial_flush();
