#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform I2C Abstraction
// =====================================================
// This abstraction layer allows easy migration between
// Arduino Wire and STM32 HAL I2C.
//
// Addresses are passed in the left-shifted 8-bit form
// (7-bit address << 1), the convention used by the
// STM32 HAL. The Arduino implementation shifts back.
//
// Usage:
//   - Call platform_i2c_begin() once at startup
//   - Use platform_i2c_write() for master transmit
// =====================================================

// Bus error codes returned by platform_i2c_write()
// (values match Wire.endTransmission())
#define PLATFORM_I2C_OK             0
#define PLATFORM_I2C_ERR_TOO_LONG   1  // data too long for transmit buffer
#define PLATFORM_I2C_ERR_NACK_ADDR  2  // NACK on address
#define PLATFORM_I2C_ERR_NACK_DATA  3  // NACK on data
#define PLATFORM_I2C_ERR_OTHER      4  // other bus error
#define PLATFORM_I2C_ERR_TIMEOUT    5  // bus timeout

// Initialize the I2C peripheral as bus master
// clockHz: SCL frequency (e.g. 100000 or 400000)
void platform_i2c_begin(uint32_t clockHz);

// Transmit len bytes to the device at address (8-bit form)
// Returns: PLATFORM_I2C_OK on success, otherwise a bus error code
int platform_i2c_write(uint8_t address, const uint8_t* data, size_t len);
