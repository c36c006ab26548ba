// i2c_bus_hal.h
#pragma once
#include <stdint.h>
#include <stddef.h>

struct II2cBus {
    virtual ~II2cBus() = default;

    // Master transmit to address (8-bit, left-shifted form).
    // Returns 0 on success, otherwise the bus error code.
    virtual int write(uint8_t address, const uint8_t* data, size_t len) = 0;
};

// Factory function to create HAL instance (platform-specific)
II2cBus* createI2cBus();
