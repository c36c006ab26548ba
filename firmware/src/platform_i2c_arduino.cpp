// Platform I2C implementation for Arduino framework
#include "platform_i2c.h"
#include <Arduino.h>
#include <Wire.h>

void platform_i2c_begin(uint32_t clockHz) {
    Wire.begin();
    Wire.setClock(clockHz);
}

int platform_i2c_write(uint8_t address, const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        return PLATFORM_I2C_ERR_OTHER;
    }

    // Wire takes the 7-bit address
    Wire.beginTransmission((uint8_t)(address >> 1));
    size_t written = Wire.write(data, len);
    uint8_t status = Wire.endTransmission();

    if (status != 0) {
        return status;
    }
    if (written != len) {
        return PLATFORM_I2C_ERR_TOO_LONG;
    }
    return PLATFORM_I2C_OK;
}
