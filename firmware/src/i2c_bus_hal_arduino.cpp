#include "i2c_bus_hal.h"
#include "platform_i2c.h"

// Arduino implementation of the display bus.
// Uses the default Wire instance (SDA/SCL from the board variant);
// platform_i2c_begin() must run before the first write.

class I2cBusArduino : public II2cBus {
public:
    int write(uint8_t address, const uint8_t* data, size_t len) override {
        return platform_i2c_write(address, data, len);
    }
};

// Global instance (will be initialized in setup)
static I2cBusArduino* g_i2cBus = nullptr;

// Factory function to create HAL instance
II2cBus* createI2cBus() {
    if (g_i2cBus == nullptr) {
        g_i2cBus = new I2cBusArduino();
    }
    return g_i2cBus;
}
