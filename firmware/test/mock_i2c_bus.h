#pragma once
// =====================================================
// Mock I2C Bus for Unit Testing
// =====================================================
// Implements II2cBus without real hardware. Every write
// is recorded; results are taken from a script (one
// entry per write, in order) and default to success once
// the script runs out, unless failAll() is set.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "i2c_bus_hal.h"

class MockI2cBus : public II2cBus {
public:
    static constexpr size_t MAX_WRITES = 128;
    static constexpr size_t MAX_PAYLOAD = 8;
    static constexpr size_t MAX_SCRIPT = 32;

    struct Write {
        uint8_t address;
        uint8_t data[MAX_PAYLOAD];
        size_t len;
        int result;
    };

    MockI2cBus() {
        reset();
    }

    // Reset all recorded writes and scripted results
    void reset() {
        memset(_writes, 0, sizeof(_writes));
        memset(_script, 0, sizeof(_script));
        writeCount = 0;
        _scriptLen = 0;
        _scriptPos = 0;
        _failAllCode = 0;
    }

    void clearWrites() {
        writeCount = 0;
    }

    // Append results for the next writes (0 = success)
    void script(const int* results, size_t count) {
        for (size_t i = 0; i < count && _scriptLen < MAX_SCRIPT; ++i) {
            _script[_scriptLen++] = results[i];
        }
    }

    // Every write fails with code (0 turns it off)
    void failAll(int code) {
        _failAllCode = code;
    }

    // =====================================================
    // II2cBus Implementation
    // =====================================================

    int write(uint8_t address, const uint8_t* data, size_t len) override {
        int result = 0;
        if (_failAllCode != 0) {
            result = _failAllCode;
        } else if (_scriptPos < _scriptLen) {
            result = _script[_scriptPos++];
        }

        if (writeCount < MAX_WRITES) {
            Write& w = _writes[writeCount];
            w.address = address;
            w.len = len < MAX_PAYLOAD ? len : MAX_PAYLOAD;
            memcpy(w.data, data, w.len);
            w.result = result;
        }
        writeCount++;
        return result;
    }

    // =====================================================
    // Test Helpers
    // =====================================================

    const Write& writeAt(size_t index) const {
        return _writes[index < MAX_WRITES ? index : MAX_WRITES - 1];
    }

    // Count writes whose payload equals the given bytes
    size_t countPayload(const uint8_t* data, size_t len) const {
        size_t count = 0;
        size_t n = writeCount < MAX_WRITES ? writeCount : MAX_WRITES;
        for (size_t i = 0; i < n; ++i) {
            if (_writes[i].len == len && memcmp(_writes[i].data, data, len) == 0) {
                count++;
            }
        }
        return count;
    }

    size_t countCommand(uint8_t command) const {
        return countPayload(&command, 1);
    }

    size_t writeCount;

private:
    Write _writes[MAX_WRITES];
    int _script[MAX_SCRIPT];
    size_t _scriptLen;
    size_t _scriptPos;
    int _failAllCode;
};
