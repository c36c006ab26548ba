#pragma once
#include <stdint.h>
#include <stddef.h>

#include "i_bar_display.h"
#include "i2c_bus_hal.h"

// =====================================================
// 24-Bar Bicolor Bar Graph (HT16K33)
// =====================================================
//
// Display memory layout:
//   3 rows (cathodes) x 16 bits. In each row word, bits
//   0-7 are red anodes and bits 8-15 are green anodes.
//   Bars 0-11 use columns 0-3 and bars 12-23 use
//   columns 4-7 of the same three rows:
//
//     index < 12 : row = index / 4,     col = index % 4
//     index >= 12: row = index / 4 - 3, col = index % 4 + 4
//
//   red bit = col, green bit = col + 8
//
// Write protocol:
//   Every command goes through writeWithRetry(). A failed
//   attempt puts the controller in standby and re-enables
//   the oscillator (unless the failed payload was the
//   oscillator enable itself) before trying again.
//

class BarGraph : public IBarDisplay {
public:
    static constexpr uint8_t BAR_COUNT = 24;
    static constexpr size_t BUFFER_WORDS = 3;
    static constexpr uint8_t DEFAULT_RETRY_LIMIT = 3;
    static constexpr uint8_t MAX_BRIGHTNESS = 15;

    // HT16K33 command bytes
    static constexpr uint8_t CMD_OSCILLATOR_ON = 0x21;
    static constexpr uint8_t CMD_STANDBY = 0x20;
    static constexpr uint8_t CMD_DISPLAY_POINTER = 0x00;
    static constexpr uint8_t CMD_BRIGHTNESS = 0xE0;
    static constexpr uint8_t CMD_BLINK = 0x81;

    // address: 7-bit device address (0x70-0x77)
    BarGraph(II2cBus* bus, uint8_t address, uint8_t retryLimit = DEFAULT_RETRY_LIMIT);

    // Enable the oscillator and restore power-on defaults
    ErrorCode begin();

    // IBarDisplay
    uint8_t barCount() const override { return BAR_COUNT; }
    ErrorCode setBar(uint8_t index, BarColor color) override;
    ErrorCode updateBars() override;
    ErrorCode setBrightness(uint8_t level) override;
    ErrorCode setBlinkRate(BlinkRate rate) override;
    ErrorCode clear() override;

    // Decode one bar back out of the display buffer
    BarColor getBar(uint8_t index) const;

    const uint16_t* buffer() const { return _buffer; }
    uint8_t busAddress() const { return _address; }
    uint8_t retryLimit() const { return _retryLimit; }

    // Bus code of the most recent failed attempt (0 after a success)
    int lastBusError() const { return _lastBusError; }

private:
    static void barPosition(uint8_t index, uint8_t& row, uint8_t& col);

    ErrorCode writeCommand(uint8_t command);
    ErrorCode writeWithRetry(const uint8_t* data, size_t len);
    void recover(bool failedOscillatorEnable);

    II2cBus* _bus;
    uint8_t _address;       // 8-bit (shifted) form
    uint8_t _retryLimit;
    int _lastBusError;
    uint16_t _buffer[BUFFER_WORDS];
};
