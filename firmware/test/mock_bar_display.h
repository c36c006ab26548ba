#pragma once
// =====================================================
// Mock Bar Display for Unit Testing
// =====================================================
// Implements IBarDisplay by recording calls instead of
// writing to a bus. Used to verify meter rendering.
// =====================================================

#include <stdint.h>
#include <stddef.h>

#include "i_bar_display.h"

class MockBarDisplay : public IBarDisplay {
public:
    static constexpr uint8_t MAX_BARS = 24;

    explicit MockBarDisplay(uint8_t bars = MAX_BARS)
        : _bars(bars <= MAX_BARS ? bars : MAX_BARS) {
        reset();
    }

    // Reset all state and call counters
    void reset() {
        for (uint8_t i = 0; i < MAX_BARS; ++i) {
            colors[i] = BarColor::Off;
        }
        brightness = LAST_UNSET;
        blinkRate = BlinkRate::NotBlinking;
        resetCounters();
        failSetBar = ErrorCode::None;
        failUpdateBars = ErrorCode::None;
        failBrightness = ErrorCode::None;
    }

    void resetCounters() {
        setBarCallCount = 0;
        updateBarsCallCount = 0;
        brightnessCallCount = 0;
        blinkCallCount = 0;
        clearCallCount = 0;
    }

    // =====================================================
    // IBarDisplay Implementation
    // =====================================================

    uint8_t barCount() const override {
        return _bars;
    }

    ErrorCode setBar(uint8_t index, BarColor color) override {
        setBarCallCount++;
        if (failSetBar != ErrorCode::None) {
            return failSetBar;
        }
        if (index >= _bars) {
            return ErrorCode::RangeError;
        }
        colors[index] = color;
        return ErrorCode::None;
    }

    ErrorCode updateBars() override {
        updateBarsCallCount++;
        return failUpdateBars;
    }

    ErrorCode setBrightness(uint8_t level) override {
        brightnessCallCount++;
        if (failBrightness != ErrorCode::None) {
            return failBrightness;
        }
        brightness = level;
        return ErrorCode::None;
    }

    ErrorCode setBlinkRate(BlinkRate rate) override {
        blinkCallCount++;
        blinkRate = rate;
        return ErrorCode::None;
    }

    ErrorCode clear() override {
        clearCallCount++;
        for (uint8_t i = 0; i < MAX_BARS; ++i) {
            colors[i] = BarColor::Off;
        }
        brightness = 15;
        blinkRate = BlinkRate::NotBlinking;
        return ErrorCode::None;
    }

    // =====================================================
    // Test Helpers
    // =====================================================

    uint8_t countLit() const {
        uint8_t lit = 0;
        for (uint8_t i = 0; i < _bars; ++i) {
            if (colors[i] != BarColor::Off) lit++;
        }
        return lit;
    }

    static constexpr uint8_t LAST_UNSET = 0xFF;

    BarColor colors[MAX_BARS];
    uint8_t brightness;
    BlinkRate blinkRate;

    int setBarCallCount;
    int updateBarsCallCount;
    int brightnessCallCount;
    int blinkCallCount;
    int clearCallCount;

    ErrorCode failSetBar;
    ErrorCode failUpdateBars;
    ErrorCode failBrightness;

private:
    uint8_t _bars;
};
