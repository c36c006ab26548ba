#include "level_meter.h"
#include "debug_log.h"
#include <math.h>

LevelMeter::LevelMeter(IBarDisplay& display, uint8_t barCount, uint32_t fillupDecayMs)
    : _display(display)
    , _barCount(barCount)
    , _fillupDecayMs(fillupDecayMs)
    , _min(0.0f)
    , _max(1.0f)
    , _minIsInteger(false)
    , _maxIsInteger(false)
    , _range(1.0f)
    , _noise(0.0f)
    , _hasLevel(false)
    , _currentLevel(0.0f)
    , _litBars(0)
    , _lowWarn(THRESHOLD_DISABLED)
    , _lowCrit(THRESHOLD_DISABLED)
    , _highWarn(THRESHOLD_DISABLED)
    , _highCrit(THRESHOLD_DISABLED)
{
    if (_barCount == 0) {
        _barCount = 1;
    }
    if (_barCount > _display.barCount()) {
        _barCount = _display.barCount();
    }
    setNoiseDefault();
}

// =====================================================
// Range
// =====================================================

ErrorCode LevelMeter::begin(int min, int max) {
    ErrorCode err = applyRange((float)min, true, (float)max, true);
    if (err == ErrorCode::None) {
        setNoiseDefault();
    }
    return err;
}

ErrorCode LevelMeter::begin(float min, float max) {
    ErrorCode err = applyRange(min, false, max, false);
    if (err == ErrorCode::None) {
        setNoiseDefault();
    }
    return err;
}

ErrorCode LevelMeter::setMin(int min) {
    ErrorCode err = applyRange((float)min, true, _max, _maxIsInteger);
    if (err != ErrorCode::None) {
        return err;
    }
    return updateLevel(false, 0.0f);
}

ErrorCode LevelMeter::setMin(float min) {
    ErrorCode err = applyRange(min, false, _max, _maxIsInteger);
    if (err != ErrorCode::None) {
        return err;
    }
    return updateLevel(false, 0.0f);
}

ErrorCode LevelMeter::setMax(int max) {
    ErrorCode err = applyRange(_min, _minIsInteger, (float)max, true);
    if (err != ErrorCode::None) {
        return err;
    }
    return updateLevel(false, 0.0f);
}

ErrorCode LevelMeter::setMax(float max) {
    ErrorCode err = applyRange(_min, _minIsInteger, max, false);
    if (err != ErrorCode::None) {
        return err;
    }
    return updateLevel(false, 0.0f);
}

ErrorCode LevelMeter::applyRange(float min, bool minIsInteger, float max, bool maxIsInteger) {
    if (!(max > min)) {
        DEBUG_WARN("meter range rejected: max must exceed min");
        return ErrorCode::ConfigError;
    }

    _min = min;
    _max = max;
    _minIsInteger = minIsInteger;
    _maxIsInteger = maxIsInteger;

    // Integer bounds are inclusive
    _range = max - min;
    if (minIsInteger && maxIsInteger) {
        _range += 1.0f;
    }
    return ErrorCode::None;
}

void LevelMeter::setNoiseDefault() {
    _noise = _range / (2.0f * _barCount);
}

// =====================================================
// Level Updates
// =====================================================

LevelMeter::LevelUpdate LevelMeter::setCurLevel(float level) {
    LevelUpdate update = { LevelUpdate::Result::First, 0.0f, ErrorCode::None };

    if (isnan(level)) {
        DEBUG_WARN("meter level rejected: not a number");
        update.result = LevelUpdate::Result::Rejected;
        update.error = ErrorCode::RangeError;
        return update;
    }

    if (!_hasLevel) {
        _hasLevel = true;
        _currentLevel = level;
        update.error = updateLevel(false, 0.0f);
        return update;
    }

    float delta = level - _currentLevel;
    if (fabsf(delta) < _noise) {
        update.result = LevelUpdate::Result::Rejected;
        return update;
    }

    float previous = _currentLevel;
    _currentLevel = level;
    update.result = LevelUpdate::Result::Accepted;
    update.delta = delta;
    update.error = updateLevel(true, previous);
    return update;
}

void LevelMeter::reset() {
    _fillupTimer.cancel();
    _hasLevel = false;
    _currentLevel = 0.0f;
    _litBars = 0;
}

ErrorCode LevelMeter::loop() {
    if (_fillupTimer.poll()) {
        DEBUG_VERBOSE("meter rise highlight expired");
        return updateLevel(false, 0.0f);
    }
    return ErrorCode::None;
}

// =====================================================
// Thresholds
// =====================================================

bool LevelMeter::validThreshold(uint8_t bars) const {
    return bars == THRESHOLD_DISABLED || bars <= _barCount;
}

ErrorCode LevelMeter::setLowWarnings(uint8_t warn, uint8_t crit) {
    if (!validThreshold(warn) || !validThreshold(crit)) {
        return ErrorCode::RangeError;
    }
    _lowWarn = warn;
    _lowCrit = crit;
    return updateLevel(false, 0.0f);
}

ErrorCode LevelMeter::setHighWarnings(uint8_t warn, uint8_t crit) {
    if (!validThreshold(warn) || !validThreshold(crit)) {
        return ErrorCode::RangeError;
    }
    _highWarn = warn;
    _highCrit = crit;
    return updateLevel(false, 0.0f);
}

// =====================================================
// Redraw
// =====================================================

uint8_t LevelMeter::computeBars() const {
    float scaled = (_currentLevel - _min) * _barCount / _range;

    // Clamp before converting; huge or infinite levels must not overflow
    if (!(scaled >= 0.0f)) {
        return 1;
    }
    if (scaled >= (float)_barCount) {
        return _barCount;
    }
    return (uint8_t)((uint8_t)floorf(scaled) + 1);
}

ErrorCode LevelMeter::updateLevel(bool hasPrevious, float previousLevel) {
    if (!_hasLevel) {
        return ErrorCode::None;
    }

    const uint8_t bars = computeBars();
    const bool rising = hasPrevious && _currentLevel > previousLevel;
    _litBars = bars;

    ErrorCode err = ErrorCode::None;
    bool hasOverride = false;
    BarColor overrideColor = BarColor::Off;

    if (rising || _fillupTimer.isArmed()) {
        // Still bright from an earlier rise: skip the writes
        if (!_fillupTimer.isArmed()) {
            err = _display.setBrightness(FULL_BRIGHTNESS);
            if (err != ErrorCode::None) {
                return err;
            }
            err = _display.setBlinkRate(BlinkRate::NotBlinking);
            if (err != ErrorCode::None) {
                return err;
            }
        }

        if (rising) {
            _fillupTimer.arm(_fillupDecayMs);
        }

        if (_highCrit != THRESHOLD_DISABLED && bars >= _highCrit) {
            hasOverride = true;
            overrideColor = BarColor::Red;
        } else if (_highWarn != THRESHOLD_DISABLED && bars >= _highWarn) {
            hasOverride = true;
            overrideColor = BarColor::Orange;
        }
    } else if (_lowCrit != THRESHOLD_DISABLED && bars <= _lowCrit) {
        err = _display.setBrightness(FULL_BRIGHTNESS);
        if (err == ErrorCode::None) {
            err = _display.setBlinkRate(BlinkRate::Blink2Hz);
        }
    } else if (_lowWarn != THRESHOLD_DISABLED && bars <= _lowWarn) {
        err = _display.setBrightness(FULL_BRIGHTNESS);
        if (err == ErrorCode::None) {
            err = _display.setBlinkRate(BlinkRate::NotBlinking);
        }
    } else {
        err = _display.setBrightness(DIM_BRIGHTNESS);
        if (err == ErrorCode::None) {
            err = _display.setBlinkRate(BlinkRate::NotBlinking);
        }
    }

    if (err != ErrorCode::None) {
        return err;
    }

    for (uint8_t i = 0; i < _barCount; ++i) {
        BarColor color = BarColor::Off;
        if (i < bars) {
            if (hasOverride) {
                color = overrideColor;
            } else if (_lowCrit != THRESHOLD_DISABLED && i < _lowCrit) {
                color = BarColor::Red;
            } else if (_lowWarn != THRESHOLD_DISABLED && i < _lowWarn) {
                color = BarColor::Orange;
            } else {
                color = BarColor::Green;
            }
        }

        err = _display.setBar(i, color);
        if (err != ErrorCode::None) {
            return err;
        }
    }

    DEBUG_VERBOSE_F("meter redraw: %u bars%s",
                    (unsigned)bars, rising ? " (rising)" : "");

    return _display.updateBars();
}
