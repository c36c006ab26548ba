#pragma once
#include <stdint.h>

#include "i_bar_display.h"
#include "one_shot_timer.h"

// =====================================================
// Level Meter
// =====================================================
// Renders a scalar input on a bar display like an
// analog meter:
//
//   bars = floor((level - min) * barCount / range) + 1
//
// clamped to [1, barCount], so the bottom bar is always
// lit once a level is known. Integer bounds make the
// range inclusive (max - min + 1).
//
// Presentation, in priority order:
//   1. Rising (or within the decay window of the last
//      rise): full brightness, steady; all lit bars red
//      at/above highCrit, orange at/above highWarn.
//   2. At/below lowCrit: full brightness, 2Hz blink.
//   3. At/below lowWarn: full brightness, steady.
//   4. Otherwise dimmed, steady.
// Without an override each lit bar is red below lowCrit,
// orange below lowWarn, green above.
//
// Updates smaller than the noise threshold are ignored.
// =====================================================

class LevelMeter {
public:
    static constexpr uint8_t DEFAULT_BAR_COUNT = 24;
    static constexpr uint8_t THRESHOLD_DISABLED = 0;
    static constexpr uint8_t FULL_BRIGHTNESS = 15;
    static constexpr uint8_t DIM_BRIGHTNESS = 0;
    static constexpr uint32_t DEFAULT_FILLUP_DECAY_MS = 15000;

    static constexpr uint8_t DEFAULT_LOW_WARN = 6;
    static constexpr uint8_t DEFAULT_LOW_CRIT = 3;
    static constexpr uint8_t DEFAULT_HIGH_WARN = 19;
    static constexpr uint8_t DEFAULT_HIGH_CRIT = 22;

    struct LevelUpdate {
        enum class Result : uint8_t {
            First,      // no previous level; delta is meaningless
            Rejected,   // below noise threshold; delta is 0
            Accepted
        };

        Result result;
        float delta;
        ErrorCode error;    // from the redraw, if one ran
    };

    // barCount is clamped to what the display provides
    explicit LevelMeter(IBarDisplay& display,
                        uint8_t barCount = DEFAULT_BAR_COUNT,
                        uint32_t fillupDecayMs = DEFAULT_FILLUP_DECAY_MS);

    // Set bounds and default noise. ConfigError if max <= min.
    ErrorCode begin(int min, int max);
    ErrorCode begin(float min, float max);

    // Change one bound and redraw. Noise is not rescaled;
    // call setNoiseDefault() afterwards if wanted.
    ErrorCode setMin(int min);
    ErrorCode setMin(float min);
    ErrorCode setMax(int max);
    ErrorCode setMax(float max);

    // NaN is Rejected with RangeError and never stored
    LevelUpdate setCurLevel(float level);

    void setNoise(float noise) { _noise = noise; }

    // Half a bar's worth of input range
    void setNoiseDefault();

    // Thresholds are bar counts in 1..barCount, or
    // THRESHOLD_DISABLED. RangeError leaves both unchanged.
    ErrorCode setLowWarnings(uint8_t warn = DEFAULT_LOW_WARN, uint8_t crit = DEFAULT_LOW_CRIT);
    ErrorCode setHighWarnings(uint8_t warn = DEFAULT_HIGH_WARN, uint8_t crit = DEFAULT_HIGH_CRIT);

    // Drives the rise decay; call from the main loop
    ErrorCode loop();

    // Forget the current level and stop the rise highlight
    void reset();

    // =====================================================
    // State Access
    // =====================================================

    bool hasLevel() const { return _hasLevel; }
    float currentLevel() const { return _currentLevel; }
    float minValue() const { return _min; }
    float maxValue() const { return _max; }
    float range() const { return _range; }
    float noise() const { return _noise; }
    uint8_t barCount() const { return _barCount; }
    uint8_t litBars() const { return _litBars; }
    bool isRising() const { return _fillupTimer.isArmed(); }

    uint8_t lowWarn() const { return _lowWarn; }
    uint8_t lowCrit() const { return _lowCrit; }
    uint8_t highWarn() const { return _highWarn; }
    uint8_t highCrit() const { return _highCrit; }

private:
    ErrorCode applyRange(float min, bool minIsInteger, float max, bool maxIsInteger);
    ErrorCode updateLevel(bool hasPrevious, float previousLevel);
    uint8_t computeBars() const;
    bool validThreshold(uint8_t bars) const;

    IBarDisplay& _display;
    uint8_t _barCount;
    uint32_t _fillupDecayMs;

    float _min;
    float _max;
    bool _minIsInteger;
    bool _maxIsInteger;
    float _range;
    float _noise;

    bool _hasLevel;
    float _currentLevel;
    uint8_t _litBars;

    uint8_t _lowWarn;
    uint8_t _lowCrit;
    uint8_t _highWarn;
    uint8_t _highCrit;

    OneShotTimer _fillupTimer;
};
