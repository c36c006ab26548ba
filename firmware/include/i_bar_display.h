#pragma once
// =====================================================
// Bar Display Interface
// =====================================================
// Abstract capability the level meter draws through.
// Enables substituting a recording double in unit tests
// without a bus or a real HT16K33 backpack.
// =====================================================

#include <stdint.h>
#include "error_code.h"

// Bicolor segment state. Values are the red/green anode
// bit pair, so Orange is both LEDs lit.
enum class BarColor : uint8_t {
    Off    = 0x00,
    Red    = 0x01,
    Green  = 0x02,
    Orange = 0x03
};

// Hardware blink rates (ordinal is the register value)
enum class BlinkRate : uint8_t {
    NotBlinking = 0,
    Blink2Hz    = 1,
    Blink1Hz    = 2,
    BlinkHalfHz = 3
};

class IBarDisplay {
public:
    virtual ~IBarDisplay() = default;

    // Number of addressable bars
    virtual uint8_t barCount() const = 0;

    // Buffered: no bus I/O until updateBars()
    virtual ErrorCode setBar(uint8_t index, BarColor color) = 0;

    // Transmit all buffered bar state in one write
    virtual ErrorCode updateBars() = 0;

    // Immediate writes
    virtual ErrorCode setBrightness(uint8_t level) = 0;
    virtual ErrorCode setBlinkRate(BlinkRate rate) = 0;

    // All bars off, full brightness, not blinking
    virtual ErrorCode clear() = 0;
};
