#pragma once
#include <stdint.h>

// =====================================================
// One-Shot Timer
// =====================================================
// Cooperative deadline driven by platform_millis().
// Nothing fires on its own: the owner calls poll() from
// its loop() and acts when it returns true. Arming a
// running timer replaces the pending deadline, so at
// most one expiry is ever outstanding.
// =====================================================

class OneShotTimer {
public:
    OneShotTimer();

    // (Re)start the countdown; cancels any pending deadline
    void arm(uint32_t delayMs);

    void cancel();

    bool isArmed() const { return _armed; }

    // Returns true exactly once when the deadline has
    // passed, and disarms the timer
    bool poll();

    // Time left before expiry (0 when disarmed or due)
    uint32_t remainingMs() const;

private:
    bool _armed;
    uint32_t _startMs;
    uint32_t _delayMs;
};
