#include "one_shot_timer.h"
#include "platform_timing.h"

OneShotTimer::OneShotTimer()
    : _armed(false)
    , _startMs(0)
    , _delayMs(0)
{
}

void OneShotTimer::arm(uint32_t delayMs) {
    _armed = true;
    _startMs = platform_millis();
    _delayMs = delayMs;
}

void OneShotTimer::cancel() {
    _armed = false;
}

bool OneShotTimer::poll() {
    if (!_armed) {
        return false;
    }

    uint32_t elapsed = platform_millis() - _startMs;
    if (elapsed >= _delayMs) {
        _armed = false;
        return true;
    }
    return false;
}

uint32_t OneShotTimer::remainingMs() const {
    if (!_armed) {
        return 0;
    }

    uint32_t elapsed = platform_millis() - _startMs;
    return elapsed >= _delayMs ? 0 : _delayMs - elapsed;
}
