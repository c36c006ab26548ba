// Platform timing implementation for Arduino framework
#include "platform_timing.h"
#include <Arduino.h>

void platform_timing_init() {
    // Arduino starts SysTick before setup(); nothing to do
}

uint32_t platform_millis() {
    return millis();
}

void platform_delay_ms(uint32_t ms) {
    delay(ms);
}
