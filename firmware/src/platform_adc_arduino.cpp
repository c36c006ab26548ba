// Platform ADC implementation for Arduino framework
#include "platform_adc.h"
#include <Arduino.h>

void platform_adc_begin(uint8_t resolutionBits) {
    analogReadResolution(resolutionBits);
}

uint32_t platform_adc_read(uint32_t pin) {
    return (uint32_t)analogRead(pin);
}
