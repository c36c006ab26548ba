// =====================================================
// Platform Device - Arduino/STM32 Implementation
// =====================================================
// Arduino STM32 cores ship the HAL headers, so the UID
// registers are read through HAL_GetUIDw0/1/2.
// =====================================================

#include "platform_device.h"
#include "stm32l0xx_hal.h"

static void putWordBigEndian(uint8_t* out, uint32_t w) {
    out[0] = (w >> 24) & 0xFF;
    out[1] = (w >> 16) & 0xFF;
    out[2] = (w >>  8) & 0xFF;
    out[3] = (w >>  0) & 0xFF;
}

void platform_get_device_uid(uint8_t out[PLATFORM_DEVICE_UID_SIZE]) {
    putWordBigEndian(out + 0, HAL_GetUIDw0());
    putWordBigEndian(out + 4, HAL_GetUIDw1());
    putWordBigEndian(out + 8, HAL_GetUIDw2());
}
