#pragma once
// =====================================================
// Platform Device Abstraction
// =====================================================
// Identifies the board on the USB console so a host can
// tell several meters apart.
// =====================================================

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Device UID size (STM32 = 96 bits = 12 bytes)
#define PLATFORM_DEVICE_UID_SIZE 12

// Read device unique ID (big-endian, stable across resets)
void platform_get_device_uid(uint8_t out[PLATFORM_DEVICE_UID_SIZE]);

#ifdef __cplusplus
}
#endif
