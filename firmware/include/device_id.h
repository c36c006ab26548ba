#pragma once
#include <stdint.h>
#include <cstddef>  // for size_t

#include "platform_device.h"

constexpr size_t DEVICE_UID_LEN = PLATFORM_DEVICE_UID_SIZE;   // STM32 UID = 96 bits
constexpr size_t DEVICE_UID_HEX_LEN = DEVICE_UID_LEN * 2;

// Device UID as an uppercase hex string (null-terminated),
// reported by the console HELLO command
void getDeviceUidHex(char out[DEVICE_UID_HEX_LEN + 1]);
