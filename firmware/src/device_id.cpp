#include "device_id.h"

static char hexDigit(uint8_t v) {
    return v < 10 ? ('0' + v) : ('A' + (v - 10));
}

void getDeviceUidHex(char out[DEVICE_UID_HEX_LEN + 1]) {
    uint8_t raw[DEVICE_UID_LEN];
    platform_get_device_uid(raw);

    for (size_t i = 0; i < DEVICE_UID_LEN; ++i) {
        out[2 * i]     = hexDigit((raw[i] >> 4) & 0x0F);
        out[2 * i + 1] = hexDigit(raw[i] & 0x0F);
    }
    out[DEVICE_UID_HEX_LEN] = '\0';
}
