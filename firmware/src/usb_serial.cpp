#include "usb_serial.h"
#include "device_id.h"
#include "debug_log.h"
#include "fw_config.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <cerrno>
#include <climits>
#include <cstdlib>  // for strtol, strtof
#include <string.h>

// ========= util =========
bool UsbCommandHandler::parseFloat(const char* tok, float& out) {
    if (!tok || *tok == '\0') return false;
    char* end = nullptr;
    float v = strtof(tok, &end);
    if (end == tok || *end != '\0') return false;
    out = v;
    return true;
}

bool UsbCommandHandler::parseLong(const char* tok, long& out) {
    if (!tok || *tok == '\0') return false;
    char* end = nullptr;
    errno = 0;
    long v = strtol(tok, &end, 10);
    if (end == tok || *end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

bool UsbCommandHandler::isIntegerToken(const char* tok) {
    for (const char* p = tok; *p; ++p) {
        if (*p == '.' || *p == 'e' || *p == 'E') return false;
    }
    return true;
}

bool UsbCommandHandler::isDefaultToken(const char* tok) {
    static const char kDefault[] = "DEFAULT";
    size_t i = 0;
    for (; tok[i]; ++i) {
        char c = tok[i];
        if (c >= 'a' && c <= 'z')
            c = c - 'a' + 'A';
        if (i >= sizeof(kDefault) - 1 || c != kDefault[i])
            return false;
    }
    return i == sizeof(kDefault) - 1;
}

UsbCommandHandler::UsbCommandHandler(LevelMeter& meter, BarGraph& display)
    : _meter(meter)
    , _display(display)
{
    _buf[0] = '\0';
}

void UsbCommandHandler::begin(uint32_t baud)
{
    platform_serial_begin(baud);

    // STM32 USB CDC needs time to enumerate; drop any
    // noise received meanwhile so the first command parses
    platform_delay_ms(500);
    uint32_t flushStart = platform_millis();
    while (platform_serial_available() > 0 && (platform_millis() - flushStart < 100)) {
        platform_serial_read();
    }

    _len = 0;
    _overflow = false;
}

// Call inside loop()
void UsbCommandHandler::poll()
{
    while (platform_serial_available() > 0)
    {
        int c = platform_serial_read();
        if (c < 0) break;  // No data available

        // Support \r\n / \n as line endings
        if (c == '\r')
            continue;

        if (c == '\n')
        {
            _buf[_len] = '\0';
            if (_len > 0 && !_overflow)
            {
                handleLine(_buf);
            }
            _len = 0;
            _overflow = false;
        }
        else if (!_overflow)
        {
            if (_len < CMD_BUF_SIZE - 1)
            {
                _buf[_len++] = (char)c;
            }
            else
            {
                // Too long: drop everything up to the next newline
                DEBUG_WARN("console line too long, discarded");
                replyError("line too long");
                _len = 0;
                _overflow = true;
            }
        }
    }
}

void UsbCommandHandler::handleLine(const char* line)
{
    // Skip leading whitespace
    while (*line == ' ' || *line == '\t')
        line++;
    if (*line == '\0')
        return;

    char tmp[CMD_BUF_SIZE];
    strncpy(tmp, line, CMD_BUF_SIZE - 1);
    tmp[CMD_BUF_SIZE - 1] = '\0';

    char* cmd = strtok(tmp, " \t");
    if (!cmd)
        return;

    for (char* p = cmd; *p; ++p)
    {
        if (*p >= 'a' && *p <= 'z')
            *p = *p - 'a' + 'A';
    }

    char* arg1 = strtok(nullptr, " \t");
    char* arg2 = strtok(nullptr, " \t");

    if (strcmp(cmd, "HELLO") == 0) {
        cmdHello();
    } else if (strcmp(cmd, "GET_STATE") == 0) {
        cmdGetState();
    } else if (strcmp(cmd, "LEVEL") == 0) {
        cmdLevel(arg1);
    } else if (strcmp(cmd, "AUTO") == 0) {
        cmdAuto();
    } else if (strcmp(cmd, "MIN") == 0) {
        cmdBound(cmd, arg1, false);
    } else if (strcmp(cmd, "MAX") == 0) {
        cmdBound(cmd, arg1, true);
    } else if (strcmp(cmd, "NOISE") == 0) {
        cmdNoise(arg1);
    } else if (strcmp(cmd, "LOW_WARN") == 0) {
        cmdWarnings(cmd, arg1, arg2, false);
    } else if (strcmp(cmd, "HIGH_WARN") == 0) {
        cmdWarnings(cmd, arg1, arg2, true);
    } else if (strcmp(cmd, "BRIGHTNESS") == 0) {
        cmdBrightness(arg1);
    } else if (strcmp(cmd, "BLINK") == 0) {
        cmdBlink(arg1);
    } else if (strcmp(cmd, "CLEAR") == 0) {
        cmdClear();
    } else {
        platform_serial_print("{\"event\":\"error\",\"msg\":\"unknown command: ");
        platform_serial_print(cmd);
        platform_serial_println("\"}");
        platform_serial_flush();
    }
}

// ========= replies =========

void UsbCommandHandler::replyAck(const char* cmd)
{
    platform_serial_print("{\"event\":\"ack\",\"cmd\":\"");
    platform_serial_print(cmd);
    platform_serial_println("\"}");
    platform_serial_flush();
}

void UsbCommandHandler::replyError(const char* msg)
{
    platform_serial_print("{\"event\":\"error\",\"msg\":\"");
    platform_serial_print(msg);
    platform_serial_println("\"}");
    platform_serial_flush();
}

void UsbCommandHandler::replyFailure(const char* cmd, ErrorCode err)
{
    platform_serial_print("{\"event\":\"error\",\"cmd\":\"");
    platform_serial_print(cmd);
    platform_serial_print("\",\"msg\":\"");
    platform_serial_print(errorCodeName(err));
    if (err == ErrorCode::BusWriteError) {
        platform_serial_print("\",\"bus_error\":");
        platform_serial_print(_display.lastBusError());
        platform_serial_println("}");
    } else {
        platform_serial_println("\"}");
    }
    platform_serial_flush();
}

// ========= commands =========

void UsbCommandHandler::cmdHello()
{
    char hexId[DEVICE_UID_HEX_LEN + 1];
    getDeviceUidHex(hexId);

    platform_serial_print("{\"event\":\"hello\"");
    platform_serial_print(",\"device_id\":\"");
    platform_serial_print(hexId);

    platform_serial_print("\",\"fw\":\"");
    platform_serial_print(FW_NAME " " FW_VERSION_STRING);

    platform_serial_print("\",\"build\":\"");
    platform_serial_print(FW_BUILD_DATE " " FW_BUILD_TIME);

    platform_serial_print("\",\"hash\":\"");
    platform_serial_print(FW_BUILD_HASH);
    platform_serial_println("\"}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdGetState()
{
    platform_serial_print("{\"event\":\"state\",\"level\":");
    if (_meter.hasLevel()) {
        platform_serial_print_float(_meter.currentLevel(), 3);
    } else {
        platform_serial_print("null");
    }
    platform_serial_print(",\"min\":");
    platform_serial_print_float(_meter.minValue(), 3);
    platform_serial_print(",\"max\":");
    platform_serial_print_float(_meter.maxValue(), 3);
    platform_serial_print(",\"noise\":");
    platform_serial_print_float(_meter.noise(), 3);
    platform_serial_print(",\"bars\":");
    platform_serial_print((uint32_t)_meter.litBars());
    platform_serial_print(",\"low_warn\":");
    platform_serial_print((uint32_t)_meter.lowWarn());
    platform_serial_print(",\"low_crit\":");
    platform_serial_print((uint32_t)_meter.lowCrit());
    platform_serial_print(",\"high_warn\":");
    platform_serial_print((uint32_t)_meter.highWarn());
    platform_serial_print(",\"high_crit\":");
    platform_serial_print((uint32_t)_meter.highCrit());
    platform_serial_print(",\"rising\":");
    platform_serial_print(_meter.isRising() ? "true" : "false");
    platform_serial_print(",\"input\":\"");
    platform_serial_print(_manualInput ? "manual" : "auto");
    platform_serial_print("\",\"bus_error\":");
    platform_serial_print(_display.lastBusError());
    platform_serial_println("}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdLevel(const char* arg)
{
    float level;
    if (!parseFloat(arg, level)) {
        replyError("LEVEL args");
        return;
    }

    _manualInput = true;
    LevelMeter::LevelUpdate update = _meter.setCurLevel(level);
    if (update.error != ErrorCode::None) {
        replyFailure("LEVEL", update.error);
        return;
    }

    platform_serial_print("{\"event\":\"level\",\"result\":\"");
    switch (update.result) {
        case LevelMeter::LevelUpdate::Result::First:
            platform_serial_print("first\"");
            break;
        case LevelMeter::LevelUpdate::Result::Rejected:
            platform_serial_print("rejected\"");
            break;
        case LevelMeter::LevelUpdate::Result::Accepted:
        default:
            platform_serial_print("accepted\",\"delta\":");
            platform_serial_print_float(update.delta, 3);
            break;
    }
    platform_serial_print(",\"bars\":");
    platform_serial_print((uint32_t)_meter.litBars());
    platform_serial_println("}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdAuto()
{
    _manualInput = false;
    replyAck("AUTO");
}

void UsbCommandHandler::cmdBound(const char* cmd, const char* arg, bool isMax)
{
    ErrorCode err;
    if (arg && isIntegerToken(arg)) {
        long v;
        if (!parseLong(arg, v) || v < INT_MIN || v > INT_MAX) {
            replyError(isMax ? "MAX args" : "MIN args");
            return;
        }
        err = isMax ? _meter.setMax((int)v) : _meter.setMin((int)v);
    } else {
        float v;
        if (!parseFloat(arg, v)) {
            replyError(isMax ? "MAX args" : "MIN args");
            return;
        }
        err = isMax ? _meter.setMax(v) : _meter.setMin(v);
    }

    if (err != ErrorCode::None) {
        replyFailure(cmd, err);
        return;
    }
    replyAck(cmd);
}

void UsbCommandHandler::cmdNoise(const char* arg)
{
    if (arg && isDefaultToken(arg)) {
        _meter.setNoiseDefault();
        replyAck("NOISE");
        return;
    }

    float v;
    if (!parseFloat(arg, v) || v < 0.0f) {
        replyError("NOISE args");
        return;
    }
    _meter.setNoise(v);
    replyAck("NOISE");
}

void UsbCommandHandler::cmdWarnings(const char* cmd, const char* warnArg, const char* critArg, bool high)
{
    long warn;
    long crit;
    if (!parseLong(warnArg, warn) || !parseLong(critArg, crit) ||
        warn < 0 || warn > 255 || crit < 0 || crit > 255) {
        replyError(high ? "HIGH_WARN args" : "LOW_WARN args");
        return;
    }

    ErrorCode err = high ? _meter.setHighWarnings((uint8_t)warn, (uint8_t)crit)
                         : _meter.setLowWarnings((uint8_t)warn, (uint8_t)crit);
    if (err != ErrorCode::None) {
        replyFailure(cmd, err);
        return;
    }
    replyAck(cmd);
}

void UsbCommandHandler::cmdBrightness(const char* arg)
{
    long level;
    if (!parseLong(arg, level) || level < 0 || level > 255) {
        replyError("BRIGHTNESS args");
        return;
    }

    ErrorCode err = _display.setBrightness((uint8_t)level);
    if (err != ErrorCode::None) {
        replyFailure("BRIGHTNESS", err);
        return;
    }
    replyAck("BRIGHTNESS");
}

void UsbCommandHandler::cmdBlink(const char* arg)
{
    long rate;
    if (!parseLong(arg, rate) || rate < 0 || rate > 255) {
        replyError("BLINK args");
        return;
    }

    // Out-of-range ordinals are rejected by the display
    ErrorCode err = _display.setBlinkRate(static_cast<BlinkRate>(rate));
    if (err != ErrorCode::None) {
        replyFailure("BLINK", err);
        return;
    }
    replyAck("BLINK");
}

void UsbCommandHandler::cmdClear()
{
    _meter.reset();
    ErrorCode err = _display.clear();
    if (err != ErrorCode::None) {
        replyFailure("CLEAR", err);
        return;
    }
    replyAck("CLEAR");
}
