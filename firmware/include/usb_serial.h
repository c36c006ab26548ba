#pragma once
#include <stdint.h>
#include <stddef.h>

#include "bar_graph.h"
#include "level_meter.h"

// Line-based USB serial console for the meter.
// Replies are single-line JSON objects.
//
// Usage:
//   UsbCommandHandler usb(meter, barGraph);
//   usb.begin(115200);
//   Call usb.poll() inside loop()
//
// Commands (case-insensitive):
//   HELLO
//   GET_STATE
//   LEVEL <value>            manual input mode
//   AUTO                     resume analog sampling
//   MIN <value> / MAX <value>
//   NOISE <value|DEFAULT>
//   LOW_WARN <warn> <crit> / HIGH_WARN <warn> <crit>
//   BRIGHTNESS <0-15>
//   BLINK <0-3>
//   CLEAR
class UsbCommandHandler {
public:
    UsbCommandHandler(LevelMeter& meter, BarGraph& display);

    // Initialize serial (adjust baud if needed)
    void begin(uint32_t baud = 115200);

    // Call periodically to process input and output responses
    void poll();

    // True while levels come from the console instead of the ADC
    bool isManualInput() const { return _manualInput; }

private:
    static constexpr size_t CMD_BUF_SIZE = 96;
    char _buf[CMD_BUF_SIZE];
    size_t _len = 0;
    bool _overflow = false;

    LevelMeter& _meter;
    BarGraph& _display;
    bool _manualInput = false;

    void handleLine(const char* line);

    // commands
    void cmdHello();
    void cmdGetState();
    void cmdLevel(const char* arg);
    void cmdAuto();
    void cmdBound(const char* cmd, const char* arg, bool isMax);
    void cmdNoise(const char* arg);
    void cmdWarnings(const char* cmd, const char* warnArg, const char* critArg, bool high);
    void cmdBrightness(const char* arg);
    void cmdBlink(const char* arg);
    void cmdClear();

    // replies
    void replyAck(const char* cmd);
    void replyError(const char* msg);
    void replyFailure(const char* cmd, ErrorCode err);

    // utils
    static bool parseFloat(const char* tok, float& out);
    static bool parseLong(const char* tok, long& out);
    static bool isIntegerToken(const char* tok);
    static bool isDefaultToken(const char* tok);
};
