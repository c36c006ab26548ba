#pragma once
// =====================================================
// Application Class
// =====================================================
// Owns the bar graph, the level meter and the console,
// and feeds the meter from the analog input.
//
// Usage:
//   Application app;
//   app.init();
//   while (true) { app.loop(); }
// =====================================================

#include <stdint.h>
#include "bar_graph.h"
#include "level_meter.h"
#include "usb_serial.h"

class Application {
public:
    Application();

    // Initialize all components (call once at startup)
    void init();

    // Main loop iteration (call repeatedly)
    void loop();

    // =====================================================
    // Component Access (for testing/debugging)
    // =====================================================

    BarGraph& getBarGraph() { return _barGraph; }
    LevelMeter& getMeter() { return _meter; }

private:
    // =====================================================
    // Internal Helpers
    // =====================================================

    bool startDisplay();
    void configureMeter();
    void sampleInput(uint32_t nowMs);
    void report(const char* what, ErrorCode err);

    // =====================================================
    // Components
    // =====================================================

    BarGraph _barGraph;
    LevelMeter _meter;
    UsbCommandHandler _usb;

    // =====================================================
    // State
    // =====================================================

    bool _displayReady;
    uint32_t _lastSampleMs;
    uint32_t _lastStartAttemptMs;

    static constexpr uint32_t DISPLAY_RETRY_INTERVAL_MS = 1000;
};
