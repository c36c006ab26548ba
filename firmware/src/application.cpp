#include "application.h"
#include "board_config.h"
#include "meter_config.h"
#include "debug_log.h"
#include "fw_config.h"
#include "i2c_bus_hal.h"
#include "platform_adc.h"
#include "platform_i2c.h"
#include "platform_timing.h"

Application::Application()
    : _barGraph(createI2cBus(), BARGRAPH_I2C_ADDRESS, BARGRAPH_RETRY_LIMIT)
    , _meter(_barGraph, METER_BAR_COUNT, METER_FILLUP_DECAY_MS)
    , _usb(_meter, _barGraph)
    , _displayReady(false)
    , _lastSampleMs(0)
    , _lastStartAttemptMs(0)
{
}

void Application::init() {
    platform_timing_init();

    // Console first so startup problems are visible
    _usb.begin(USB_SERIAL_BAUD);
    DEBUG_INFO("boot " FW_NAME " " FW_VERSION_STRING);

    platform_i2c_begin(BARGRAPH_I2C_CLOCK_HZ);
    platform_adc_begin(LEVEL_INPUT_ADC_BITS);

    configureMeter();
    _displayReady = startDisplay();
    _lastStartAttemptMs = platform_millis();
}

void Application::loop() {
    uint32_t nowMs = platform_millis();

    _usb.poll();

    // Keep trying until the backpack answers
    if (!_displayReady) {
        if (nowMs - _lastStartAttemptMs >= DISPLAY_RETRY_INTERVAL_MS) {
            _lastStartAttemptMs = nowMs;
            _displayReady = startDisplay();
        }
        platform_delay_ms(1);
        return;
    }

    if (!_usb.isManualInput()) {
        sampleInput(nowMs);
    }

    report("meter decay", _meter.loop());

    platform_delay_ms(1);
}

// =====================================================
// Startup
// =====================================================

bool Application::startDisplay() {
    ErrorCode err = _barGraph.begin();
    if (err != ErrorCode::None) {
        report("display begin", err);
        return false;
    }

    DEBUG_INFO_F("bargraph ready at 0x%02X", (unsigned)BARGRAPH_I2C_ADDRESS);
    return true;
}

void Application::configureMeter() {
    // No level yet, so none of these touch the bus
    report("meter range", _meter.begin(METER_INPUT_MIN, METER_INPUT_MAX));
    report("meter low warnings", _meter.setLowWarnings(METER_LOW_WARN, METER_LOW_CRIT));
    report("meter high warnings", _meter.setHighWarnings(METER_HIGH_WARN, METER_HIGH_CRIT));

    DEBUG_INFO_F("meter %u bars, range %d..%d, noise %d",
                 (unsigned)_meter.barCount(), METER_INPUT_MIN, METER_INPUT_MAX,
                 (int)_meter.noise());
}

// =====================================================
// Input
// =====================================================

void Application::sampleInput(uint32_t nowMs) {
    if (nowMs - _lastSampleMs < METER_SAMPLE_INTERVAL_MS) {
        return;
    }
    _lastSampleMs = nowMs;

    uint32_t raw = platform_adc_read(LEVEL_INPUT_PIN);
    LevelMeter::LevelUpdate update = _meter.setCurLevel((float)raw);
    report("meter update", update.error);
}

void Application::report(const char* what, ErrorCode err) {
    if (err == ErrorCode::None) {
        return;
    }

    if (err == ErrorCode::BusWriteError) {
        DEBUG_ERROR_F("%s failed: %s (bus error %d)", what, errorCodeName(err),
                      _barGraph.lastBusError());
    } else {
        DEBUG_ERROR_F("%s failed: %s", what, errorCodeName(err));
    }
}
