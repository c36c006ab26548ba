#include "bar_graph.h"
#include "debug_log.h"

BarGraph::BarGraph(II2cBus* bus, uint8_t address, uint8_t retryLimit)
    : _bus(bus)
    , _address((uint8_t)(address << 1))
    , _retryLimit(retryLimit == 0 ? 1 : retryLimit)
    , _lastBusError(0)
    , _buffer{0, 0, 0}
{
}

ErrorCode BarGraph::begin() {
    ErrorCode err = writeCommand(CMD_OSCILLATOR_ON);
    if (err != ErrorCode::None) {
        return err;
    }
    return clear();
}

// =====================================================
// Display Buffer
// =====================================================

void BarGraph::barPosition(uint8_t index, uint8_t& row, uint8_t& col) {
    if (index < 12) {
        row = index / 4;
        col = index % 4;
    } else {
        row = index / 4 - 3;
        col = index % 4 + 4;
    }
}

ErrorCode BarGraph::setBar(uint8_t index, BarColor color) {
    if (index >= BAR_COUNT) {
        return ErrorCode::RangeError;
    }

    uint8_t row;
    uint8_t col;
    barPosition(index, row, col);

    const uint16_t redBit = (uint16_t)(1u << col);
    const uint16_t greenBit = (uint16_t)(1u << (col + 8));
    const uint8_t bits = static_cast<uint8_t>(color);

    if (bits & static_cast<uint8_t>(BarColor::Red)) {
        _buffer[row] |= redBit;
    } else {
        _buffer[row] &= (uint16_t)~redBit;
    }

    if (bits & static_cast<uint8_t>(BarColor::Green)) {
        _buffer[row] |= greenBit;
    } else {
        _buffer[row] &= (uint16_t)~greenBit;
    }

    return ErrorCode::None;
}

BarColor BarGraph::getBar(uint8_t index) const {
    if (index >= BAR_COUNT) {
        return BarColor::Off;
    }

    uint8_t row;
    uint8_t col;
    barPosition(index, row, col);

    uint8_t bits = 0;
    if (_buffer[row] & (1u << col)) {
        bits |= static_cast<uint8_t>(BarColor::Red);
    }
    if (_buffer[row] & (1u << (col + 8))) {
        bits |= static_cast<uint8_t>(BarColor::Green);
    }
    return static_cast<BarColor>(bits);
}

ErrorCode BarGraph::updateBars() {
    // Pointer reset followed by the row words, low byte first
    uint8_t payload[1 + BUFFER_WORDS * 2];
    payload[0] = CMD_DISPLAY_POINTER;
    for (size_t i = 0; i < BUFFER_WORDS; ++i) {
        payload[1 + 2 * i] = (uint8_t)(_buffer[i] & 0xFF);
        payload[2 + 2 * i] = (uint8_t)((_buffer[i] >> 8) & 0xFF);
    }
    return writeWithRetry(payload, sizeof(payload));
}

// =====================================================
// Immediate Commands
// =====================================================

ErrorCode BarGraph::setBrightness(uint8_t level) {
    if (level > MAX_BRIGHTNESS) {
        return ErrorCode::RangeError;
    }
    return writeCommand((uint8_t)(CMD_BRIGHTNESS | level));
}

ErrorCode BarGraph::setBlinkRate(BlinkRate rate) {
    uint8_t ordinal = static_cast<uint8_t>(rate);
    if (ordinal > static_cast<uint8_t>(BlinkRate::BlinkHalfHz)) {
        return ErrorCode::RangeError;
    }
    return writeCommand((uint8_t)(CMD_BLINK | (ordinal << 1)));
}

ErrorCode BarGraph::clear() {
    for (size_t i = 0; i < BUFFER_WORDS; ++i) {
        _buffer[i] = 0;
    }

    ErrorCode err = updateBars();
    if (err != ErrorCode::None) {
        return err;
    }
    err = setBrightness(MAX_BRIGHTNESS);
    if (err != ErrorCode::None) {
        return err;
    }
    return setBlinkRate(BlinkRate::NotBlinking);
}

// =====================================================
// Bus Writes
// =====================================================

ErrorCode BarGraph::writeCommand(uint8_t command) {
    return writeWithRetry(&command, 1);
}

ErrorCode BarGraph::writeWithRetry(const uint8_t* data, size_t len) {
    const bool isOscillatorEnable = (len == 1 && data[0] == CMD_OSCILLATOR_ON);

    for (uint8_t attempt = 1; attempt <= _retryLimit; ++attempt) {
        int status = _bus->write(_address, data, len);
        if (status == 0) {
            _lastBusError = 0;
            return ErrorCode::None;
        }

        _lastBusError = status;
        DEBUG_WARN_F("bargraph write 0x%02X failed (attempt %u/%u, bus error %d)",
                     data[0], (unsigned)attempt, (unsigned)_retryLimit, status);
        recover(isOscillatorEnable);
    }

    DEBUG_ERROR_F("bargraph write 0x%02X gave up, bus error %d", data[0], _lastBusError);
    return ErrorCode::BusWriteError;
}

void BarGraph::recover(bool failedOscillatorEnable) {
    // Single attempts; a failure here shows up on the retry itself
    uint8_t standby = CMD_STANDBY;
    int status = _bus->write(_address, &standby, 1);
    if (status != 0) {
        DEBUG_WARN_F("bargraph standby failed, bus error %d", status);
    }

    if (!failedOscillatorEnable) {
        uint8_t oscillatorOn = CMD_OSCILLATOR_ON;
        status = _bus->write(_address, &oscillatorOn, 1);
        if (status != 0) {
            DEBUG_WARN_F("bargraph oscillator re-enable failed, bus error %d", status);
        }
    }
}
