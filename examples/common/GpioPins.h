/// @file GpioPins.h
/// @brief GPIO adapter mapping board pins to the bridge ui_in/uo_out bytes
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include "I2cSpiBridge/PinMap.h"

namespace gpio {

/// Board pin numbers (-1 = not connected)
struct BridgePins {
  int scl = -1;
  int sda = -1;
  int spiSclk = -1;
  int spiMosi = -1;
  int spiCsN = -1;
  int busyLed = -1;
  int rstN = -1;
};

/// Samples the I2C pins and drives the SPI pins once per bridge tick.
/// SDA is emulated open-drain: OUTPUT LOW while the bridge pulls it,
/// INPUT (released to the external pull-up) otherwise.
class BridgePort {
public:
  /// Configure pin directions and idle levels
  /// @param pins Board pin numbers
  /// @param idleOut uo_out byte to start from (SCLK idles high in modes 2/3)
  /// @return false if a required pin is not set
  bool begin(const BridgePins& pins,
             uint8_t idleOut = I2cSpiBridge::pins::OUT_IDLE) {
    using namespace I2cSpiBridge::pins;
    _pins = pins;
    if (_pins.scl < 0 || _pins.sda < 0 || _pins.spiSclk < 0 ||
        _pins.spiMosi < 0 || _pins.spiCsN < 0) {
      return false;
    }

    pinMode(_pins.scl, INPUT);
    pinMode(_pins.sda, INPUT);
    _sdaDriven = false;

    pinMode(_pins.spiCsN, OUTPUT);
    digitalWrite(_pins.spiCsN, (idleOut & OUT_SPI_CS_N) ? HIGH : LOW);
    pinMode(_pins.spiSclk, OUTPUT);
    digitalWrite(_pins.spiSclk, (idleOut & OUT_SPI_SCLK) ? HIGH : LOW);
    pinMode(_pins.spiMosi, OUTPUT);
    digitalWrite(_pins.spiMosi, (idleOut & OUT_SPI_MOSI) ? HIGH : LOW);

    if (_pins.busyLed >= 0) {
      pinMode(_pins.busyLed, OUTPUT);
      digitalWrite(_pins.busyLed, (idleOut & OUT_BUSY) ? HIGH : LOW);
    }
    if (_pins.rstN >= 0) {
      pinMode(_pins.rstN, INPUT_PULLUP);
    }
    _lastOut = idleOut;
    _ready = true;
    return true;
  }

  /// @return ui_in byte from the current SCL/SDA levels
  uint8_t read() const {
    uint8_t in = 0;
    if (!_ready) {
      return I2cSpiBridge::pins::IN_BUS_IDLE;
    }
    if (digitalRead(_pins.scl) == HIGH) in |= I2cSpiBridge::pins::IN_SCL;
    if (digitalRead(_pins.sda) == HIGH) in |= I2cSpiBridge::pins::IN_SDA;
    return in;
  }

  /// @return reset level (true = released, also when no reset pin)
  bool readRstN() const {
    if (!_ready || _pins.rstN < 0) {
      return true;
    }
    return digitalRead(_pins.rstN) == HIGH;
  }

  /// Drive the outputs from a uo_out byte; only changed pins are touched
  void write(uint8_t uoOut) {
    using namespace I2cSpiBridge::pins;
    if (!_ready) {
      return;
    }

    const bool pullSda = (uoOut & OUT_SDA_OE) != 0;
    if (pullSda != _sdaDriven) {
      if (pullSda) {
        pinMode(_pins.sda, OUTPUT);
        digitalWrite(_pins.sda, LOW);
      } else {
        pinMode(_pins.sda, INPUT);
      }
      _sdaDriven = pullSda;
    }

    const uint8_t changed = static_cast<uint8_t>(uoOut ^ _lastOut);
    if (changed & OUT_SPI_CS_N) {
      digitalWrite(_pins.spiCsN, (uoOut & OUT_SPI_CS_N) ? HIGH : LOW);
    }
    if (changed & OUT_SPI_SCLK) {
      digitalWrite(_pins.spiSclk, (uoOut & OUT_SPI_SCLK) ? HIGH : LOW);
    }
    if (changed & OUT_SPI_MOSI) {
      digitalWrite(_pins.spiMosi, (uoOut & OUT_SPI_MOSI) ? HIGH : LOW);
    }
    if ((changed & OUT_BUSY) && _pins.busyLed >= 0) {
      digitalWrite(_pins.busyLed, (uoOut & OUT_BUSY) ? HIGH : LOW);
    }
    _lastOut = uoOut;
  }

  /// true while SDA is switched to OUTPUT LOW
  bool sdaDriven() const { return _sdaDriven; }

private:
  BridgePins _pins;
  bool _ready = false;
  bool _sdaDriven = false;
  uint8_t _lastOut = I2cSpiBridge::pins::OUT_IDLE;
};

} // namespace gpio
