/// @file BusHarness.h
/// @brief Test-side I2C master bit-banger and SPI capture for the bridge
/// @note NOT part of the library - tests only
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include "I2cSpiBridge/I2cSpiBridge.h"

namespace harness {

using I2cSpiBridge::Bridge;
using I2cSpiBridge::SpiMode;

/// Half of one I2C bit period in system ticks (250 kHz bus on a 10 MHz clock)
static constexpr uint32_t BIT_HALF = 20;

/// SPI receiver: samples MOSI on the sampling edge of the mode while CS is low
class SpiMonitor {
public:
  explicit SpiMonitor(SpiMode mode = SpiMode::MODE_0)
      : _mode(mode), _lastSclk(I2cSpiBridge::spiCpol(mode)) {}

  void setMode(SpiMode mode) {
    _mode = mode;
    _lastSclk = I2cSpiBridge::spiCpol(mode);
  }

  /// Feed the pins after every tick
  void observe(bool csN, bool sclk, bool mosi) {
    if (!csN && _lastCsN) {
      csAssertCount++;
      _bits = 0;
      _shift = 0;
      _current.clear();
    }
    if (csN && !_lastCsN) {
      csDeassertCount++;
      if (_bits != 0) {
        partialFrames++;
      }
      if (!_current.empty()) {
        frames.push_back(_current);
      }
      _current.clear();
    }

    if (!csN && sclk != _lastSclk) {
      const bool idle = I2cSpiBridge::spiCpol(_mode);
      const bool leading = (_lastSclk == idle);
      const bool sampleEdge = I2cSpiBridge::spiCpha(_mode) ? !leading : leading;
      if (sampleEdge) {
        _shift = static_cast<uint8_t>((_shift << 1) | (mosi ? 1 : 0));
        if (++_bits == 8) {
          _current.push_back(_shift);
          _bits = 0;
          _shift = 0;
        }
      }
    }
    if (csN && sclk != _lastSclk) {
      _strayEdges++;
    }
    if (!csN) {
      csLowTicks++;
    }

    _lastCsN = csN;
    _lastSclk = sclk;
  }

  /// Clock edges seen while CS was high
  uint32_t strayEdges() const { return _strayEdges; }

  std::vector<std::vector<uint8_t>> frames;
  uint32_t csAssertCount = 0;
  uint32_t csDeassertCount = 0;
  uint32_t csLowTicks = 0;
  uint32_t partialFrames = 0;

private:
  SpiMode _mode;
  bool _lastCsN = true;
  bool _lastSclk;
  uint8_t _shift = 0;
  uint8_t _bits = 0;
  uint32_t _strayEdges = 0;
  std::vector<uint8_t> _current;
};

/// Bit-banging I2C master that advances the bridge one tick at a time.
///
/// Each bit holds SDA with SCL low for BIT_HALF, SCL high for 2 * BIT_HALF,
/// then SCL low for BIT_HALF. The ACK
/// is read from the SDA output-enable pin BIT_HALF ticks into the 9th SCL
/// high phase. With wiredAnd set, the device's pull-down is also folded into
/// the SDA level the bridge sees.
class I2cMasterDriver {
public:
  explicit I2cMasterDriver(Bridge& bridge, bool wiredAnd = false)
      : _bridge(bridge), _wiredAnd(wiredAnd) {
    spi.setMode(bridge.config().spiMode);
  }

  /// Hold SCL/SDA for a number of ticks
  void hold(bool scl, bool sda, uint32_t ticks) {
    _scl = scl;
    _sda = sda;
    for (uint32_t i = 0; i < ticks; ++i) {
      step();
    }
  }

  /// Advance with the lines unchanged
  void idle(uint32_t ticks) { hold(_scl, _sda, ticks); }

  /// Advance one tick
  void step() {
    bool sdaLine = _sda;
    if (_wiredAnd && _bridge.sdaOe()) {
      sdaLine = false;
    }
    uint8_t uiIn = 0;
    if (_scl) uiIn |= I2cSpiBridge::pins::IN_SCL;
    if (sdaLine) uiIn |= I2cSpiBridge::pins::IN_SDA;
    _bridge.tick(uiIn, _rstN);
    tickCount++;

    if (_bridge.sdaOe()) oeTicks++;
    spi.observe(_bridge.spiCsN(), _bridge.spiSclk(), _bridge.spiMosi());
    _lastSdaLine = sdaLine && !_bridge.sdaOe();
  }

  void start() {
    hold(true, true, BIT_HALF);
    hold(true, false, BIT_HALF);
    hold(false, false, BIT_HALF);
  }

  void stop() {
    hold(false, false, BIT_HALF);
    hold(true, false, BIT_HALF);
    hold(true, true, BIT_HALF);
  }

  /// Clock out the top `count` bits of value, MSB first (no ACK cycle)
  void sendBits(uint8_t value, uint8_t count) {
    for (uint8_t i = 0; i < count; ++i) {
      const bool bit = ((value >> (7 - i)) & 0x01) != 0;
      hold(false, bit, BIT_HALF);
      hold(true, bit, BIT_HALF * 2);
      hold(false, bit, BIT_HALF);
    }
  }

  /// Send one byte and run the ACK cycle
  /// @return true if the device pulled SDA low (ACK)
  bool sendByte(uint8_t value) {
    sendBits(value, 8);
    return ackCycle();
  }

  /// 9th clock with SDA released
  /// @return true if the device pulled SDA low (ACK)
  bool ackCycle() {
    hold(false, true, BIT_HALF);
    hold(true, true, BIT_HALF);
    const bool ack = _bridge.sdaOe();
    lineAck = !_lastSdaLine;
    idle(BIT_HALF);
    hold(false, true, BIT_HALF);
    acks.push_back(ack);
    return ack;
  }

  /// START, address (write), register, data, STOP
  /// @return true if all three bytes were ACKed
  bool write(uint8_t address7, uint8_t reg, uint8_t data) {
    start();
    bool ok = sendByte(static_cast<uint8_t>(address7 << 1));
    ok = sendByte(reg) && ok;
    ok = sendByte(data) && ok;
    stop();
    return ok;
  }

  /// Hold the active-low reset for a number of ticks, lines unchanged
  void resetPulse(uint32_t ticks) {
    _rstN = false;
    idle(ticks);
    _rstN = true;
  }

  /// One tick of SCL high while SCL is low (glitch)
  void glitchScl() {
    const bool scl = _scl;
    hold(true, _sda, 1);
    hold(scl, _sda, 1);
  }

  SpiMonitor spi;
  std::vector<bool> acks;
  bool lineAck = false;       ///< ACK as seen on the wired-AND line (wiredAnd only)
  uint32_t tickCount = 0;
  uint32_t oeTicks = 0;

private:
  Bridge& _bridge;
  bool _wiredAnd;
  bool _scl = true;
  bool _sda = true;
  bool _rstN = true;
  bool _lastSdaLine = true;
};

} // namespace harness
