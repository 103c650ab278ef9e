/// @file SpiMaster.h
/// @brief Two-byte SPI master generator
#pragma once

#include <cstdint>
#include "I2cSpiBridge/Status.h"
#include "I2cSpiBridge/Config.h"

namespace I2cSpiBridge {

/// Generator state
enum class SpiState : uint8_t {
  IDLE,         ///< CS high, SCLK at idle level
  CS_ASSERT,    ///< CS low, waiting for the first SCLK edge
  SHIFT,        ///< Clocking out 16 bits
  CS_DEASSERT   ///< CS high, hold time before IDLE
};

/// Register/data pair forwarded over SPI
struct TransferJob {
  uint8_t reg = 0;
  uint8_t data = 0;
};

/// SPI master that shifts one TransferJob (register byte, then data byte,
/// MSB first) per transfer. Advanced once per system tick.
class SpiMaster {
public:
  /// Apply timing and mode. Only valid while idle.
  /// @return INVALID_CONFIG for an odd or < 2 divider, zero setup/hold or
  ///         unknown mode, BUSY while a transfer is in progress
  Status configure(SpiMode mode, uint8_t clockDivider,
                   uint8_t csSetupTicks, uint8_t csHoldTicks);

  /// Force IDLE and idle outputs, abandoning any transfer
  void reset();

  /// Start a transfer
  /// @return IN_PROGRESS when started, BUSY if a transfer is already running
  Status start(const TransferJob& job);

  /// Advance one tick
  /// @return true on the tick the generator returns to IDLE
  bool tick();

  bool busy() const { return _state != SpiState::IDLE; }
  SpiState state() const { return _state; }

  /// Chip select, active low
  bool csN() const { return _csN; }
  bool sclk() const { return _sclk; }
  bool mosi() const { return _mosi; }

  /// Job of the current (or last) transfer
  const TransferJob& job() const { return _job; }

  /// Ticks from start() to the tick the generator is idle again
  uint32_t transferTicks() const;

private:
  void _clockEdge();
  bool _bitAt(uint8_t index) const;

  SpiMode _mode = SpiMode::MODE_0;
  uint8_t _halfPeriod = proto::DEFAULT_SPI_CLOCK_DIVIDER / 2;
  uint8_t _csSetupTicks = proto::DEFAULT_CS_SETUP_TICKS;
  uint8_t _csHoldTicks = proto::DEFAULT_CS_HOLD_TICKS;

  SpiState _state = SpiState::IDLE;
  TransferJob _job;
  uint16_t _word = 0;
  uint8_t _edges = 0;
  uint8_t _counter = 0;
  bool _csN = true;
  bool _sclk = false;
  bool _mosi = false;
};

} // namespace I2cSpiBridge
