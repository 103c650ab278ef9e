/// @file I2cSpiBridge.h
/// @brief Main bridge class: I2C slave write -> SPI master transfer
#pragma once

#include <cstddef>
#include <cstdint>
#include "I2cSpiBridge/Status.h"
#include "I2cSpiBridge/Config.h"
#include "I2cSpiBridge/Event.h"
#include "I2cSpiBridge/PinMap.h"
#include "I2cSpiBridge/Synchronizer.h"
#include "I2cSpiBridge/I2cSlave.h"
#include "I2cSpiBridge/SpiMaster.h"
#include "I2cSpiBridge/Version.h"

namespace I2cSpiBridge {

/// Snapshot of bridge state and counters
struct BridgeSnapshot {
  uint32_t tick = 0;
  bool inReset = false;
  DecoderState decoderState = DecoderState::IDLE;
  SpiState spiState = SpiState::IDLE;
  TransactionFrame frame = {};
  TransferJob lastJob = {};
  bool hasLastJob = false;
  uint8_t uoOut = pins::OUT_IDLE;

  uint32_t framesCompleted = 0;
  uint32_t addressNacks = 0;
  uint32_t framesAborted = 0;
  uint32_t transfersStarted = 0;
  uint32_t transfersCompleted = 0;
  uint32_t transfersDropped = 0;
  uint32_t transfersAbandoned = 0;
  Status lastError = {};
};

/// I2C-to-SPI bridge.
///
/// Each tick() samples the I2C lines from ui_in, advances the synchronizer,
/// the slave decoder and the SPI generator once, and hands a completed
/// (register, data) write to the generator. A write that completes while
/// the generator is still busy is dropped, never queued.
class Bridge {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the bridge with configuration
  /// @param config Slave address, SPI timing and optional event callback
  /// @return Status::Ok() on success, INVALID_CONFIG otherwise
  Status begin(const Config& config);

  /// Advance one system-clock tick
  /// @param uiIn Input pins (see pins::IN_SCL_BIT / pins::IN_SDA_BIT)
  /// @param rstN Active-low reset level; while low everything holds idle
  void tick(uint8_t uiIn, bool rstN = true);

  /// Synchronous reset: abandon any frame or transfer, outputs idle
  void reset();

  /// Shutdown the bridge; outputs return to idle
  void end();

  bool isInitialized() const { return _initialized; }

  // =========================================================================
  // Pins
  // =========================================================================

  /// Output pins (see pins::OUT_*)
  uint8_t uoOut() const;

  bool sdaOut() const { return _slave.sdaOut(); }
  bool sdaOe() const { return _slave.sdaOe(); }
  bool spiCsN() const { return _spi.csN(); }
  bool spiSclk() const { return _spi.sclk(); }
  bool spiMosi() const { return _spi.mosi(); }

  /// true while an SPI transfer is in progress
  bool busy() const { return _spi.busy(); }

  // =========================================================================
  // State
  // =========================================================================

  DecoderState decoderState() const { return _slave.state(); }
  SpiState spiState() const { return _spi.state(); }
  const TransactionFrame& frame() const { return _slave.frame(); }
  const Config& config() const { return _config; }

  /// Ticks since begin() (including ticks held in reset)
  uint32_t tickCount() const { return _tick; }

  /// Ticks one default SPI transfer takes from hand-off to idle
  uint32_t transferTicks() const { return _spi.transferTicks(); }

  /// Get a snapshot of state and counters
  Status getSnapshot(BridgeSnapshot& out) const;

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Most recent bus/transfer error
  Status lastError() const { return _lastError; }

  /// Tick of the most recent error (0 if none)
  uint32_t lastErrorTick() const { return _lastErrorTick; }

  uint32_t framesCompleted() const { return _framesCompleted; }
  uint32_t addressNacks() const { return _addressNacks; }
  uint32_t framesAborted() const { return _framesAborted; }
  uint32_t transfersStarted() const { return _transfersStarted; }
  uint32_t transfersCompleted() const { return _transfersCompleted; }
  uint32_t transfersDropped() const { return _transfersDropped; }
  uint32_t transfersAbandoned() const { return _transfersAbandoned; }

private:
  void _applyReset();
  void _handleDecoderEvent(const Event& ev);
  void _forwardFrame(const TransactionFrame& frame);
  void _recordError(Err code, const char* msg, int32_t detail = 0);
  void _emit(Event ev);
  void _clearCounters();

  static bool _isValidSlaveAddress(uint8_t address);

  Config _config;
  bool _initialized = false;
  bool _inReset = false;
  uint32_t _tick = 0;

  Synchronizer _sync;
  I2cSlave _slave;
  SpiMaster _spi;

  TransferJob _lastJob;
  bool _hasLastJob = false;

  // Counters
  uint32_t _framesCompleted = 0;
  uint32_t _addressNacks = 0;
  uint32_t _framesAborted = 0;
  uint32_t _transfersStarted = 0;
  uint32_t _transfersCompleted = 0;
  uint32_t _transfersDropped = 0;
  uint32_t _transfersAbandoned = 0;
  Status _lastError = Status::Ok();
  uint32_t _lastErrorTick = 0;
};

} // namespace I2cSpiBridge
