/// @file I2cSlave.h
/// @brief I2C slave decoder (write-only, address + register + data)
#pragma once

#include <cstdint>
#include "I2cSpiBridge/Event.h"
#include "I2cSpiBridge/Synchronizer.h"

namespace I2cSpiBridge {

/// Decoder state
enum class DecoderState : uint8_t {
  IDLE,        ///< Waiting for START
  ADDR_BITS,   ///< Receiving 7-bit address + R/W
  ADDR_ACK,    ///< ACK/NACK slot for the address byte
  REG_BITS,    ///< Receiving register byte
  REG_ACK,     ///< ACK slot for the register byte
  DATA_BITS,   ///< Receiving data byte
  DATA_ACK,    ///< ACK slot for the data byte
  AWAIT_STOP   ///< Frame complete, waiting for STOP
};

/// In-progress I2C transaction
struct TransactionFrame {
  uint8_t address = 0;       ///< 7-bit address from the first byte
  bool isRead = false;       ///< R/W bit of the first byte
  uint8_t reg = 0;
  bool hasRegister = false;
  uint8_t data = 0;
  bool hasData = false;
  uint8_t bitCount = 0;      ///< Bits of the current byte received (0..8)
  uint8_t byteIndex = 0;     ///< Byte being assembled (0 = address, 1 = register, 2 = data)
};

/// Write-only I2C slave decoder.
///
/// Consumes one synchronized BusSample per tick. Bits are captured on SCL
/// rising edges. The ACK decision for a byte is committed on the SCL falling
/// edge that ends its 8th bit; sdaOe() is then held until the falling edge
/// that ends the ACK bit. The event for a byte is returned on the commit
/// tick, never earlier.
class I2cSlave {
public:
  /// Set the 7-bit address this slave answers to
  void setAddress(uint8_t address7);

  /// 7-bit address this slave answers to
  uint8_t address() const { return _address; }

  /// Force IDLE, release SDA and clear the frame
  void reset();

  /// Advance one tick
  /// @param s Synchronized bus sample for this tick
  /// @return Event produced on this tick (EventType::NONE if nothing happened)
  Event tick(const BusSample& s);

  DecoderState state() const { return _state; }

  /// Current frame (valid until clearFrame() or the next START)
  const TransactionFrame& frame() const { return _frame; }

  /// Discard the frame (called by the controller once it is consumed)
  void clearFrame() { _frame = TransactionFrame{}; }

  /// Open-drain driven value (SDA is only ever pulled low)
  bool sdaOut() const { return false; }

  /// true while pulling SDA low (ACK)
  bool sdaOe() const { return _sdaOe; }

private:
  void _enterAddress();
  Event _abort(Err reason);
  Event _commitAck();
  void _finishAck();
  void _shiftBit(bool sda);

  uint8_t _address = 0;
  DecoderState _state = DecoderState::IDLE;
  TransactionFrame _frame;
  uint8_t _shift = 0;
  bool _ackSlot = false;
  bool _bitPending = false;  ///< SCL high since the last captured bit
  bool _sdaOe = false;
};

} // namespace I2cSpiBridge
