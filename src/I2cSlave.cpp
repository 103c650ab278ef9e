/**
 * @file I2cSlave.cpp
 * @brief I2C slave decoder implementation.
 */

#include "I2cSpiBridge/I2cSlave.h"
#include "I2cSpiBridge/PinMap.h"

namespace I2cSpiBridge {

void I2cSlave::setAddress(uint8_t address7) {
  _address = static_cast<uint8_t>(address7 & proto::ADDRESS_MASK);
}

void I2cSlave::reset() {
  _state = DecoderState::IDLE;
  _frame = TransactionFrame{};
  _shift = 0;
  _ackSlot = false;
  _bitPending = false;
  _sdaOe = false;
}

void I2cSlave::_enterAddress() {
  _state = DecoderState::ADDR_BITS;
  _frame = TransactionFrame{};
  _shift = 0;
  _ackSlot = false;
  _bitPending = false;
  _sdaOe = false;
}

Event I2cSlave::_abort(Err reason) {
  Event ev;
  ev.type = EventType::FRAME_ABORTED;
  ev.byteIndex = _frame.byteIndex;
  ev.value = _frame.bitCount;
  ev.error = reason;

  _state = DecoderState::IDLE;
  _ackSlot = false;
  _bitPending = false;
  _sdaOe = false;
  return ev;
}

void I2cSlave::_shiftBit(bool sda) {
  _shift = static_cast<uint8_t>((_shift << 1) | (sda ? 1 : 0));
  _frame.bitCount++;
  _bitPending = true;
}

Event I2cSlave::_commitAck() {
  Event ev;
  ev.byteIndex = _frame.byteIndex;
  ev.value = _shift;

  switch (_state) {
    case DecoderState::ADDR_ACK:
      _frame.address = static_cast<uint8_t>(_shift >> 1);
      _frame.isRead = (_shift & proto::RW_READ) != 0;
      if (_frame.address != _address || _frame.isRead) {
        // NACK: leave SDA released and drop out of the frame
        ev.type = EventType::ADDRESS_NACK;
        ev.error = (_frame.address != _address) ? Err::ADDRESS_NACK
                                                : Err::READ_NOT_SUPPORTED;
        _state = DecoderState::IDLE;
        return ev;
      }
      ev.type = EventType::ADDRESS_MATCH;
      break;

    case DecoderState::REG_ACK:
      _frame.reg = _shift;
      _frame.hasRegister = true;
      ev.type = EventType::BYTE_RECEIVED;
      break;

    case DecoderState::DATA_ACK:
      _frame.data = _shift;
      _frame.hasData = true;
      ev.type = EventType::BYTE_RECEIVED;
      break;

    default:
      return ev;
  }

  _sdaOe = true;
  _ackSlot = true;
  return ev;
}

void I2cSlave::_finishAck() {
  _sdaOe = false;
  _ackSlot = false;
  _shift = 0;
  _frame.bitCount = 0;

  switch (_state) {
    case DecoderState::ADDR_ACK:
      _frame.byteIndex = proto::BYTE_REGISTER;
      _state = DecoderState::REG_BITS;
      break;
    case DecoderState::REG_ACK:
      _frame.byteIndex = proto::BYTE_DATA;
      _state = DecoderState::DATA_BITS;
      break;
    case DecoderState::DATA_ACK:
      _state = DecoderState::AWAIT_STOP;
      break;
    default:
      break;
  }
}

Event I2cSlave::tick(const BusSample& s) {
  // START restarts decoding from any state
  if (s.start) {
    Event ev;
    if (_state != DecoderState::IDLE) {
      ev = _abort(Err::REPEATED_START);
    }
    _enterAddress();
    return ev;
  }

  if (_state == DecoderState::IDLE) {
    return Event{};
  }

  if (s.stop) {
    if (_state == DecoderState::AWAIT_STOP) {
      Event ev;
      ev.type = EventType::FRAME_COMPLETE;
      ev.byteIndex = _frame.byteIndex;
      ev.value = _frame.data;
      _state = DecoderState::IDLE;
      _sdaOe = false;
      return ev;
    }
    // The rising edge that sets up a STOP is not a data bit
    if (_bitPending) {
      _frame.bitCount--;
    }
    const bool midByte = _frame.bitCount > 0 && _frame.bitCount < proto::BITS_PER_BYTE;
    return _abort(midByte ? Err::INCOMPLETE_BYTE : Err::INCOMPLETE_FRAME);
  }

  if (s.violation) {
    return _abort(Err::PROTOCOL_VIOLATION);
  }

  if (s.sclFall) {
    _bitPending = false;
  }

  switch (_state) {
    case DecoderState::ADDR_BITS:
    case DecoderState::REG_BITS:
    case DecoderState::DATA_BITS:
      if (s.sclRise) {
        _shiftBit(s.sda);
        if (_frame.bitCount == proto::BITS_PER_BYTE) {
          _state = (_state == DecoderState::ADDR_BITS) ? DecoderState::ADDR_ACK
                 : (_state == DecoderState::REG_BITS)  ? DecoderState::REG_ACK
                                                       : DecoderState::DATA_ACK;
        }
      }
      break;

    case DecoderState::ADDR_ACK:
    case DecoderState::REG_ACK:
    case DecoderState::DATA_ACK:
      if (s.sclFall) {
        if (!_ackSlot) {
          return _commitAck();
        }
        _finishAck();
      }
      break;

    case DecoderState::AWAIT_STOP:
      // A full clock pulse here is a 4th byte; it is never ACKed and the
      // frame no longer matches a single register write
      if (s.sclFall) {
        return _abort(Err::FRAME_OVERRUN);
      }
      break;

    default:
      break;
  }

  return Event{};
}

} // namespace I2cSpiBridge
