/// @file Event.h
/// @brief Bus and transfer events reported by the bridge
#pragma once

#include <cstdint>
#include "I2cSpiBridge/Status.h"

namespace I2cSpiBridge {

/// Event kinds, in the order they can occur during one transaction
enum class EventType : uint8_t {
  NONE = 0,
  START,              ///< START condition seen
  ADDRESS_MATCH,      ///< Address byte ACKed (write to our address)
  ADDRESS_NACK,       ///< Address byte NACKed (mismatch or read)
  BYTE_RECEIVED,      ///< Register or data byte ACKed
  FRAME_COMPLETE,     ///< STOP after address + register + data
  FRAME_ABORTED,      ///< Frame discarded (see Event::error)
  TRANSFER_STARTED,   ///< SPI job handed to the generator
  TRANSFER_DROPPED,   ///< SPI generator was busy, job discarded
  TRANSFER_DONE,      ///< SPI generator returned to idle
  RESET               ///< Reset applied
};

/// One event, stamped with the tick it occurred on
struct Event {
  EventType type = EventType::NONE;
  uint32_t tick = 0;
  uint8_t byteIndex = 0;   ///< Frame byte position (0 = address, 1 = register, 2 = data)
  uint8_t value = 0;       ///< Byte value (address byte includes R/W bit)
  Err error = Err::OK;     ///< Reason for NACK/abort/drop events
};

} // namespace I2cSpiBridge
