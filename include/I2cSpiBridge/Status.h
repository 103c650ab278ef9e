/// @file Status.h
/// @brief Error codes and status handling for the I2C-to-SPI bridge
#pragma once

#include <cstdint>

namespace I2cSpiBridge {

/// Error codes for all bridge operations and bus outcomes
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  BUSY,                   ///< SPI generator busy
  IN_PROGRESS,            ///< Transfer started; call tick() to complete
  ADDRESS_NACK,           ///< Address byte did not match, NACKed
  READ_NOT_SUPPORTED,     ///< Address matched with R/W=1, NACKed
  PROTOCOL_VIOLATION,     ///< SDA changed while SCL high outside START/STOP
  INCOMPLETE_BYTE,        ///< STOP before all 8 bits of a byte
  INCOMPLETE_FRAME,       ///< STOP before register and data bytes
  REPEATED_START,         ///< START while a frame was in progress
  FRAME_OVERRUN,          ///< More than register + data byte clocked
  TRANSFER_DROPPED,       ///< Frame completed while SPI busy
  TRANSFER_ABANDONED      ///< Reset during an SPI transfer
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., bit count)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace I2cSpiBridge
