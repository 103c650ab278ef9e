/// @file Config.h
/// @brief Configuration structure for the I2C-to-SPI bridge
#pragma once

#include <cstddef>
#include <cstdint>
#include "I2cSpiBridge/Status.h"
#include "I2cSpiBridge/Event.h"
#include "I2cSpiBridge/PinMap.h"

namespace I2cSpiBridge {

/// Event callback signature
/// @param event Event that just occurred
/// @param user  User context pointer passed through from Config
/// @note Called from inside tick(). Must not call back into the bridge.
using EventFn = void (*)(const Event& event, void* user);

/// SPI clock polarity/phase
enum class SpiMode : uint8_t {
  MODE_0 = 0,  ///< CPOL=0, CPHA=0: SCLK idles low, sample on rising edge
  MODE_1 = 1,  ///< CPOL=0, CPHA=1: SCLK idles low, sample on falling edge
  MODE_2 = 2,  ///< CPOL=1, CPHA=0: SCLK idles high, sample on falling edge
  MODE_3 = 3   ///< CPOL=1, CPHA=1: SCLK idles high, sample on rising edge
};

/// @return SCLK idle level for the mode
inline constexpr bool spiCpol(SpiMode mode) {
  return (static_cast<uint8_t>(mode) & 0x02) != 0;
}

/// @return true if data is sampled on the trailing edge
inline constexpr bool spiCpha(SpiMode mode) {
  return (static_cast<uint8_t>(mode) & 0x01) != 0;
}

/// Configuration for the bridge
struct Config {
  // === I2C Slave ===
  uint8_t slaveAddress = proto::DEFAULT_SLAVE_ADDRESS;  ///< 7-bit address, fixed per build

  // === SPI Master ===
  uint8_t spiClockDivider = proto::DEFAULT_SPI_CLOCK_DIVIDER; ///< System ticks per SCLK period (even, >= 2)
  SpiMode spiMode = SpiMode::MODE_0;                    ///< Clock polarity/phase
  uint8_t csSetupTicks = proto::DEFAULT_CS_SETUP_TICKS; ///< CS low to first SCLK edge (>= 1)
  uint8_t csHoldTicks = proto::DEFAULT_CS_HOLD_TICKS;   ///< CS high before returning to idle (>= 1)

  // === Events ===
  EventFn onEvent = nullptr;                            ///< Optional event callback
  void* eventUser = nullptr;                            ///< User context for onEvent
};

} // namespace I2cSpiBridge
