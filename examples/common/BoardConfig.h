/**
 * @file BoardConfig.h
 * @brief Example board configuration for ESP32-S2 / ESP32-S3 reference hardware.
 *
 * These are convenience defaults for reference designs only.
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is board-agnostic. It only sees ui_in/uo_out
 *          bytes; pins are mapped by the example GPIO adapter.
 */

#pragma once

#include <stdint.h>

#include "common/GpioPins.h"

namespace board {

// ====================================================================
// EXAMPLE DEFAULTS - ESP32-S2 / ESP32-S3 REFERENCE HARDWARE
// ====================================================================
// These values are NOT library defaults. They are example-only values.
// ====================================================================

/// @brief I2C SCL pin (input, driven by the external master).
static constexpr int I2C_SCL = 9;

/// @brief I2C SDA pin (input, pulled low open-drain for ACK).
static constexpr int I2C_SDA = 8;

/// @brief SPI clock output.
static constexpr int SPI_SCLK = 12;

/// @brief SPI data output.
static constexpr int SPI_MOSI = 11;

/// @brief SPI chip select output (active low).
static constexpr int SPI_CS_N = 10;

/// @brief Busy indicator LED. Set to -1 to disable.
static constexpr int LED = 48;

/// @brief Active-low reset input. Set to -1 to disable.
static constexpr int RST_N = -1;

/// @brief Bridge ticks run per loop() iteration.
static constexpr uint32_t TICKS_PER_LOOP = 64;

/// @brief Default pin map for the examples.
inline gpio::BridgePins defaultPins() {
  gpio::BridgePins pins;
  pins.scl = I2C_SCL;
  pins.sda = I2C_SDA;
  pins.spiSclk = SPI_SCLK;
  pins.spiMosi = SPI_MOSI;
  pins.spiCsN = SPI_CS_N;
  pins.busyLed = LED;
  pins.rstN = RST_N;
  return pins;
}

}  // namespace board
