/// @file PinMap.h
/// @brief Pin bit assignments and protocol constants for the bridge
#pragma once

#include <cstdint>

namespace I2cSpiBridge {
namespace pins {

// ============================================================================
// ui_in (inputs)
// ============================================================================

static constexpr uint8_t IN_SCL_BIT = 0;
static constexpr uint8_t IN_SDA_BIT = 1;

static constexpr uint8_t IN_SCL = 1u << IN_SCL_BIT;
static constexpr uint8_t IN_SDA = 1u << IN_SDA_BIT;

/// Both lines released (pulled high)
static constexpr uint8_t IN_BUS_IDLE = IN_SCL | IN_SDA;

// ============================================================================
// uo_out (outputs)
// ============================================================================

static constexpr uint8_t OUT_SDA_O_BIT = 0;      ///< Open-drain driven value (always 0)
static constexpr uint8_t OUT_SDA_OE_BIT = 1;     ///< 1 = device pulls SDA low
static constexpr uint8_t OUT_SPI_SCLK_BIT = 2;
static constexpr uint8_t OUT_SPI_MOSI_BIT = 3;
static constexpr uint8_t OUT_SPI_CS_N_BIT = 4;   ///< Active low
static constexpr uint8_t OUT_BUSY_BIT = 5;

static constexpr uint8_t OUT_SDA_O = 1u << OUT_SDA_O_BIT;
static constexpr uint8_t OUT_SDA_OE = 1u << OUT_SDA_OE_BIT;
static constexpr uint8_t OUT_SPI_SCLK = 1u << OUT_SPI_SCLK_BIT;
static constexpr uint8_t OUT_SPI_MOSI = 1u << OUT_SPI_MOSI_BIT;
static constexpr uint8_t OUT_SPI_CS_N = 1u << OUT_SPI_CS_N_BIT;
static constexpr uint8_t OUT_BUSY = 1u << OUT_BUSY_BIT;

/// uo_out while idle or held in reset (only CS_N high)
static constexpr uint8_t OUT_IDLE = OUT_SPI_CS_N;

} // namespace pins

namespace proto {

// ============================================================================
// I2C
// ============================================================================

static constexpr uint8_t DEFAULT_SLAVE_ADDRESS = 0x28;
static constexpr uint8_t ADDRESS_MASK = 0x7F;

/// Reserved 7-bit address ranges (general call, CBUS, HS, 10-bit)
static constexpr uint8_t RESERVED_LOW_MAX = 0x07;
static constexpr uint8_t RESERVED_HIGH_MIN = 0x78;

static constexpr uint8_t BITS_PER_BYTE = 8;
static constexpr uint8_t RW_READ = 0x01;

/// Byte positions inside a frame
static constexpr uint8_t BYTE_ADDRESS = 0;
static constexpr uint8_t BYTE_REGISTER = 1;
static constexpr uint8_t BYTE_DATA = 2;

// ============================================================================
// SPI
// ============================================================================

static constexpr uint8_t DEFAULT_SPI_CLOCK_DIVIDER = 10;
static constexpr uint8_t DEFAULT_CS_SETUP_TICKS = 5;
static constexpr uint8_t DEFAULT_CS_HOLD_TICKS = 5;

static constexpr uint8_t TRANSFER_BITS = 16;

} // namespace proto
} // namespace I2cSpiBridge
