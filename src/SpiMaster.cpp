/**
 * @file SpiMaster.cpp
 * @brief SPI master generator implementation.
 */

#include "I2cSpiBridge/SpiMaster.h"

namespace I2cSpiBridge {
namespace {

static constexpr uint8_t EDGES_PER_TRANSFER = proto::TRANSFER_BITS * 2;

static bool isValidMode(SpiMode mode) {
  return mode == SpiMode::MODE_0 || mode == SpiMode::MODE_1 ||
         mode == SpiMode::MODE_2 || mode == SpiMode::MODE_3;
}

}  // namespace

Status SpiMaster::configure(SpiMode mode, uint8_t clockDivider,
                            uint8_t csSetupTicks, uint8_t csHoldTicks) {
  if (busy()) {
    return Status::Error(Err::BUSY, "SPI transfer in progress");
  }
  if (!isValidMode(mode)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid SPI mode");
  }
  if (clockDivider < 2 || (clockDivider % 2) != 0) {
    return Status::Error(Err::INVALID_CONFIG, "SPI divider must be even and >= 2",
                         clockDivider);
  }
  if (csSetupTicks == 0 || csHoldTicks == 0) {
    return Status::Error(Err::INVALID_CONFIG, "CS setup/hold must be >= 1 tick");
  }

  _mode = mode;
  _halfPeriod = static_cast<uint8_t>(clockDivider / 2);
  _csSetupTicks = csSetupTicks;
  _csHoldTicks = csHoldTicks;
  reset();
  return Status::Ok();
}

void SpiMaster::reset() {
  _state = SpiState::IDLE;
  _word = 0;
  _edges = 0;
  _counter = 0;
  _csN = true;
  _sclk = spiCpol(_mode);
  _mosi = false;
}

uint32_t SpiMaster::transferTicks() const {
  // Setup, 32 edges one half period apart, a trailing half period, hold
  return static_cast<uint32_t>(_csSetupTicks) +
         static_cast<uint32_t>(EDGES_PER_TRANSFER) * _halfPeriod +
         _csHoldTicks;
}

Status SpiMaster::start(const TransferJob& job) {
  if (busy()) {
    return Status::Error(Err::BUSY, "SPI transfer in progress");
  }

  _job = job;
  _word = static_cast<uint16_t>((static_cast<uint16_t>(job.reg) << 8) | job.data);
  _edges = 0;
  _counter = _csSetupTicks;
  _state = SpiState::CS_ASSERT;
  _csN = false;
  _sclk = spiCpol(_mode);
  // CPHA=0: first bit must be valid before the first (sampling) edge
  _mosi = spiCpha(_mode) ? false : _bitAt(0);
  return Status{Err::IN_PROGRESS, 0, "SPI transfer started"};
}

bool SpiMaster::_bitAt(uint8_t index) const {
  return ((_word >> (proto::TRANSFER_BITS - 1 - index)) & 0x01) != 0;
}

void SpiMaster::_clockEdge() {
  const bool leading = (_edges % 2) == 0;
  const uint8_t bit = static_cast<uint8_t>(_edges / 2);

  _sclk = !_sclk;
  if (spiCpha(_mode)) {
    // Shift on the leading edge, receiver samples on the trailing edge
    if (leading) {
      _mosi = _bitAt(bit);
    }
  } else if (!leading && bit + 1 < proto::TRANSFER_BITS) {
    // Receiver sampled on the leading edge; present the next bit
    _mosi = _bitAt(static_cast<uint8_t>(bit + 1));
  }
  _edges++;
}

bool SpiMaster::tick() {
  switch (_state) {
    case SpiState::IDLE:
      return false;

    case SpiState::CS_ASSERT:
      if (--_counter == 0) {
        _state = SpiState::SHIFT;
        _clockEdge();
        _counter = _halfPeriod;
      }
      return false;

    case SpiState::SHIFT:
      if (--_counter == 0) {
        if (_edges < EDGES_PER_TRANSFER) {
          _clockEdge();
          _counter = _halfPeriod;
        } else {
          _state = SpiState::CS_DEASSERT;
          _csN = true;
          _mosi = false;
          _counter = _csHoldTicks;
        }
      }
      return false;

    case SpiState::CS_DEASSERT:
      if (--_counter == 0) {
        _state = SpiState::IDLE;
        return true;
      }
      return false;

    default:
      return false;
  }
}

} // namespace I2cSpiBridge
