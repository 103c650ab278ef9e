/**
 * @file I2cSpiBridge.cpp
 * @brief Bridge controller implementation.
 */

#include "I2cSpiBridge/I2cSpiBridge.h"

namespace I2cSpiBridge {

bool Bridge::_isValidSlaveAddress(uint8_t address) {
  return address > proto::RESERVED_LOW_MAX && address < proto::RESERVED_HIGH_MIN;
}

Status Bridge::begin(const Config& config) {
  // Outputs go idle before validation so a failed re-begin never leaves
  // SDA pulled low or CS asserted
  const bool wasBusy = _spi.busy();
  _sync.reset();
  _slave.reset();
  _spi.reset();

  _initialized = false;
  _inReset = false;
  _tick = 0;
  _clearCounters();
  if (wasBusy) {
    _transfersAbandoned++;
    _recordError(Err::TRANSFER_ABANDONED, "begin() during SPI transfer");
  }

  if (!_isValidSlaveAddress(config.slaveAddress)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C slave address",
                         config.slaveAddress);
  }

  Status st = _spi.configure(config.spiMode, config.spiClockDivider,
                             config.csSetupTicks, config.csHoldTicks);
  if (!st.ok()) {
    return st;
  }

  _config = config;
  _slave.setAddress(_config.slaveAddress);

  _initialized = true;
  return Status::Ok();
}

void Bridge::end() {
  _sync.reset();
  _slave.reset();
  _spi.reset();
  _inReset = false;
  _initialized = false;
}

void Bridge::_clearCounters() {
  _lastJob = TransferJob{};
  _hasLastJob = false;
  _framesCompleted = 0;
  _addressNacks = 0;
  _framesAborted = 0;
  _transfersStarted = 0;
  _transfersCompleted = 0;
  _transfersDropped = 0;
  _transfersAbandoned = 0;
  _lastError = Status::Ok();
  _lastErrorTick = 0;
}

void Bridge::reset() {
  if (!_initialized) {
    return;
  }
  _applyReset();
}

void Bridge::_applyReset() {
  if (_spi.busy()) {
    _transfersAbandoned++;
    _recordError(Err::TRANSFER_ABANDONED, "Reset during SPI transfer",
                 static_cast<int32_t>(_spi.state()));
  }
  _sync.reset();
  _slave.reset();
  _spi.reset();

  Event ev;
  ev.type = EventType::RESET;
  _emit(ev);
}

void Bridge::tick(uint8_t uiIn, bool rstN) {
  if (!_initialized) {
    return;
  }

  _tick++;

  if (!rstN) {
    // Level sensitive: apply once on assertion, then hold
    if (!_inReset) {
      _inReset = true;
      _applyReset();
    }
    return;
  }
  _inReset = false;

  const BusSample& s = _sync.tick((uiIn & pins::IN_SCL) != 0,
                                  (uiIn & pins::IN_SDA) != 0);
  if (s.start) {
    Event ev;
    ev.type = EventType::START;
    _emit(ev);
  }

  const Event decoded = _slave.tick(s);

  // Generator advances before the hand-off, so a new job starts counting
  // its CS setup time on the next tick
  if (_spi.tick()) {
    _transfersCompleted++;
    Event ev;
    ev.type = EventType::TRANSFER_DONE;
    ev.value = _spi.job().data;
    _emit(ev);
  }

  if (decoded.type != EventType::NONE) {
    _handleDecoderEvent(decoded);
  }
}

void Bridge::_handleDecoderEvent(const Event& ev) {
  switch (ev.type) {
    case EventType::ADDRESS_MATCH:
    case EventType::BYTE_RECEIVED:
      _emit(ev);
      break;

    case EventType::ADDRESS_NACK:
      _addressNacks++;
      _recordError(ev.error, ev.error == Err::READ_NOT_SUPPORTED
                                 ? "I2C read not supported"
                                 : "I2C address mismatch",
                   ev.value);
      _slave.clearFrame();
      _emit(ev);
      break;

    case EventType::FRAME_ABORTED:
      _framesAborted++;
      _recordError(ev.error, "I2C frame aborted", ev.value);
      _slave.clearFrame();
      _emit(ev);
      break;

    case EventType::FRAME_COMPLETE: {
      _framesCompleted++;
      _emit(ev);
      const TransactionFrame frame = _slave.frame();
      _slave.clearFrame();
      _forwardFrame(frame);
      break;
    }

    default:
      break;
  }
}

void Bridge::_forwardFrame(const TransactionFrame& frame) {
  TransferJob job;
  job.reg = frame.reg;
  job.data = frame.data;

  Event ev;
  ev.byteIndex = proto::BYTE_REGISTER;
  ev.value = job.reg;

  const Status st = _spi.start(job);
  if (st.code != Err::IN_PROGRESS) {
    // Single slot: a frame completing mid-transfer is always dropped
    _transfersDropped++;
    _recordError(Err::TRANSFER_DROPPED, "SPI busy, transfer dropped", job.reg);
    ev.type = EventType::TRANSFER_DROPPED;
    ev.error = Err::TRANSFER_DROPPED;
    _emit(ev);
    return;
  }

  _transfersStarted++;
  _lastJob = job;
  _hasLastJob = true;
  ev.type = EventType::TRANSFER_STARTED;
  _emit(ev);
}

void Bridge::_recordError(Err code, const char* msg, int32_t detail) {
  _lastError = Status::Error(code, msg, detail);
  _lastErrorTick = _tick;
}

void Bridge::_emit(Event ev) {
  ev.tick = _tick;
  if (_config.onEvent != nullptr) {
    _config.onEvent(ev, _config.eventUser);
  }
}

uint8_t Bridge::uoOut() const {
  uint8_t out = 0;
  if (_slave.sdaOut()) out |= pins::OUT_SDA_O;
  if (_slave.sdaOe()) out |= pins::OUT_SDA_OE;
  if (_spi.sclk()) out |= pins::OUT_SPI_SCLK;
  if (_spi.mosi()) out |= pins::OUT_SPI_MOSI;
  if (_spi.csN()) out |= pins::OUT_SPI_CS_N;
  if (_spi.busy()) out |= pins::OUT_BUSY;
  return out;
}

Status Bridge::getSnapshot(BridgeSnapshot& out) const {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  out.tick = _tick;
  out.inReset = _inReset;
  out.decoderState = _slave.state();
  out.spiState = _spi.state();
  out.frame = _slave.frame();
  out.lastJob = _lastJob;
  out.hasLastJob = _hasLastJob;
  out.uoOut = uoOut();
  out.framesCompleted = _framesCompleted;
  out.addressNacks = _addressNacks;
  out.framesAborted = _framesAborted;
  out.transfersStarted = _transfersStarted;
  out.transfersCompleted = _transfersCompleted;
  out.transfersDropped = _transfersDropped;
  out.transfersAbandoned = _transfersAbandoned;
  out.lastError = _lastError;
  return Status::Ok();
}

} // namespace I2cSpiBridge
