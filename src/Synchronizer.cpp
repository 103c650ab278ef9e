/**
 * @file Synchronizer.cpp
 * @brief Input synchronizer and START/STOP detection.
 */

#include "I2cSpiBridge/Synchronizer.h"

namespace I2cSpiBridge {

void Synchronizer::reset() {
  _scl = Line{};
  _sda = Line{};
  _primed = false;
  _sample = BusSample{};
}

void Synchronizer::_prime(Line& line, bool raw) {
  line.ff0 = raw;
  line.ff1 = raw;
  line.level = raw;
}

bool Synchronizer::_shift(Line& line, bool raw) {
  line.ff1 = line.ff0;
  line.ff0 = raw;
  if (line.ff0 == line.ff1) {
    line.level = line.ff0;
  }
  return line.level;
}

const BusSample& Synchronizer::tick(bool rawScl, bool rawSda) {
  if (!_primed) {
    _prime(_scl, rawScl);
    _prime(_sda, rawSda);
    _primed = true;
    _sample = BusSample{};
    _sample.scl = rawScl;
    _sample.sda = rawSda;
    return _sample;
  }

  const bool prevScl = _scl.level;
  const bool prevSda = _sda.level;
  const bool scl = _shift(_scl, rawScl);
  const bool sda = _shift(_sda, rawSda);

  const bool sdaFall = prevSda && !sda;
  const bool sdaRise = !prevSda && sda;
  const bool sclStableHigh = prevScl && scl;

  _sample.scl = scl;
  _sample.sda = sda;
  _sample.sclRise = !prevScl && scl;
  _sample.sclFall = prevScl && !scl;
  _sample.start = sdaFall && sclStableHigh;
  _sample.stop = sdaRise && sclStableHigh;
  _sample.violation = (sdaFall || sdaRise) && _sample.sclRise;
  return _sample;
}

} // namespace I2cSpiBridge
