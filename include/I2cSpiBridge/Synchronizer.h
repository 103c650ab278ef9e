/// @file Synchronizer.h
/// @brief SCL/SDA input synchronizer and edge detector
#pragma once

#include <cstdint>

namespace I2cSpiBridge {

/// Synchronized bus levels and the edges detected on this tick
struct BusSample {
  bool scl = true;
  bool sda = true;
  bool sclRise = false;
  bool sclFall = false;
  bool start = false;      ///< SDA fell while SCL stable high
  bool stop = false;       ///< SDA rose while SCL stable high
  bool violation = false;  ///< SDA changed on the same tick SCL rose
};

/// Two-flop synchronizer per line with single-tick glitch rejection.
///
/// Each line is shifted through two flops once per tick. The filtered level
/// only follows the input once both flops agree, so a change is seen one
/// tick after it is sampled and a pulse lasting a single tick never reaches
/// the filtered level. Both lines pass through identical stages, so the
/// relative timing of SCL and SDA is preserved.
class Synchronizer {
public:
  /// Return to the unprimed state. The next tick() loads the raw levels
  /// without reporting edges.
  void reset();

  /// Sample the raw lines for one tick
  /// @param rawScl Raw SCL level
  /// @param rawSda Raw SDA level
  /// @return Sample for this tick (valid until the next call)
  const BusSample& tick(bool rawScl, bool rawSda);

  /// Last computed sample
  const BusSample& sample() const { return _sample; }

  /// True once the first tick after reset has loaded the flops
  bool primed() const { return _primed; }

private:
  struct Line {
    bool ff0 = true;
    bool ff1 = true;
    bool level = true;
  };

  static void _prime(Line& line, bool raw);
  static bool _shift(Line& line, bool raw);

  Line _scl;
  Line _sda;
  bool _primed = false;
  BusSample _sample;
};

} // namespace I2cSpiBridge
