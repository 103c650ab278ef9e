/// @file Version.h
/// @brief Library version
#pragma once

#include <cstdint>

namespace I2cSpiBridge {

static constexpr uint8_t VERSION_MAJOR = 1;
static constexpr uint8_t VERSION_MINOR = 0;
static constexpr uint8_t VERSION_PATCH = 0;
static constexpr const char* VERSION = "1.0.0";

} // namespace I2cSpiBridge
