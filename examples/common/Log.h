/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

/// 0 = off, 1 = error, 2 = warn, 3 = info, 4 = debug
#ifndef LOG_LEVEL
#define LOG_LEVEL 3
#endif

#if LOG_LEVEL >= 1
#define LOGE(fmt, ...) Serial.printf("[E] " fmt "\n", ##__VA_ARGS__)
#else
#define LOGE(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 2
#define LOGW(fmt, ...) Serial.printf("[W] " fmt "\n", ##__VA_ARGS__)
#else
#define LOGW(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 3
#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)
#else
#define LOGI(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 4
#define LOGD(fmt, ...) Serial.printf("[D] " fmt "\n", ##__VA_ARGS__)
#else
#define LOGD(fmt, ...) do {} while (0)
#endif

/// Start the serial port used by the LOG macros
inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
}
