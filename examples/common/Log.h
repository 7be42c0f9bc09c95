/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

#ifndef LOG_LEVEL
#define LOG_LEVEL 3  // 0=off, 1=error, 2=warn, 3=info, 4=debug
#endif

inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  const uint32_t start = millis();
  while (!Serial && (millis() - start) < 2000) {
    delay(10);
  }
}

#define LOG_PRINT_(tag, fmt, ...) \
  Serial.printf("[%8lu] %s " fmt "\n", static_cast<unsigned long>(millis()), tag, ##__VA_ARGS__)

#if LOG_LEVEL >= 1
#define LOGE(fmt, ...) LOG_PRINT_("E", fmt, ##__VA_ARGS__)
#else
#define LOGE(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 2
#define LOGW(fmt, ...) LOG_PRINT_("W", fmt, ##__VA_ARGS__)
#else
#define LOGW(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 3
#define LOGI(fmt, ...) LOG_PRINT_("I", fmt, ##__VA_ARGS__)
#else
#define LOGI(fmt, ...) do {} while (0)
#endif

#if LOG_LEVEL >= 4
#define LOGD(fmt, ...) LOG_PRINT_("D", fmt, ##__VA_ARGS__)
#else
#define LOGD(fmt, ...) do {} while (0)
#endif
