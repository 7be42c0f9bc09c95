/// @file I2cScanner.h
/// @brief I2C bus scanner for bring-up
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "HTU21D/CommandTable.h"
#include "Log.h"
#include "I2cTransport.h"

namespace i2c {

/// Address-only probe; returns the mapped Wire result
inline transport::Status ping(uint8_t addr) {
  Wire.beginTransmission(addr);
  return transport::mapWireError(Wire.endTransmission());
}

/// Scan the 7-bit address range and report whether an HTU21D answered
/// @return Number of devices found
inline int scan() {
  LOGI("Scanning I2C bus...");

  int count = 0;
  bool sensorSeen = false;
  for (uint8_t addr = 1; addr < 127; ++addr) {
    if (!ping(addr).ok()) {
      continue;
    }
    ++count;
    if (addr == HTU21D::cmd::I2C_ADDR) {
      sensorSeen = true;
      LOGI("  0x%02X  HTU21D", addr);
    } else {
      LOGI("  0x%02X", addr);
    }
  }

  if (count == 0) {
    LOGW("No I2C devices found");
  } else if (!sensorSeen) {
    LOGW("%d device(s) found, none at HTU21D address 0x%02X", count,
         HTU21D::cmd::I2C_ADDR);
  } else {
    LOGI("Found %d device(s)", count);
  }

  return count;
}

} // namespace i2c
