/**
 * @file BoardConfig.h
 * @brief Example board configuration for ESP32 DevKit reference hardware.
 *
 * These are convenience defaults for reference designs only.
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is board-agnostic. The transport is passed via Config.
 */

#pragma once

#include <stdint.h>

#include "common/I2cTransport.h"

namespace board {

/// @brief I2C SDA pin (data line).
static constexpr int I2C_SDA = 21;

/// @brief I2C SCL pin (clock line).
static constexpr int I2C_SCL = 22;

/// @brief I2C clock frequency in Hz. HTU21D supports up to 400 kHz.
static constexpr uint32_t I2C_FREQ_HZ = 100000;

/// @brief I2C timeout in milliseconds. Covers the 50 ms worst-case
/// clock stretch of a 14-bit hold-mode temperature conversion.
static constexpr uint16_t I2C_TIMEOUT_MS = 100;

/// @brief Initialize I2C for examples using the default config.
inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

}  // namespace board
