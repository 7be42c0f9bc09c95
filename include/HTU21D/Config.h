/// @file Config.h
/// @brief Configuration structure for HTU21D driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "HTU21D/Status.h"

namespace HTU21D {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. Transport SHOULD distinguish:
///         - Err::I2C_NACK_ADDR (address NACK)
///         - Err::I2C_NACK_DATA (data NACK)
///         - Err::I2C_TIMEOUT (timeout)
///         - Err::I2C_BUS (bus/arbitration error)
///         - Err::I2C_ERROR (unspecified I2C error)
/// @note Multi-byte writes (command + register value) MUST be sent as one
///       transaction with a single START/STOP.
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C read callback signature
/// @param addr     I2C device address (7-bit)
/// @param txData   Unused by HTU21D (txLen is always 0)
/// @param txLen    Number of bytes to write before the read (always 0)
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion (includes clock stretching)
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. The transport MUST fill exactly
///         rxLen bytes or return an error.
/// @note The driver issues command writes via i2cWrite() and then calls
///       i2cWriteRead() with txLen==0 to read the response.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Measurement resolution (user register bits 7 and 0)
enum class Resolution : uint8_t {
  RH12_T14 = 0x00,  ///< 12-bit RH, 14-bit temperature (default)
  RH8_T12 = 0x01,   ///< 8-bit RH, 12-bit temperature
  RH10_T13 = 0x80,  ///< 10-bit RH, 13-bit temperature
  RH11_T11 = 0x81   ///< 11-bit RH, 11-bit temperature
};

/// Measurement trigger mode
enum class MeasureMode : uint8_t {
  HOLD = 0,     ///< Sensor stretches SCL during conversion
  NO_HOLD = 1   ///< Bus released; driver waits before reading
};

/// Temperature output unit
enum class TempUnit : uint8_t {
  CELSIUS = 0,
  FAHRENHEIT = 1
};

/// Quantity being converted (selects conversion timing)
enum class MeasureKind : uint8_t {
  TEMPERATURE = 0,
  HUMIDITY = 1
};

/// Handling of result frames that are not exactly 3 bytes
/// @note The driver always requests 3 bytes and the transport contract is
///       "exactly rxLen bytes or an error", so a short read surfaces as the
///       transport's I2C error. The policy only takes effect in
///       HTU21D::decodeFrame() for frames collected some other way.
enum class FramePolicy : uint8_t {
  REPORT_ERROR = 0,  ///< Return Err::MALFORMED_FRAME
  LEGACY_ZERO = 1    ///< Treat raw value as 0 and continue (no error)
};

/// Configuration for HTU21D driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;        ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C write-read function pointer
  void* i2cUser = nullptr;               ///< User context for callbacks

  // === Device Settings ===
  uint8_t i2cAddress = 0x40;             ///< Fixed HTU21D address
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms

  // === Timing ===
  uint32_t holdSettleMs = 50;            ///< Delay between hold-mode trigger and read

  /// Delay between no-hold trigger and read.
  /// 0 = derive from the resolution currently set in the user register.
  uint32_t noHoldDelayMs = 50;

  // === Measurement Settings ===
  FramePolicy framePolicy = FramePolicy::REPORT_ERROR; ///< Frame length handling (see FramePolicy)

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE
};

} // namespace HTU21D
