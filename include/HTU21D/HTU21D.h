/// @file HTU21D.h
/// @brief Main driver class for HTU21D
#pragma once

#include <cstddef>
#include <cstdint>
#include "HTU21D/Status.h"
#include "HTU21D/Config.h"
#include "HTU21D/CommandTable.h"
#include "HTU21D/Version.h"

namespace HTU21D {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Parsed user register
struct UserRegister {
  uint8_t raw = 0;
  Resolution resolution = Resolution::RH12_T14;
  bool endOfBattery = false;
  bool heaterEnabled = false;
  bool otpReloadEnabled = true;
};

/// HTU21D driver class
class HTU21D {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the driver: soft reset, then read back the user register
  /// @param config Configuration including transport callbacks
  /// @return Status::Ok() if the device answered, error otherwise.
  ///         Use defaultsVerified() for the post-reset self-test result.
  Status begin(const Config& config);

  /// Shutdown the driver
  void end();

  /// True if the user register read in begin() matched the reset default
  bool defaultsVerified() const { return _defaultsVerified; }

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Check if device is present on the bus (no health tracking)
  Status probe();

  /// Soft reset; reloads user register defaults (blocks for 15 ms)
  Status softReset();

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const { return _driverState; }

  /// Check if driver is ready for operations
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  /// Most recent error status
  Status lastError() const { return _lastError; }

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }

  /// Total failure count (lifetime)
  uint32_t totalFailures() const { return _totalFailures; }

  /// Total success count (lifetime)
  uint32_t totalSuccess() const { return _totalSuccess; }

  // =========================================================================
  // Measurement API (blocking)
  // =========================================================================

  /// Measure temperature
  /// @param mode HOLD or NO_HOLD trigger
  /// @param unit CELSIUS or FAHRENHEIT; anything else returns UNSUPPORTED
  /// @param out Converted temperature
  /// @param verifyCrc Check the frame CRC (CRC_MISMATCH on failure)
  Status readTemperature(MeasureMode mode, TempUnit unit, float& out,
                         bool verifyCrc = true);

  /// Measure relative humidity in percent
  Status readHumidity(MeasureMode mode, float& out, bool verifyCrc = true);

  /// Measure temperature, returning the masked raw code
  Status readTemperatureRaw(MeasureMode mode, uint16_t& raw, bool verifyCrc = true);

  /// Measure humidity, returning the masked raw code
  Status readHumidityRaw(MeasureMode mode, uint16_t& raw, bool verifyCrc = true);

  // =========================================================================
  // User Register
  // =========================================================================

  /// Read raw user register byte
  Status readUserRegister(uint8_t& value);

  /// Read and parse user register
  Status readUserRegister(UserRegister& out);

  /// Write raw user register byte
  Status writeUserRegister(uint8_t value);

  /// Set measurement resolution (read-modify-write, other bits preserved)
  Status setResolution(Resolution res);

  /// Read measurement resolution from the device
  Status getResolution(Resolution& out);

  /// Invert the on-chip heater bit
  Status toggleHeater();

  /// Enable/disable the on-chip heater
  Status setHeater(bool enable);

  /// Invert the disable-OTP-reload bit
  Status toggleOtpReload();

  /// Read end-of-battery flag (VDD < 2.25 V)
  Status readEndOfBattery(bool& lowVoltage);

  /// Read heater state
  Status readHeaterEnabled(bool& enabled);

  /// Read OTP reload state (true when reload before each measurement is on)
  Status readOtpReloadEnabled(bool& enabled);

  // =========================================================================
  // Helpers
  // =========================================================================

  /// Verify a 16-bit value against its CRC-8 (polynomial division)
  static bool checkCrc(uint16_t raw, uint8_t checksum);

  /// Compute the CRC-8 the sensor appends to a 16-bit value
  static uint8_t computeCrc(uint16_t raw);

  /// Clear the two status bits of a raw code
  static uint16_t maskRaw(uint16_t raw) {
    return static_cast<uint16_t>(raw & cmd::RAW_DATA_MASK);
  }

  /// Validate and decode a result frame into a masked raw code
  /// @param data Frame bytes (MSB, LSB, CRC)
  /// @param len Frame length as received
  /// @param verifyCrc Check the CRC byte
  /// @param policy Handling of len != 3
  /// @param raw Masked raw code
  static Status decodeFrame(const uint8_t* data, size_t len, bool verifyCrc,
                            FramePolicy policy, uint16_t& raw);

  /// Convert raw temperature to Celsius
  static float convertTemperatureC(uint32_t raw);

  /// Convert raw temperature to Fahrenheit
  static float convertTemperatureF(uint32_t raw);

  /// Convert raw humidity to percent
  static float convertHumidityPct(uint32_t raw);

  /// Replace the resolution bits of a register value
  static uint8_t applyResolution(uint8_t reg, Resolution res);

  /// Decode user register fields
  static UserRegister parseUserRegister(uint8_t raw);

  /// Maximum conversion time from the datasheet
  static uint32_t conversionTimeMs(Resolution res, MeasureKind kind);

  /// Humidity compensated to 25 degC
  static float computeCompensatedHumidity(float humidityPct, float temperatureC);

  /// Dew point in Celsius
  static float computeDewPointC(float humidityPct, float temperatureC);

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Raw I2C read (no health tracking)
  Status _i2cReadRaw(uint8_t* rxBuf, size_t rxLen);

  /// Raw I2C write (no health tracking)
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);

  /// Tracked I2C read (updates health)
  Status _i2cReadTracked(uint8_t* rxBuf, size_t rxLen);

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  // =========================================================================
  // Command Access
  // =========================================================================

  Status _writeCommand(uint8_t command, bool tracked);
  Status _writeCommandWithData(uint8_t command, uint8_t data);
  Status _readUserRegisterRaw(uint8_t& value, bool tracked);
  Status _measure(MeasureKind kind, MeasureMode mode, bool verifyCrc, uint16_t& raw);
  Status _noHoldDelayMs(MeasureKind kind, uint32_t& delayMs);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  // =========================================================================
  // Internal Helpers
  // =========================================================================

  Status _waitMs(uint32_t delayMs);

  static uint8_t _crc8(const uint8_t* data, size_t len);
  static uint8_t _commandForMeasurement(MeasureKind kind, MeasureMode mode);
  static bool _timeElapsed(uint32_t now, uint32_t target);

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  bool _initialized = false;
  bool _defaultsVerified = false;
  DriverState _driverState = DriverState::UNINIT;

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
};

} // namespace HTU21D
