/**
 * @file HTU21D.cpp
 * @brief HTU21D driver implementation.
 */

#include "HTU21D/HTU21D.h"

#include <Arduino.h>
#include <cmath>
#include <limits>

namespace HTU21D {
namespace {

static constexpr size_t MAX_WRITE_LEN = 2;
static constexpr uint32_t RESET_DELAY_MS = 15;
static constexpr uint32_t CONVERSION_MARGIN_MS = 2;
static constexpr uint32_t MAX_SPIN_ITERS = 500000;

// Magnus coefficients from the HTU21D datasheet (dew point, -40..125 degC)
static constexpr float DEW_A = 8.1332f;
static constexpr float DEW_B = 1762.39f;
static constexpr float DEW_C = 235.66f;
static constexpr float COMPENSATION_COEFF = -0.15f;

static bool isValidResolution(Resolution res) {
  return res == Resolution::RH12_T14 || res == Resolution::RH8_T12 ||
         res == Resolution::RH10_T13 || res == Resolution::RH11_T11;
}

static bool isValidMode(MeasureMode mode) {
  return mode == MeasureMode::HOLD || mode == MeasureMode::NO_HOLD;
}

static bool isValidFramePolicy(FramePolicy policy) {
  return policy == FramePolicy::REPORT_ERROR || policy == FramePolicy::LEGACY_ZERO;
}

static bool isI2cFailure(Err code) {
  return code == Err::I2C_ERROR || code == Err::I2C_NACK_ADDR ||
         code == Err::I2C_NACK_DATA || code == Err::I2C_NACK_READ ||
         code == Err::I2C_TIMEOUT || code == Err::I2C_BUS;
}

}  // namespace

Status HTU21D::begin(const Config& config) {
  _initialized = false;
  _defaultsVerified = false;
  _driverState = DriverState::UNINIT;

  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress != cmd::I2C_ADDR) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address");
  }
  if (!isValidFramePolicy(config.framePolicy)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid configuration value");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  Status st = _writeCommand(cmd::CMD_SOFT_RESET, true);
  if (st.ok()) {
    st = _waitMs(RESET_DELAY_MS);
    if (!st.ok()) {
      return st;
    }
  }

  uint8_t reg = 0;
  if (st.ok()) {
    st = _readUserRegisterRaw(reg, true);
  }
  if (!st.ok()) {
    if (isI2cFailure(st.code)) {
      return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
    }
    return st;
  }

  // End-of-battery is set by the device from VDD, not by reset.
  const uint8_t resetBits = static_cast<uint8_t>(reg & ~cmd::USER_REG_END_OF_BATTERY);
  _defaultsVerified = (resetBits == cmd::USER_REG_DEFAULT);

  _initialized = true;
  _driverState = DriverState::READY;

  return Status::Ok();
}

void HTU21D::end() {
  _initialized = false;
  _defaultsVerified = false;
  _driverState = DriverState::UNINIT;
}

Status HTU21D::probe() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, false);
  if (!st.ok()) {
    if (isI2cFailure(st.code)) {
      return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
    }
    return st;
  }

  return Status::Ok();
}

Status HTU21D::softReset() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Status st = _writeCommand(cmd::CMD_SOFT_RESET, true);
  if (!st.ok()) {
    return st;
  }

  return _waitMs(RESET_DELAY_MS);
}

Status HTU21D::readTemperature(MeasureMode mode, TempUnit unit, float& out,
                               bool verifyCrc) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (unit != TempUnit::CELSIUS && unit != TempUnit::FAHRENHEIT) {
    return Status::Error(Err::UNSUPPORTED, "Unsupported temperature unit",
                         static_cast<int32_t>(unit));
  }

  uint16_t raw = 0;
  Status st = _measure(MeasureKind::TEMPERATURE, mode, verifyCrc, raw);
  if (!st.ok()) {
    return st;
  }

  out = (unit == TempUnit::CELSIUS) ? convertTemperatureC(raw) : convertTemperatureF(raw);
  return Status::Ok();
}

Status HTU21D::readHumidity(MeasureMode mode, float& out, bool verifyCrc) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint16_t raw = 0;
  Status st = _measure(MeasureKind::HUMIDITY, mode, verifyCrc, raw);
  if (!st.ok()) {
    return st;
  }

  out = convertHumidityPct(raw);
  return Status::Ok();
}

Status HTU21D::readTemperatureRaw(MeasureMode mode, uint16_t& raw, bool verifyCrc) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  return _measure(MeasureKind::TEMPERATURE, mode, verifyCrc, raw);
}

Status HTU21D::readHumidityRaw(MeasureMode mode, uint16_t& raw, bool verifyCrc) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  return _measure(MeasureKind::HUMIDITY, mode, verifyCrc, raw);
}

Status HTU21D::readUserRegister(uint8_t& value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  return _readUserRegisterRaw(value, true);
}

Status HTU21D::readUserRegister(UserRegister& out) {
  uint8_t raw = 0;
  Status st = readUserRegister(raw);
  if (!st.ok()) {
    return st;
  }

  out = parseUserRegister(raw);
  return Status::Ok();
}

Status HTU21D::writeUserRegister(uint8_t value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  return _writeCommandWithData(cmd::CMD_WRITE_USER_REG, value);
}

Status HTU21D::setResolution(Resolution res) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  if (!isValidResolution(res)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid resolution");
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, true);
  if (!st.ok()) {
    return st;
  }

  return _writeCommandWithData(cmd::CMD_WRITE_USER_REG, applyResolution(reg, res));
}

Status HTU21D::getResolution(Resolution& out) {
  UserRegister reg;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  out = reg.resolution;
  return Status::Ok();
}

Status HTU21D::toggleHeater() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, true);
  if (!st.ok()) {
    return st;
  }

  reg ^= cmd::USER_REG_HEATER_ENABLE;
  return _writeCommandWithData(cmd::CMD_WRITE_USER_REG, reg);
}

Status HTU21D::setHeater(bool enable) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, true);
  if (!st.ok()) {
    return st;
  }

  const uint8_t updated = enable
      ? static_cast<uint8_t>(reg | cmd::USER_REG_HEATER_ENABLE)
      : static_cast<uint8_t>(reg & ~cmd::USER_REG_HEATER_ENABLE);
  if (updated == reg) {
    return Status::Ok();
  }

  return _writeCommandWithData(cmd::CMD_WRITE_USER_REG, updated);
}

Status HTU21D::toggleOtpReload() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, true);
  if (!st.ok()) {
    return st;
  }

  reg ^= cmd::USER_REG_DISABLE_OTP_RELOAD;
  return _writeCommandWithData(cmd::CMD_WRITE_USER_REG, reg);
}

Status HTU21D::readEndOfBattery(bool& lowVoltage) {
  UserRegister reg;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  lowVoltage = reg.endOfBattery;
  return Status::Ok();
}

Status HTU21D::readHeaterEnabled(bool& enabled) {
  UserRegister reg;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  enabled = reg.heaterEnabled;
  return Status::Ok();
}

Status HTU21D::readOtpReloadEnabled(bool& enabled) {
  UserRegister reg;
  Status st = readUserRegister(reg);
  if (!st.ok()) {
    return st;
  }
  enabled = reg.otpReloadEnabled;
  return Status::Ok();
}

bool HTU21D::checkCrc(uint16_t raw, uint8_t checksum) {
  uint32_t remainder = (static_cast<uint32_t>(raw) << 8) | checksum;
  uint32_t divisor = cmd::CRC_DIVISOR;

  // Long division over the 16 data bits (bit 23 down to bit 8)
  for (uint8_t i = 0; i < 16; ++i) {
    if ((remainder & (1UL << (23 - i))) != 0) {
      remainder ^= divisor;
    }
    divisor >>= 1;
  }

  return remainder == 0;
}

uint8_t HTU21D::computeCrc(uint16_t raw) {
  const uint8_t data[cmd::DATA_WORD_BYTES] = {
      static_cast<uint8_t>(raw >> 8), static_cast<uint8_t>(raw & 0xFF)};
  return _crc8(data, sizeof(data));
}

Status HTU21D::decodeFrame(const uint8_t* data, size_t len, bool verifyCrc,
                           FramePolicy policy, uint16_t& raw) {
  if (data == nullptr && len > 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid frame buffer");
  }

  if (len != cmd::MEASUREMENT_FRAME_LEN) {
    if (policy == FramePolicy::LEGACY_ZERO) {
      raw = 0;
      return Status::Ok();
    }
    return Status::Error(Err::MALFORMED_FRAME, "Frame length != 3",
                         static_cast<int32_t>(len));
  }

  const uint16_t value = static_cast<uint16_t>((data[0] << 8) | data[1]);
  if (verifyCrc && !checkCrc(value, data[2])) {
    return Status::Error(Err::CRC_MISMATCH, "CRC mismatch", data[2]);
  }

  raw = maskRaw(value);
  return Status::Ok();
}

float HTU21D::convertTemperatureC(uint32_t raw) {
  return -46.85f + (175.72f * static_cast<float>(raw)) / 65536.0f;
}

float HTU21D::convertTemperatureF(uint32_t raw) {
  return (convertTemperatureC(raw) * 9.0f) / 5.0f + 32.0f;
}

float HTU21D::convertHumidityPct(uint32_t raw) {
  return -6.0f + (125.0f * static_cast<float>(raw)) / 65536.0f;
}

uint8_t HTU21D::applyResolution(uint8_t reg, Resolution res) {
  const uint8_t kept = static_cast<uint8_t>(reg & ~cmd::USER_REG_RESOLUTION_MASK);
  const uint8_t bits = static_cast<uint8_t>(static_cast<uint8_t>(res) &
                                            cmd::USER_REG_RESOLUTION_MASK);
  return static_cast<uint8_t>(kept | bits);
}

UserRegister HTU21D::parseUserRegister(uint8_t raw) {
  UserRegister out;
  out.raw = raw;
  out.resolution = static_cast<Resolution>(raw & cmd::USER_REG_RESOLUTION_MASK);
  out.endOfBattery = (raw & cmd::USER_REG_END_OF_BATTERY) != 0;
  out.heaterEnabled = (raw & cmd::USER_REG_HEATER_ENABLE) != 0;
  out.otpReloadEnabled = (raw & cmd::USER_REG_DISABLE_OTP_RELOAD) == 0;
  return out;
}

uint32_t HTU21D::conversionTimeMs(Resolution res, MeasureKind kind) {
  if (kind == MeasureKind::HUMIDITY) {
    switch (res) {
      case Resolution::RH12_T14: return 16;
      case Resolution::RH10_T13: return 5;
      case Resolution::RH8_T12: return 3;
      case Resolution::RH11_T11: return 8;
      default: return 16;
    }
  }

  switch (res) {
    case Resolution::RH12_T14: return 50;
    case Resolution::RH10_T13: return 25;
    case Resolution::RH8_T12: return 13;
    case Resolution::RH11_T11: return 7;
    default: return 50;
  }
}

float HTU21D::computeCompensatedHumidity(float humidityPct, float temperatureC) {
  return humidityPct + (25.0f - temperatureC) * COMPENSATION_COEFF;
}

float HTU21D::computeDewPointC(float humidityPct, float temperatureC) {
  const float partialPressure = std::pow(10.0f, DEW_A - DEW_B / (temperatureC + DEW_C));
  return -(DEW_B / (std::log10(humidityPct * partialPressure / 100.0f) - DEW_A) + DEW_C);
}

Status HTU21D::_i2cReadRaw(uint8_t* rxBuf, size_t rxLen) {
  if (_config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write-read not set");
  }
  return _config.i2cWriteRead(_config.i2cAddress, nullptr, 0, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status HTU21D::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (_config.i2cWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write not set");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                          _config.i2cUser);
}

Status HTU21D::_i2cReadTracked(uint8_t* rxBuf, size_t rxLen) {
  if (rxBuf == nullptr || rxLen == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cReadRaw(rxBuf, rxLen);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status HTU21D::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteRaw(buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status HTU21D::_writeCommand(uint8_t command, bool tracked) {
  const uint8_t buf[1] = {command};
  return tracked ? _i2cWriteTracked(buf, sizeof(buf)) : _i2cWriteRaw(buf, sizeof(buf));
}

Status HTU21D::_writeCommandWithData(uint8_t command, uint8_t data) {
  // Command and value in one transaction
  const uint8_t payload[MAX_WRITE_LEN] = {command, data};
  return _i2cWriteTracked(payload, sizeof(payload));
}

Status HTU21D::_readUserRegisterRaw(uint8_t& value, bool tracked) {
  Status st = _writeCommand(cmd::CMD_READ_USER_REG, tracked);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::USER_REG_DATA_LEN] = {};
  st = tracked ? _i2cReadTracked(buf, sizeof(buf)) : _i2cReadRaw(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  value = buf[0];
  return Status::Ok();
}

Status HTU21D::_measure(MeasureKind kind, MeasureMode mode, bool verifyCrc,
                        uint16_t& raw) {
  if (!isValidMode(mode)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid measure mode");
  }

  uint32_t delayMs = _config.holdSettleMs;
  if (mode == MeasureMode::NO_HOLD) {
    Status st = _noHoldDelayMs(kind, delayMs);
    if (!st.ok()) {
      return st;
    }
  }

  Status st = _writeCommand(_commandForMeasurement(kind, mode), true);
  if (!st.ok()) {
    return st;
  }

  st = _waitMs(delayMs);
  if (!st.ok()) {
    return st;
  }

  // Transport fills all 3 bytes or fails; short reads never reach decodeFrame
  uint8_t buf[cmd::MEASUREMENT_FRAME_LEN] = {};
  st = _i2cReadTracked(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  return decodeFrame(buf, sizeof(buf), verifyCrc, _config.framePolicy, raw);
}

Status HTU21D::_noHoldDelayMs(MeasureKind kind, uint32_t& delayMs) {
  if (_config.noHoldDelayMs > 0) {
    delayMs = _config.noHoldDelayMs;
    return Status::Ok();
  }

  uint8_t reg = 0;
  Status st = _readUserRegisterRaw(reg, true);
  if (!st.ok()) {
    return st;
  }

  const Resolution res = parseUserRegister(reg).resolution;
  delayMs = conversionTimeMs(res, kind) + CONVERSION_MARGIN_MS;
  return Status::Ok();
}

Status HTU21D::_updateHealth(const Status& st) {
  const uint32_t now = millis();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (!_initialized) {
    if (st.ok()) {
      _lastOkMs = now;
    } else {
      _lastError = st;
      _lastErrorMs = now;
    }
    return st;
  }

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

Status HTU21D::_waitMs(uint32_t delayMs) {
  if (delayMs == 0) {
    return Status::Ok();
  }

  const uint32_t startMs = millis();
  const uint32_t deadline = startMs + delayMs;
  const uint32_t timeoutMs = delayMs + _config.i2cTimeoutMs;
  uint32_t lastMs = startMs;
  uint32_t stableLoops = 0;

  while (true) {
    const uint32_t nowMs = millis();
    if (_timeElapsed(nowMs, deadline)) {
      break;
    }
    if (static_cast<uint32_t>(nowMs - startMs) > timeoutMs) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
    if (nowMs != lastMs) {
      lastMs = nowMs;
      stableLoops = 0;
    } else if (++stableLoops >= MAX_SPIN_ITERS) {
      return Status::Error(Err::TIMEOUT, "Wait timeout");
    }
  }

  return Status::Ok();
}

uint8_t HTU21D::_crc8(const uint8_t* data, size_t len) {
  uint8_t crc = 0x00;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      if (crc & 0x80) {
        crc = static_cast<uint8_t>((crc << 1) ^ cmd::CRC_POLY);
      } else {
        crc = static_cast<uint8_t>(crc << 1);
      }
    }
  }
  return crc;
}

uint8_t HTU21D::_commandForMeasurement(MeasureKind kind, MeasureMode mode) {
  if (kind == MeasureKind::HUMIDITY) {
    return (mode == MeasureMode::HOLD) ? cmd::CMD_TRIGGER_HUMIDITY_HOLD
                                       : cmd::CMD_TRIGGER_HUMIDITY_NO_HOLD;
  }
  return (mode == MeasureMode::HOLD) ? cmd::CMD_TRIGGER_TEMP_HOLD
                                     : cmd::CMD_TRIGGER_TEMP_NO_HOLD;
}

bool HTU21D::_timeElapsed(uint32_t now, uint32_t target) {
  return static_cast<int32_t>(now - target) >= 0;
}

}  // namespace HTU21D
