/// @file I2cTransport.h
/// @brief Wire-based I2C transport adapter for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "HTU21D/Status.h"

namespace transport {

using HTU21D::Status;
using HTU21D::Err;

/// Configure Wire for the HTU21D.
/// The Wire timeout bounds hold-mode clock stretching (up to 50 ms at
/// 14-bit temperature resolution), so keep it above that.
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// Translate a Wire endTransmission() result into a driver Status.
/// Codes are core-dependent; 5 (timeout) is ESP32 only.
inline Status mapWireError(uint8_t result) {
  switch (result) {
    case 0: return Status::Ok();
    case 1: return Status::Error(Err::INVALID_PARAM, "I2C write too long", result);
    case 2: return Status::Error(Err::I2C_NACK_ADDR, "I2C NACK addr", result);
    case 3: return Status::Error(Err::I2C_NACK_DATA, "I2C NACK data", result);
    case 4: return Status::Error(Err::I2C_BUS, "I2C bus error", result);
    case 5: return Status::Error(Err::I2C_TIMEOUT, "I2C timeout", result);
    default: return Status::Error(Err::I2C_ERROR, "I2C write failed", result);
  }
}

/// Driver write callback. Sends a single opcode (trigger, reset, read
/// register) or opcode + user register value, always as one transaction
/// closed with STOP.
inline Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;  // Wire timeout is set once in initWire()

  Wire.beginTransmission(addr);
  const size_t written = Wire.write(data, len);
  Status st = mapWireError(Wire.endTransmission(true));
  if (!st.ok()) {
    return st;
  }
  if (written != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }
  return Status::Ok();
}

/// Driver read callback. The HTU21D answers a previously written opcode
/// with 1 byte (user register) or 3 bytes (MSB, LSB, CRC), so combined
/// write+read is rejected.
inline Status wireWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                            uint8_t* rxData, size_t rxLen,
                            uint32_t timeoutMs, void* user) {
  (void)txData;
  (void)timeoutMs;
  (void)user;

  if (txLen > 0) {
    return Status::Error(Err::INVALID_PARAM, "Combined write+read not supported");
  }
  if (rxLen == 0) {
    return Status::Ok();
  }

  const size_t received = Wire.requestFrom(addr, rxLen);
  if (received == 0) {
    // Address NACK and hold-mode stretch timeout are indistinguishable here
    return Status::Error(Err::I2C_ERROR, "I2C read returned 0 bytes", 0);
  }
  if (received != rxLen) {
    // Discard the partial frame so the next read starts clean
    while (Wire.available() > 0) {
      (void)Wire.read();
    }
    return Status::Error(Err::I2C_ERROR, "I2C read incomplete", static_cast<int32_t>(received));
  }

  for (size_t i = 0; i < rxLen; ++i) {
    rxData[i] = static_cast<uint8_t>(Wire.read());
  }
  return Status::Ok();
}

} // namespace transport
