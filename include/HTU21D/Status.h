/// @file Status.h
/// @brief Error codes and status handling for HTU21D driver
#pragma once

#include <cstdint>

namespace HTU21D {

/// Error codes for all HTU21D operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  I2C_ERROR,              ///< I2C communication failure
  TIMEOUT,                ///< Operation timed out
  INVALID_PARAM,          ///< Invalid parameter value
  DEVICE_NOT_FOUND,       ///< Device not responding on I2C bus
  CRC_MISMATCH,           ///< Measurement checksum did not match
  MALFORMED_FRAME,        ///< Result frame length was not 3 bytes
  UNSUPPORTED,            ///< Unit or operation not supported
  I2C_NACK_ADDR,          ///< Address not acknowledged
  I2C_NACK_DATA,          ///< Data byte not acknowledged
  I2C_NACK_READ,          ///< Read header not acknowledged
  I2C_TIMEOUT,            ///< Transport timeout
  I2C_BUS                 ///< Bus or arbitration error
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace HTU21D
