/// @file Status.h
/// @brief Error codes and status handling for BMP180 driver
#pragma once

#include <cstdint>

namespace BMP180 {

/// Error codes for all BMP180 operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  I2C_ERROR,              ///< I2C communication failure
  TIMEOUT,                ///< Operation timed out
  INVALID_PARAM,          ///< Invalid parameter value
  DEVICE_NOT_FOUND,       ///< Device not responding on I2C bus
  CHIP_ID_MISMATCH,       ///< Chip ID != 0x55 (not a BMP180)
  NOT_CALIBRATED,         ///< Acquisition attempted before calibration load
  MEASUREMENT_NOT_READY,  ///< No complete sample yet
  COMPENSATION_ERROR,     ///< Compensation math failed (zero divisor)
  BUSY,                   ///< Acquisition already running
  ABORTED                 ///< Acquisition interrupted by stop()
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

} // namespace BMP180
