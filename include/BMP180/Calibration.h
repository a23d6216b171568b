/// @file Calibration.h
/// @brief Factory calibration coefficients and their EEPROM decode
#pragma once

#include <cstddef>
#include <cstdint>
#include "BMP180/Status.h"
#include "BMP180/CommandTable.h"

namespace BMP180 {

/// Calibration coefficients (datasheet names, EEPROM order)
struct Calibration {
  int16_t ac1 = 0;
  int16_t ac2 = 0;
  int16_t ac3 = 0;
  uint16_t ac4 = 0;
  uint16_t ac5 = 0;
  uint16_t ac6 = 0;
  int16_t b1 = 0;
  int16_t b2 = 0;
  int16_t mb = 0;
  int16_t mc = 0;
  int16_t md = 0;
};

/// Raw calibration EEPROM block
struct CalibrationRaw {
  uint8_t bytes[cmd::CALIB_LEN] = {};
};

/// Decode the 22-byte EEPROM block into coefficients.
/// Writes out only when the whole block decodes.
/// @param data Bytes read from REG_CALIB_START
/// @param len  Must be cmd::CALIB_LEN
/// @param out  Decoded coefficients
Status decodeCalibration(const uint8_t* data, size_t len, Calibration& out);

} // namespace BMP180
