/**
 * @file Calibration.cpp
 * @brief Calibration EEPROM decode.
 */

#include "BMP180/Calibration.h"

namespace BMP180 {
namespace {

static int16_t readS16BE(const uint8_t* data, size_t offset) {
  return static_cast<int16_t>((data[offset] << 8) | data[offset + 1]);
}

static uint16_t readU16BE(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

static size_t offsetOf(uint8_t reg) {
  return static_cast<size_t>(reg - cmd::REG_CALIB_START);
}

}  // namespace

Status decodeCalibration(const uint8_t* data, size_t len, Calibration& out) {
  if (data == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Calibration buffer is null");
  }
  if (len != cmd::CALIB_LEN) {
    return Status::Error(Err::INVALID_PARAM, "Calibration block must be 22 bytes",
                         static_cast<int32_t>(len));
  }

  Calibration cal;
  cal.ac1 = readS16BE(data, offsetOf(cmd::REG_AC1_MSB));
  cal.ac2 = readS16BE(data, offsetOf(cmd::REG_AC2_MSB));
  cal.ac3 = readS16BE(data, offsetOf(cmd::REG_AC3_MSB));
  cal.ac4 = readU16BE(data, offsetOf(cmd::REG_AC4_MSB));
  cal.ac5 = readU16BE(data, offsetOf(cmd::REG_AC5_MSB));
  cal.ac6 = readU16BE(data, offsetOf(cmd::REG_AC6_MSB));
  cal.b1 = readS16BE(data, offsetOf(cmd::REG_B1_MSB));
  cal.b2 = readS16BE(data, offsetOf(cmd::REG_B2_MSB));
  cal.mb = readS16BE(data, offsetOf(cmd::REG_MB_MSB));
  cal.mc = readS16BE(data, offsetOf(cmd::REG_MC_MSB));
  cal.md = readS16BE(data, offsetOf(cmd::REG_MD_MSB));

  out = cal;
  return Status::Ok();
}

}  // namespace BMP180
