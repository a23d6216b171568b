/**
 * @file Compensation.cpp
 * @brief Oversampling table and integer compensation per BMP180 datasheet.
 */

#include "BMP180/Compensation.h"

namespace BMP180 {

bool isValidOversampling(Oversampling osrs) {
  return static_cast<uint8_t>(osrs) <= static_cast<uint8_t>(Oversampling::ULTRA_HIGH_RES);
}

uint32_t settleTimeMs(Oversampling osrs) {
  switch (osrs) {
    case Oversampling::ULTRA_LOW_POWER: return cmd::PRESS_CONVERSION_ULP_MS;
    case Oversampling::STANDARD: return cmd::PRESS_CONVERSION_STD_MS;
    case Oversampling::HIGH_RES: return cmd::PRESS_CONVERSION_HR_MS;
    case Oversampling::ULTRA_HIGH_RES: return cmd::PRESS_CONVERSION_UHR_MS;
    default: return cmd::PRESS_CONVERSION_UHR_MS;
  }
}

uint8_t shiftAmount(Oversampling osrs) {
  return static_cast<uint8_t>(osrs) & 0x03;
}

uint8_t pressureCommand(Oversampling osrs) {
  return static_cast<uint8_t>(cmd::CMD_PRESSURE |
                              ((shiftAmount(osrs) << cmd::BIT_CTRL_MEAS_OSS) &
                               cmd::MASK_CTRL_MEAS_OSS));
}

int32_t rawPressureFromBytes(const uint8_t* data, Oversampling osrs) {
  const int32_t raw = (static_cast<int32_t>(data[0]) << 16) |
                      (static_cast<int32_t>(data[1]) << 8) |
                      static_cast<int32_t>(data[2]);
  return raw >> (cmd::PRESS_RAW_SHIFT_BASE - shiftAmount(osrs));
}

int16_t rawTemperatureFromBytes(const uint8_t* data) {
  return static_cast<int16_t>((data[0] << 8) | data[1]);
}

Status computeB5(const Calibration& cal, int32_t rawTemp, int32_t& b5) {
  const int32_t x1 = ((rawTemp - static_cast<int32_t>(cal.ac6)) *
                      static_cast<int32_t>(cal.ac5)) >> 15;
  const int32_t denom = x1 + static_cast<int32_t>(cal.md);
  if (denom == 0) {
    return Status::Error(Err::COMPENSATION_ERROR, "Temperature div by zero");
  }
  // mc is negative on real parts; multiply instead of shifting a negative value
  const int32_t x2 = (static_cast<int32_t>(cal.mc) * 2048) / denom;
  b5 = x1 + x2;
  return Status::Ok();
}

int32_t temperatureFromB5(int32_t b5) {
  return (b5 + 8) >> 4;
}

Status compensatePressure(const Calibration& cal, int32_t b5, int32_t rawPressure,
                          Oversampling osrs, int32_t& pressurePa) {
  const uint8_t oss = shiftAmount(osrs);

  const int32_t b6 = b5 - 4000;
  int32_t x1 = (static_cast<int32_t>(cal.b2) * ((b6 * b6) >> 12)) >> 11;
  int32_t x2 = (static_cast<int32_t>(cal.ac2) * b6) >> 11;
  int32_t x3 = x1 + x2;
  const int32_t b3 = (((static_cast<int32_t>(cal.ac1) * 4 + x3) * (1 << oss)) + 2) >> 2;

  x1 = (static_cast<int32_t>(cal.ac3) * b6) >> 13;
  x2 = (static_cast<int32_t>(cal.b1) * ((b6 * b6) >> 12)) >> 16;
  x3 = ((x1 + x2) + 2) >> 2;
  const uint32_t b4 = (static_cast<uint32_t>(cal.ac4) *
                       static_cast<uint32_t>(x3 + 32768)) >> 15;
  if (b4 == 0) {
    return Status::Error(Err::COMPENSATION_ERROR, "Pressure div by zero");
  }

  // B7 wraps as unsigned 32-bit when UP < B3
  const uint32_t b7 = static_cast<uint32_t>(rawPressure - b3) *
                      (static_cast<uint32_t>(50000) >> oss);

  int32_t p;
  if (b7 < 0x80000000U) {
    p = static_cast<int32_t>((b7 << 1) / b4);
  } else {
    p = static_cast<int32_t>((b7 / b4) << 1);
  }

  x1 = (p >> 8) * (p >> 8);
  x1 = (x1 * 3038) >> 16;
  x2 = (-7357 * p) >> 16;
  pressurePa = p + ((x1 + x2 + 3791) >> 4);

  return Status::Ok();
}

}  // namespace BMP180
