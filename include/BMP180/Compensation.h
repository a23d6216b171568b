/// @file Compensation.h
/// @brief Oversampling table and fixed-point compensation (datasheet 3.5)
#pragma once

#include <cstddef>
#include <cstdint>
#include "BMP180/Status.h"
#include "BMP180/Config.h"
#include "BMP180/Calibration.h"

namespace BMP180 {

/// @return true for the four defined oversampling settings
bool isValidOversampling(Oversampling osrs);

/// @return Pressure conversion time in ms (5/8/14/26)
uint32_t settleTimeMs(Oversampling osrs);

/// @return oss value (0..3) used for shifts and the command byte
uint8_t shiftAmount(Oversampling osrs);

/// @return Control register value that starts a pressure conversion
uint8_t pressureCommand(Oversampling osrs);

/// Assemble MSB/LSB/XLSB into the uncompensated pressure (UP)
/// @param data 3 bytes read from REG_PRESS_MSB
int32_t rawPressureFromBytes(const uint8_t* data, Oversampling osrs);

/// Assemble MSB/LSB into the uncompensated temperature (UT)
int16_t rawTemperatureFromBytes(const uint8_t* data);

/// B5 intermediate shared by temperature and pressure
/// @return COMPENSATION_ERROR if X1 + MD is zero
Status computeB5(const Calibration& cal, int32_t rawTemp, int32_t& b5);

/// True temperature in 0.1 degC from B5
int32_t temperatureFromB5(int32_t b5);

/// True pressure in Pa
/// @param b5 Computed from the same cycle's raw temperature
/// @return COMPENSATION_ERROR if B4 is zero
Status compensatePressure(const Calibration& cal, int32_t b5, int32_t rawPressure,
                          Oversampling osrs, int32_t& pressurePa);

} // namespace BMP180
