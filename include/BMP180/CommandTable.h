/// @file CommandTable.h
/// @brief Register addresses, commands and timing for BMP180
#pragma once

#include <cstddef>
#include <cstdint>

namespace BMP180 {
namespace cmd {

// ============================================================================
// Device Address
// ============================================================================

static constexpr uint8_t I2C_ADDRESS = 0x77;  // Fixed, no address pin

// ============================================================================
// Chip Identification
// ============================================================================

static constexpr uint8_t REG_CHIP_ID = 0xD0;
static constexpr uint8_t CHIP_ID_BMP180 = 0x55;

// ============================================================================
// Calibration EEPROM (burst read 0xAA..0xBF, 11 big-endian words)
// ============================================================================

static constexpr uint8_t REG_CALIB_START = 0xAA;
static constexpr size_t CALIB_LEN = 22;

static constexpr uint8_t REG_AC1_MSB = 0xAA;
static constexpr uint8_t REG_AC2_MSB = 0xAC;
static constexpr uint8_t REG_AC3_MSB = 0xAE;
static constexpr uint8_t REG_AC4_MSB = 0xB0;
static constexpr uint8_t REG_AC5_MSB = 0xB2;
static constexpr uint8_t REG_AC6_MSB = 0xB4;
static constexpr uint8_t REG_B1_MSB = 0xB6;
static constexpr uint8_t REG_B2_MSB = 0xB8;
static constexpr uint8_t REG_MB_MSB = 0xBA;
static constexpr uint8_t REG_MC_MSB = 0xBC;
static constexpr uint8_t REG_MD_MSB = 0xBE;

// ============================================================================
// Control and Measurement
// ============================================================================

static constexpr uint8_t REG_CTRL_MEAS = 0xF4;
static constexpr uint8_t CMD_TEMPERATURE = 0x2E;
static constexpr uint8_t CMD_PRESSURE = 0x34;   // OR'd with oss << 6

// Result registers (0xF6 MSB, 0xF7 LSB, 0xF8 XLSB)
static constexpr uint8_t REG_OUT_MSB = 0xF6;
static constexpr uint8_t REG_TEMP_MSB = REG_OUT_MSB;
static constexpr uint8_t REG_PRESS_MSB = REG_OUT_MSB;
static constexpr size_t TEMP_DATA_LEN = 2;
static constexpr size_t PRESS_DATA_LEN = 3;

// ============================================================================
// Bit Positions / Masks
// ============================================================================

static constexpr uint8_t BIT_CTRL_MEAS_OSS = 6;
static constexpr uint8_t MASK_CTRL_MEAS_OSS = 0xC0;

// Raw pressure is 19 bits max; the 24-bit result is shifted right by (8 - oss)
static constexpr uint8_t PRESS_RAW_SHIFT_BASE = 8;

// ============================================================================
// Conversion Times (ms, rounded up from datasheet max)
// ============================================================================

static constexpr uint32_t TEMP_CONVERSION_MS = 5;
static constexpr uint32_t PRESS_CONVERSION_ULP_MS = 5;    // 4.5 ms
static constexpr uint32_t PRESS_CONVERSION_STD_MS = 8;    // 7.5 ms
static constexpr uint32_t PRESS_CONVERSION_HR_MS = 14;    // 13.5 ms
static constexpr uint32_t PRESS_CONVERSION_UHR_MS = 26;   // 25.5 ms

} // namespace cmd
} // namespace BMP180
