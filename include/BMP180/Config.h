/// @file Config.h
/// @brief Configuration structure for BMP180 driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "BMP180/Status.h"
#include "BMP180/CommandTable.h"

namespace BMP180 {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C write-then-read callback signature
/// @param addr     I2C device address (7-bit)
/// @param txData   Pointer to data to write (register address)
/// @param txLen    Number of bytes to write
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure
/// @note May be called from the acquisition thread while start() is active.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Optional bus open callback, called once from begin()
/// @param addr I2C device address (7-bit)
/// @param user User context pointer (Config::i2cUser)
/// @return Status indicating success or failure
using BusOpenFn = Status (*)(uint8_t addr, void* user);

/// Error sink for failures during background acquisition
/// @param st   Failure reported by the acquisition cycle
/// @param user User context pointer (Config::errorUser)
/// @note Runs on the acquisition thread with no driver lock held.
///       Must return promptly; the next cycle waits for it.
using ErrorFn = void (*)(const Status& st, void* user);

/// Pressure oversampling setting (oss)
enum class Oversampling : uint8_t {
  ULTRA_LOW_POWER = 0,  ///< 1 sample, 4.5 ms
  STANDARD = 1,         ///< 2 samples, 7.5 ms
  HIGH_RES = 2,         ///< 4 samples, 13.5 ms
  ULTRA_HIGH_RES = 3    ///< 8 samples, 25.5 ms
};

/// Maximum label length (excluding terminator)
static constexpr size_t MAX_NAME_LEN = 15;

/// Configuration for BMP180 driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;        ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C write-read function pointer
  void* i2cUser = nullptr;               ///< User context for callbacks
  BusOpenFn busOpen = nullptr;           ///< Optional bus open hook

  // === Device Settings ===
  uint8_t i2cAddress = cmd::I2C_ADDRESS; ///< Always 0x77 on BMP180
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms
  const char* name = "BMP180";           ///< Human-readable device label

  // === Measurement Settings ===
  Oversampling oversampling = Oversampling::STANDARD; ///< Pressure oversampling
  uint32_t pollIntervalMs = 10;          ///< Delay between acquisition cycles

  // === Error Sink ===
  ErrorFn onError = nullptr;             ///< Called for each failed cycle step
  void* errorUser = nullptr;             ///< User context for onError

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE state
};

} // namespace BMP180
