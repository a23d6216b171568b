/// @file I2cTransport.h
/// @brief Wire-based I2C transport adapter for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "BMP180/Status.h"

namespace transport {

using BMP180::Status;
using BMP180::Err;

/// Initialize Wire for examples
/// @param sda SDA pin
/// @param scl SCL pin
/// @param freqHz I2C clock frequency
/// @param timeoutMs Wire timeout in milliseconds
/// @return true if initialized
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  // Example-only convenience. In a managed bus, the manager should own these settings.
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// Map an Arduino Wire endTransmission() result to a driver status
inline Status mapWireResult(uint8_t result, const char* context) {
  // Arduino Wire error codes (core-dependent): 1=data too long, 2=NACK addr, 3=NACK data,
  // 4=other, 5=timeout (ESP32 Arduino core).
  switch (result) {
    case 0: return Status::Ok();
    case 1: return Status::Error(Err::INVALID_PARAM, "I2C write too long", result);
    case 2: return Status::Error(Err::DEVICE_NOT_FOUND, "I2C NACK addr", result);
    case 5: return Status::Error(Err::TIMEOUT, "I2C timeout", result);
    default: return Status::Error(Err::I2C_ERROR, context, result);
  }
}

/// Bus open callback: checks that the address ACKs
inline Status wireOpen(uint8_t addr, void* user) {
  (void)user;
  Wire.beginTransmission(addr);
  return mapWireResult(Wire.endTransmission(true), "I2C open failed");
}

/// I2C write callback using Wire library
/// @param addr I2C device address (7-bit)
/// @param data Data buffer to write
/// @param len Number of bytes to write
/// @param timeoutMs Timeout requested by the driver (manager-owned in shared buses)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  Wire.beginTransmission(addr);
  size_t written = Wire.write(data, len);
  Status st = mapWireResult(Wire.endTransmission(true), "I2C write failed");
  if (!st.ok()) {
    return st;
  }
  if (written != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }

  return Status::Ok();
}

/// I2C write-read callback using Wire library
/// Register address is written, then read with a repeated START.
/// @param addr I2C device address (7-bit)
/// @param txData Register address bytes
/// @param txLen Number of bytes to write
/// @param rxData Buffer for read data
/// @param rxLen Number of bytes to read
/// @param timeoutMs Timeout requested by the driver (manager-owned in shared buses)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                            uint8_t* rxData, size_t rxLen,
                            uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  if (txLen > 0) {
    Wire.beginTransmission(addr);
    Wire.write(txData, txLen);
    Status st = mapWireResult(Wire.endTransmission(false), "I2C write phase failed");
    if (!st.ok()) {
      return st;
    }
  }

  if (rxLen == 0) {
    return Status::Ok();
  }

  size_t received = Wire.requestFrom(addr, rxLen);
  if (received != rxLen) {
    for (size_t i = 0; i < received; i++) {
      (void)Wire.read();
    }
    return Status::Error(Err::I2C_ERROR, "I2C read incomplete", static_cast<int32_t>(received));
  }

  for (size_t i = 0; i < rxLen; i++) {
    rxData[i] = Wire.read();
  }

  return Status::Ok();
}

} // namespace transport
