/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

/// Start the serial console and wait briefly for USB CDC hosts
inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  const uint32_t start = millis();
  while (!Serial && (millis() - start) < 2000) {
    delay(10);
  }
}

#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)
#define LOGW(fmt, ...) Serial.printf("[W] " fmt "\n", ##__VA_ARGS__)
#define LOGE(fmt, ...) Serial.printf("[E] " fmt "\n", ##__VA_ARGS__)
