/// @file main.cpp
/// @brief Basic bringup example for BMP180
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"

#include "BMP180/BMP180.h"

// ============================================================================
// Globals
// ============================================================================

BMP180::BMP180 device;
BMP180::Config gConfig;
bool gConfigReady = false;
bool watchMode = false;
uint32_t lastPrintedCycle = 0;
volatile uint32_t gErrorCount = 0;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(BMP180::Err err) {
  using namespace BMP180;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::TIMEOUT: return "TIMEOUT";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::CHIP_ID_MISMATCH: return "CHIP_ID_MISMATCH";
    case Err::NOT_CALIBRATED: return "NOT_CALIBRATED";
    case Err::MEASUREMENT_NOT_READY: return "MEASUREMENT_NOT_READY";
    case Err::COMPENSATION_ERROR: return "COMPENSATION_ERROR";
    case Err::BUSY: return "BUSY";
    case Err::ABORTED: return "ABORTED";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(BMP180::DriverState st) {
  using namespace BMP180;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

const char* osrsToStr(BMP180::Oversampling osrs) {
  using namespace BMP180;
  switch (osrs) {
    case Oversampling::ULTRA_LOW_POWER: return "ULTRA_LOW_POWER";
    case Oversampling::STANDARD: return "STANDARD";
    case Oversampling::HIGH_RES: return "HIGH_RES";
    case Oversampling::ULTRA_HIGH_RES: return "ULTRA_HIGH_RES";
    default: return "UNKNOWN";
  }
}

void printStatus(const BMP180::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

/// Error sink. Runs on the acquisition thread.
void onDriverError(const BMP180::Status& st, void* user) {
  (void)user;
  gErrorCount = gErrorCount + 1;
  char label[BMP180::MAX_NAME_LEN + 1] = {};
  (void)device.getName(label, sizeof(label));
  LOGW("[%s] cycle error: %s (%s)", label, errToStr(st.code), st.msg);
}

void printDriverHealth() {
  char label[BMP180::MAX_NAME_LEN + 1] = {};
  (void)device.getName(label, sizeof(label));
  Serial.println("=== Driver State ===");
  Serial.printf("  Name: %s\n", label);
  Serial.printf("  State: %s\n", stateToStr(device.state()));
  Serial.printf("  Online: %s\n", device.isOnline() ? "YES" : "NO");
  Serial.printf("  Running: %s\n", device.isRunning() ? "YES" : "NO");
  Serial.printf("  Calibrated: %s\n", device.isCalibrated() ? "YES" : "NO");
  Serial.printf("  Cycles: %lu\n", static_cast<unsigned long>(device.cycleCount()));
  Serial.printf("  Reported errors: %lu\n", static_cast<unsigned long>(gErrorCount));
  Serial.printf("  Consecutive failures: %u\n", device.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(device.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(device.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(device.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != BMP180::Err::OK) {
    Serial.printf("  Last error: %s\n", errToStr(device.lastError().code));
  }
}

void printMeasurement(const BMP180::Measurement& m) {
  Serial.printf("Temp: %.1f C, Pressure: %.0f Pa (%.2f hPa)\n",
                m.temperatureC, m.pressurePa, m.pressurePa / 100.0f);
}

void printConfig() {
  BMP180::Oversampling osrs;
  if (device.getOversampling(osrs).ok()) {
    Serial.println("=== Config ===");
    Serial.printf("  Oversampling: %s\n", osrsToStr(osrs));
    Serial.printf("  Poll interval: %lu ms\n",
                  static_cast<unsigned long>(device.pollIntervalMs()));
    Serial.printf("  Est. cycle time: %lu ms\n",
                  static_cast<unsigned long>(device.estimateMeasurementTimeMs()));
  }
  Serial.printf("  Watch: %s\n", watchMode ? "ON" : "OFF");
}

void printCalibration() {
  BMP180::Calibration cal;
  const BMP180::Status st = device.getCalibration(cal);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.println("=== Calibration ===");
  Serial.printf("  AC1=%d AC2=%d AC3=%d\n", cal.ac1, cal.ac2, cal.ac3);
  Serial.printf("  AC4=%u AC5=%u AC6=%u\n", cal.ac4, cal.ac5, cal.ac6);
  Serial.printf("  B1=%d B2=%d\n", cal.b1, cal.b2);
  Serial.printf("  MB=%d MC=%d MD=%d\n", cal.mb, cal.mc, cal.md);
}

bool parseOversampling(const String& token, BMP180::Oversampling& out) {
  String t = token;
  t.toLowerCase();
  if (t == "0" || t == "ulp") {
    out = BMP180::Oversampling::ULTRA_LOW_POWER;
    return true;
  }
  if (t == "1" || t == "std") {
    out = BMP180::Oversampling::STANDARD;
    return true;
  }
  if (t == "2" || t == "hr") {
    out = BMP180::Oversampling::HIGH_RES;
    return true;
  }
  if (t == "3" || t == "uhr") {
    out = BMP180::Oversampling::ULTRA_HIGH_RES;
    return true;
  }
  return false;
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  start                    - Load calibration and start polling");
  Serial.println("  stop                     - Stop polling");
  Serial.println("  read                     - Print last reading");
  Serial.println("  raw                      - Print last raw sample");
  Serial.println("  comp                     - Print last fixed-point sample");
  Serial.println("  watch [0|1]              - Print every new cycle");
  Serial.println("  mode [0-3|ulp|std|hr|uhr] - Set or show oversampling");
  Serial.println("  interval [ms]            - Set or show poll interval");
  Serial.println("  name [label]             - Set or show device name");
  Serial.println("  cal                      - Show calibration coefficients");
  Serial.println("  chipid                   - Read chip ID register");
  Serial.println("  cfg                      - Show current config");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  begin                    - Re-initialize driver");
  Serial.println("  end                      - End driver session");
  Serial.println("  probe                    - Probe device (no health tracking)");
  Serial.println("  recover                  - Manual recovery attempt");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();
  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "start") {
    BMP180::Status st = device.start();
    printStatus(st);
    return;
  }

  if (cmd == "stop") {
    device.stop();
    LOGI("Polling stopped after %lu cycles",
         static_cast<unsigned long>(device.cycleCount()));
    return;
  }

  if (cmd == "read") {
    BMP180::Measurement m;
    const BMP180::Status st = device.getMeasurement(m);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printMeasurement(m);
    return;
  }

  if (cmd == "raw") {
    BMP180::RawSample sample;
    const BMP180::Status st = device.getRawSample(sample);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Raw: UT=%d UP=%ld\n", sample.rawTemperature,
                  static_cast<long>(sample.rawPressure));
    return;
  }

  if (cmd == "comp") {
    BMP180::CompensatedSample sample;
    const BMP180::Status st = device.getCompensatedSample(sample);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Comp: T=%ld (x10), P=%ld Pa\n",
                  static_cast<long>(sample.tempC_x10),
                  static_cast<long>(sample.pressurePa));
    return;
  }

  if (cmd == "watch") {
    Serial.printf("Watch: %s\n", watchMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("watch ")) {
    watchMode = (cmd.substring(6).toInt() != 0);
    lastPrintedCycle = device.cycleCount();
    LOGI("Watch mode: %s", watchMode ? "ON" : "OFF");
    return;
  }

  if (cmd == "mode") {
    BMP180::Oversampling osrs;
    if (device.getOversampling(osrs).ok()) {
      Serial.printf("Oversampling: %s\n", osrsToStr(osrs));
    }
    return;
  }

  if (cmd.startsWith("mode ")) {
    String arg = cmd.substring(5);
    arg.trim();
    BMP180::Oversampling osrs;
    if (!parseOversampling(arg, osrs)) {
      LOGW("Invalid mode: %s", arg.c_str());
      return;
    }
    printStatus(device.setOversampling(osrs));
    return;
  }

  if (cmd == "interval") {
    Serial.printf("Poll interval: %lu ms\n",
                  static_cast<unsigned long>(device.pollIntervalMs()));
    return;
  }

  if (cmd.startsWith("interval ")) {
    const long ms = cmd.substring(9).toInt();
    if (ms <= 0) {
      LOGW("Invalid interval");
      return;
    }
    printStatus(device.setPollIntervalMs(static_cast<uint32_t>(ms)));
    return;
  }

  if (cmd == "name") {
    char label[BMP180::MAX_NAME_LEN + 1] = {};
    const BMP180::Status st = device.getName(label, sizeof(label));
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Name: %s\n", label);
    return;
  }

  if (cmd.startsWith("name ")) {
    String arg = cmd.substring(5);
    arg.trim();
    printStatus(device.setName(arg.c_str()));
    return;
  }

  if (cmd == "cal") {
    printCalibration();
    return;
  }

  if (cmd == "chipid") {
    uint8_t id = 0;
    BMP180::Status st = device.readChipId(id);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Chip ID: 0x%02X (%s)\n", id,
                  id == BMP180::cmd::CHIP_ID_BMP180 ? "BMP180" : "unexpected");
    return;
  }

  if (cmd == "cfg") {
    printConfig();
    return;
  }

  if (cmd == "begin") {
    if (!gConfigReady) {
      LOGW("Config not ready");
      return;
    }
    BMP180::Status st = device.begin(gConfig);
    printStatus(st);
    return;
  }

  if (cmd == "end") {
    device.end();
    LOGI("Driver ended");
    return;
  }

  if (cmd == "drv") {
    printDriverHealth();
    printConfig();
    return;
  }

  if (cmd == "probe") {
    LOGI("Probing device (no health tracking)...");
    BMP180::Status st = device.probe();
    printStatus(st);
    return;
  }

  if (cmd == "recover") {
    LOGI("Attempting recovery...");
    BMP180::Status st = device.recover();
    printStatus(st);
    printDriverHealth();
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== BMP180 Bringup Example (v%s) ===", BMP180::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cWriteRead = transport::wireWriteRead;
  gConfig.busOpen = transport::wireOpen;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfig.pollIntervalMs = board::BARO_POLL_INTERVAL_MS;
  gConfig.onError = onDriverError;
  gConfig.offlineThreshold = 5;
  gConfigReady = true;

  BMP180::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    printStatus(st);
    return;
  }

  st = device.probe();
  if (!st.ok()) {
    LOGW("Probe failed");
    printStatus(st);
  }

  LOGI("Device initialized successfully");
  printDriverHealth();
  printHelp();
  Serial.print("> ");
}

void loop() {
  if (watchMode && device.cycleCount() != lastPrintedCycle) {
    lastPrintedCycle = device.cycleCount();
    BMP180::Measurement m;
    if (device.getMeasurement(m).ok()) {
      printMeasurement(m);
    }
  }

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
