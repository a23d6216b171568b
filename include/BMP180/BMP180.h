/// @file BMP180.h
/// @brief Main driver class for BMP180
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include "BMP180/Status.h"
#include "BMP180/Config.h"
#include "BMP180/CommandTable.h"
#include "BMP180/Calibration.h"
#include "BMP180/Compensation.h"
#include "BMP180/Version.h"

namespace BMP180 {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Measurement result (float)
struct Measurement {
  float temperatureC = 0.0f; ///< Temperature in Celsius (0.1 degC resolution)
  float pressurePa = 0.0f;   ///< Pressure in Pascals
};

/// Raw ADC values
struct RawSample {
  int16_t rawTemperature = 0; ///< Uncompensated temperature (UT)
  int32_t rawPressure = 0;    ///< Uncompensated pressure (UP), already shifted by 8 - oss
};

/// Fixed-point compensated values (no float)
struct CompensatedSample {
  int32_t tempC_x10 = 0;  ///< Temperature * 10 (e.g., 150 = 15.0 degC)
  int32_t pressurePa = 0; ///< Pressure in Pa
};

/// BMP180 driver class
///
/// start() runs acquisition on a background thread; readings are published
/// through the lock-guarded accessors below.
class BMP180 {
public:
  BMP180() = default;
  ~BMP180();

  BMP180(const BMP180&) = delete;
  BMP180& operator=(const BMP180&) = delete;

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Validate configuration and open the bus (no calibration read)
  /// @param config Configuration including transport callbacks
  /// @return Status::Ok() on success, error otherwise
  Status begin(const Config& config);

  /// Load calibration (first call only) and launch background acquisition.
  /// Blocks until calibration succeeds or fails; on failure nothing is launched.
  /// @return BUSY if already running
  Status start();

  /// Stop background acquisition. Returns once the thread has exited.
  /// Safe to call when not running and from several threads at once.
  /// From onError it only requests the stop; the loop exits after the callback.
  void stop();

  /// Stop acquisition and release the device
  void end();

  /// @return true while the background thread is active
  bool isRunning() const { return _running.load(); }

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Check if device is present on the bus (no health tracking)
  /// @return Status::Ok() if device responds, error otherwise
  Status probe();

  /// Re-check device with tracked I/O (clears failure streak on success)
  /// @return Status::Ok() if device now responsive, error otherwise
  Status recover();

  /// Read chip ID register (expected 0x55)
  Status readChipId(uint8_t& id);

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const;

  /// Check if driver is ready for operations
  bool isOnline() const {
    const DriverState st = state();
    return st == DriverState::READY || st == DriverState::DEGRADED;
  }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const;

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const;

  /// Most recent error status
  Status lastError() const;

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const;

  /// Total failure count (lifetime)
  uint32_t totalFailures() const;

  /// Total success count (lifetime)
  uint32_t totalSuccess() const;

  /// Completed acquisition cycles (successful or not)
  uint32_t cycleCount() const;

  /// Timestamp of the last complete temperature + pressure sample
  uint32_t sampleTimestampMs() const;

  // =========================================================================
  // Calibration
  // =========================================================================

  /// Read and decode the calibration EEPROM. No-op once loaded.
  Status loadCalibration();

  /// @return true once calibration has been loaded
  bool isCalibrated() const { return _calibrated.load(); }

  /// Get cached calibration coefficients
  Status getCalibration(Calibration& out) const;

  /// Read raw calibration EEPROM (does not touch the cached coefficients)
  Status readCalibrationRaw(CalibrationRaw& out);

  // =========================================================================
  // Acquisition
  // =========================================================================

  /// Start a temperature conversion, wait 5 ms, read UT
  Status acquireRawTemperature(int16_t& out);

  /// Start a pressure conversion with osrs, wait its settle time, read UP
  Status acquireRawPressure(Oversampling osrs, int32_t& out);

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Last temperature in Celsius (0 before the first sample)
  float temperatureC() const;

  /// Last pressure in Pascals (0 before the first sample)
  float pressurePa() const;

  /// Snapshot of both readings
  /// Returns MEASUREMENT_NOT_READY until a full cycle has completed
  Status getMeasurement(Measurement& out) const;

  /// Get raw ADC values of the last complete sample
  Status getRawSample(RawSample& out) const;

  /// Get fixed-point compensated values of the last complete sample
  Status getCompensatedSample(CompensatedSample& out) const;

  // =========================================================================
  // Configuration
  // =========================================================================

  /// Set pressure oversampling; takes effect at the next cycle
  Status setOversampling(Oversampling osrs);

  /// Get pressure oversampling
  Status getOversampling(Oversampling& out) const;

  /// Set delay between cycles; takes effect at the next wait
  Status setPollIntervalMs(uint32_t intervalMs);

  /// Delay between cycles in ms
  uint32_t pollIntervalMs() const { return _pollIntervalMs.load(); }

  /// Set device label (1..MAX_NAME_LEN characters)
  Status setName(const char* name);

  /// Copy the device label into out (NUL-terminated)
  /// @param len Size of out, at least MAX_NAME_LEN + 1 always suffices
  /// @return INVALID_PARAM if out is null or too small
  Status getName(char* out, size_t len) const;

  // =========================================================================
  // Timing
  // =========================================================================

  /// Duration of one temperature + pressure acquisition at current oversampling
  uint32_t estimateMeasurementTimeMs() const;

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Raw I2C write-read (no health tracking)
  Status _i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                          uint8_t* rxBuf, size_t rxLen);

  /// Raw I2C write (no health tracking)
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);

  /// Tracked I2C write-read (updates health)
  Status _i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                              uint8_t* rxBuf, size_t rxLen);

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  // =========================================================================
  // Register Access
  // =========================================================================

  /// Read registers (uses tracked path)
  Status readRegs(uint8_t startReg, uint8_t* buf, size_t len);

  /// Write single register (uses tracked path)
  Status writeRegister(uint8_t reg, uint8_t value);

  /// Read single register (uses tracked path)
  Status readRegister(uint8_t reg, uint8_t& value);

  /// Read single register (raw path)
  Status _readRegisterRaw(uint8_t reg, uint8_t& value);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  // =========================================================================
  // Internal
  // =========================================================================

  // Callers hold _busMutex
  Status _readCalibration();
  Status _acquireRawTemperature(int16_t& out);
  Status _acquireRawPressure(Oversampling osrs, int32_t& out);

  Status _runCycle();
  void _pollLoop();
  void _reportError(const Status& st);

  /// Sleep unless stop() is requested
  /// @return false if woken by a stop request
  bool _waitMs(uint32_t ms);
  bool _stopPending();
  bool _onWorkerThread() const;

  static uint32_t _nowMs();
  static bool _isValidName(const char* name);

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  std::atomic<bool> _initialized{false};
  DriverState _driverState = DriverState::UNINIT;
  char _name[MAX_NAME_LEN + 1] = "BMP180";

  std::atomic<uint8_t> _oversampling{static_cast<uint8_t>(Oversampling::STANDARD)};
  std::atomic<uint32_t> _pollIntervalMs{10};

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;

  // Calibration data (written once under _busMutex)
  Calibration _calibration;
  std::atomic<bool> _calibrated{false};

  // Published readings (guarded by _stateMutex)
  Measurement _measurement;
  RawSample _rawSample;
  CompensatedSample _compSample;
  bool _sampleValid = false;
  uint32_t _sampleTimestampMs = 0;
  uint32_t _cycleCount = 0;

  // Acquisition thread
  std::thread _worker;
  std::atomic<std::thread::id> _workerId{};
  std::atomic<bool> _running{false};
  std::mutex _lifecycleMutex;  // serializes start() and stop()
  bool _stopRequested = false;
  std::mutex _stopMutex;
  std::condition_variable _stopCv;

  std::mutex _busMutex;
  mutable std::mutex _stateMutex;
};

} // namespace BMP180
