/**
 * @file BMP180.cpp
 * @brief BMP180 driver implementation.
 */

#include "BMP180/BMP180.h"

#include <chrono>
#include <cstring>
#include <limits>

namespace BMP180 {
namespace {

static constexpr size_t MAX_WRITE_LEN = 1;

static Status notInitialized() {
  return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
}

static Status aborted() {
  return Status::Error(Err::ABORTED, "Stop requested");
}

}  // namespace

BMP180::~BMP180() {
  end();
}

Status BMP180::begin(const Config& config) {
  if (_onWorkerThread()) {
    return Status::Error(Err::BUSY, "begin() from acquisition thread");
  }
  stop();

  _initialized = false;
  _calibrated = false;
  _calibration = Calibration{};

  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    _driverState = DriverState::UNINIT;

    _lastOkMs = 0;
    _lastErrorMs = 0;
    _lastError = Status::Ok();
    _consecutiveFailures = 0;
    _totalFailures = 0;
    _totalSuccess = 0;

    _measurement = Measurement{};
    _rawSample = RawSample{};
    _compSample = CompensatedSample{};
    _sampleValid = false;
    _sampleTimestampMs = 0;
    _cycleCount = 0;
  }

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress != cmd::I2C_ADDRESS) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address", config.i2cAddress);
  }
  if (!isValidOversampling(config.oversampling)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid oversampling");
  }
  if (config.pollIntervalMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Poll interval must be > 0");
  }
  if (!_isValidName(config.name)) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid device name");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }
  _oversampling = static_cast<uint8_t>(_config.oversampling);
  _pollIntervalMs = _config.pollIntervalMs;
  Status st = setName(_config.name);
  if (!st.ok()) {
    return st;
  }

  if (_config.busOpen != nullptr) {
    st = _config.busOpen(_config.i2cAddress, _config.i2cUser);
    if (!st.ok()) {
      return st;
    }
  }

  _initialized = true;
  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    _driverState = DriverState::READY;
  }

  return Status::Ok();
}

Status BMP180::start() {
  if (!_initialized) {
    return notInitialized();
  }
  if (_onWorkerThread()) {
    return Status::Error(Err::BUSY, "start() from acquisition thread");
  }

  std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
  if (_running.load()) {
    return Status::Error(Err::BUSY, "Acquisition already running");
  }
  // Thread may have exited on its own after a stop() from the error callback
  if (_worker.joinable()) {
    _worker.join();
    _workerId = std::thread::id();
  }

  Status st = loadCalibration();
  if (!st.ok()) {
    return st;
  }

  {
    std::lock_guard<std::mutex> lock(_stopMutex);
    _stopRequested = false;
  }
  _running = true;
  _worker = std::thread(&BMP180::_pollLoop, this);

  return Status::Ok();
}

void BMP180::stop() {
  if (_onWorkerThread()) {
    // Called from onError: the loop exits after the callback returns
    std::lock_guard<std::mutex> lock(_stopMutex);
    _stopRequested = true;
    _stopCv.notify_all();
    return;
  }

  std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
  {
    std::lock_guard<std::mutex> lock(_stopMutex);
    _stopRequested = true;
  }
  _stopCv.notify_all();

  if (_worker.joinable()) {
    _worker.join();
    _workerId = std::thread::id();
  }
  _running = false;

  std::lock_guard<std::mutex> lock(_stopMutex);
  _stopRequested = false;
}

void BMP180::end() {
  stop();
  if (_onWorkerThread()) {
    return;
  }

  _initialized = false;
  _calibrated = false;
  std::lock_guard<std::mutex> lock(_stateMutex);
  _driverState = DriverState::UNINIT;
}

Status BMP180::probe() {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  uint8_t chipId = 0;
  Status st = _readRegisterRaw(cmd::REG_CHIP_ID, chipId);
  if (!st.ok()) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
  }
  if (chipId != cmd::CHIP_ID_BMP180) {
    return Status::Error(Err::CHIP_ID_MISMATCH, "Chip ID mismatch", chipId);
  }

  return Status::Ok();
}

Status BMP180::recover() {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  uint8_t chipId = 0;
  Status st = readRegister(cmd::REG_CHIP_ID, chipId);
  if (!st.ok()) {
    return st;
  }
  if (chipId != cmd::CHIP_ID_BMP180) {
    return Status::Error(Err::CHIP_ID_MISMATCH, "Chip ID mismatch", chipId);
  }

  return Status::Ok();
}

Status BMP180::readChipId(uint8_t& id) {
  if (!_initialized) {
    return notInitialized();
  }
  std::lock_guard<std::mutex> bus(_busMutex);
  return readRegister(cmd::REG_CHIP_ID, id);
}

DriverState BMP180::state() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _driverState;
}

uint32_t BMP180::lastOkMs() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _lastOkMs;
}

uint32_t BMP180::lastErrorMs() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _lastErrorMs;
}

Status BMP180::lastError() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _lastError;
}

uint8_t BMP180::consecutiveFailures() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _consecutiveFailures;
}

uint32_t BMP180::totalFailures() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _totalFailures;
}

uint32_t BMP180::totalSuccess() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _totalSuccess;
}

uint32_t BMP180::cycleCount() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _cycleCount;
}

uint32_t BMP180::sampleTimestampMs() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _sampleTimestampMs;
}

Status BMP180::loadCalibration() {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  if (_calibrated.load()) {
    return Status::Ok();
  }
  return _readCalibration();
}

Status BMP180::getCalibration(Calibration& out) const {
  if (!_initialized) {
    return notInitialized();
  }
  if (!_calibrated.load()) {
    return Status::Error(Err::NOT_CALIBRATED, "Calibration not loaded");
  }

  out = _calibration;
  return Status::Ok();
}

Status BMP180::readCalibrationRaw(CalibrationRaw& out) {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  return readRegs(cmd::REG_CALIB_START, out.bytes, sizeof(out.bytes));
}

Status BMP180::acquireRawTemperature(int16_t& out) {
  if (!_initialized) {
    return notInitialized();
  }
  if (!_calibrated.load()) {
    return Status::Error(Err::NOT_CALIBRATED, "Calibration not loaded");
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  return _acquireRawTemperature(out);
}

Status BMP180::acquireRawPressure(Oversampling osrs, int32_t& out) {
  if (!_initialized) {
    return notInitialized();
  }
  if (!isValidOversampling(osrs)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid oversampling");
  }
  if (!_calibrated.load()) {
    return Status::Error(Err::NOT_CALIBRATED, "Calibration not loaded");
  }

  std::lock_guard<std::mutex> bus(_busMutex);
  return _acquireRawPressure(osrs, out);
}

float BMP180::temperatureC() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _measurement.temperatureC;
}

float BMP180::pressurePa() const {
  std::lock_guard<std::mutex> lock(_stateMutex);
  return _measurement.pressurePa;
}

Status BMP180::getMeasurement(Measurement& out) const {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  if (!_sampleValid) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "Measurement not ready");
  }
  out = _measurement;
  return Status::Ok();
}

Status BMP180::getRawSample(RawSample& out) const {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  if (!_sampleValid) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "Measurement not ready");
  }
  out = _rawSample;
  return Status::Ok();
}

Status BMP180::getCompensatedSample(CompensatedSample& out) const {
  if (!_initialized) {
    return notInitialized();
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  if (!_sampleValid) {
    return Status::Error(Err::MEASUREMENT_NOT_READY, "Measurement not ready");
  }
  out = _compSample;
  return Status::Ok();
}

Status BMP180::setOversampling(Oversampling osrs) {
  if (!_initialized) {
    return notInitialized();
  }
  if (!isValidOversampling(osrs)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid oversampling");
  }

  _oversampling = static_cast<uint8_t>(osrs);
  return Status::Ok();
}

Status BMP180::getOversampling(Oversampling& out) const {
  if (!_initialized) {
    return notInitialized();
  }
  out = static_cast<Oversampling>(_oversampling.load());
  return Status::Ok();
}

Status BMP180::setPollIntervalMs(uint32_t intervalMs) {
  if (intervalMs == 0) {
    return Status::Error(Err::INVALID_PARAM, "Poll interval must be > 0");
  }
  _pollIntervalMs = intervalMs;
  return Status::Ok();
}

Status BMP180::setName(const char* name) {
  if (!_isValidName(name)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid device name");
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  std::memset(_name, 0, sizeof(_name));
  std::memcpy(_name, name, std::strlen(name));
  return Status::Ok();
}

Status BMP180::getName(char* out, size_t len) const {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Null name buffer");
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  const size_t nameLen = std::strlen(_name);
  if (len <= nameLen) {
    return Status::Error(Err::INVALID_PARAM, "Name buffer too small",
                         static_cast<int32_t>(nameLen + 1));
  }
  std::memcpy(out, _name, nameLen + 1);
  return Status::Ok();
}

uint32_t BMP180::estimateMeasurementTimeMs() const {
  const Oversampling osrs = static_cast<Oversampling>(_oversampling.load());
  return cmd::TEMP_CONVERSION_MS + settleTimeMs(osrs);
}

Status BMP180::_i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                                uint8_t* rxBuf, size_t rxLen) {
  if (_config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write-read not set");
  }
  return _config.i2cWriteRead(_config.i2cAddress, txBuf, txLen, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status BMP180::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (_config.i2cWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write not set");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                          _config.i2cUser);
}

Status BMP180::_i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                                    uint8_t* rxBuf, size_t rxLen) {
  if (txBuf == nullptr || txLen == 0 || (rxLen > 0 && rxBuf == nullptr)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteReadRaw(txBuf, txLen, rxBuf, rxLen);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status BMP180::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteRaw(buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status BMP180::readRegs(uint8_t startReg, uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  uint8_t reg = startReg;
  return _i2cWriteReadTracked(&reg, 1, buf, len);
}

Status BMP180::writeRegister(uint8_t reg, uint8_t value) {
  const uint8_t payload[MAX_WRITE_LEN + 1] = {reg, value};
  return _i2cWriteTracked(payload, sizeof(payload));
}

Status BMP180::readRegister(uint8_t reg, uint8_t& value) {
  return readRegs(reg, &value, 1);
}

Status BMP180::_readRegisterRaw(uint8_t reg, uint8_t& value) {
  uint8_t addr = reg;
  return _i2cWriteReadRaw(&addr, 1, &value, 1);
}

Status BMP180::_updateHealth(const Status& st) {
  if (!_initialized) {
    return st;
  }

  const uint32_t now = _nowMs();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  std::lock_guard<std::mutex> lock(_stateMutex);
  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

Status BMP180::_readCalibration() {
  uint8_t raw[cmd::CALIB_LEN] = {};
  Status st = readRegs(cmd::REG_CALIB_START, raw, sizeof(raw));
  if (!st.ok()) {
    return st;
  }

  Calibration cal;
  st = decodeCalibration(raw, sizeof(raw), cal);
  if (!st.ok()) {
    return st;
  }

  _calibration = cal;
  _calibrated = true;
  return Status::Ok();
}

Status BMP180::_acquireRawTemperature(int16_t& out) {
  Status st = writeRegister(cmd::REG_CTRL_MEAS, cmd::CMD_TEMPERATURE);
  if (!st.ok()) {
    return st;
  }

  if (!_waitMs(cmd::TEMP_CONVERSION_MS)) {
    return aborted();
  }

  uint8_t data[cmd::TEMP_DATA_LEN] = {};
  st = readRegs(cmd::REG_TEMP_MSB, data, sizeof(data));
  if (!st.ok()) {
    return st;
  }

  out = rawTemperatureFromBytes(data);
  return Status::Ok();
}

Status BMP180::_acquireRawPressure(Oversampling osrs, int32_t& out) {
  Status st = writeRegister(cmd::REG_CTRL_MEAS, pressureCommand(osrs));
  if (!st.ok()) {
    return st;
  }

  if (!_waitMs(settleTimeMs(osrs))) {
    return aborted();
  }

  uint8_t data[cmd::PRESS_DATA_LEN] = {};
  st = readRegs(cmd::REG_PRESS_MSB, data, sizeof(data));
  if (!st.ok()) {
    return st;
  }

  out = rawPressureFromBytes(data, osrs);
  return Status::Ok();
}

Status BMP180::_runCycle() {
  // One mode value for command, shift and compensation of this cycle
  const Oversampling osrs = static_cast<Oversampling>(_oversampling.load());

  std::lock_guard<std::mutex> bus(_busMutex);

  int16_t rawTemp = 0;
  Status st = _acquireRawTemperature(rawTemp);
  if (!st.ok()) {
    return st;
  }

  int32_t b5 = 0;
  st = computeB5(_calibration, rawTemp, b5);
  if (!st.ok()) {
    return st;
  }
  const int32_t tempC_x10 = temperatureFromB5(b5);

  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    _rawSample.rawTemperature = rawTemp;
    _compSample.tempC_x10 = tempC_x10;
    _measurement.temperatureC = static_cast<float>(tempC_x10) / 10.0f;
  }

  int32_t rawPressure = 0;
  st = _acquireRawPressure(osrs, rawPressure);
  if (!st.ok()) {
    return st;
  }

  int32_t pressurePa = 0;
  st = compensatePressure(_calibration, b5, rawPressure, osrs, pressurePa);
  if (!st.ok()) {
    return st;
  }

  std::lock_guard<std::mutex> lock(_stateMutex);
  _rawSample.rawPressure = rawPressure;
  _compSample.pressurePa = pressurePa;
  _measurement.pressurePa = static_cast<float>(pressurePa);
  _sampleValid = true;
  _sampleTimestampMs = _nowMs();

  return Status::Ok();
}

void BMP180::_pollLoop() {
  _workerId = std::this_thread::get_id();

  while (!_stopPending()) {
    const Status st = _runCycle();
    if (st.code == Err::ABORTED) {
      break;
    }

    {
      std::lock_guard<std::mutex> lock(_stateMutex);
      if (_cycleCount < std::numeric_limits<uint32_t>::max()) {
        _cycleCount++;
      }
    }

    if (!st.ok()) {
      _reportError(st);
    }

    if (!_waitMs(_pollIntervalMs.load())) {
      break;
    }
  }

  _running = false;
}

void BMP180::_reportError(const Status& st) {
  if (_config.onError != nullptr) {
    _config.onError(st, _config.errorUser);
  }
}

bool BMP180::_waitMs(uint32_t ms) {
  std::unique_lock<std::mutex> lock(_stopMutex);
  return !_stopCv.wait_for(lock, std::chrono::milliseconds(ms),
                           [this] { return _stopRequested; });
}

bool BMP180::_onWorkerThread() const {
  return _workerId.load() == std::this_thread::get_id();
}

bool BMP180::_stopPending() {
  std::lock_guard<std::mutex> lock(_stopMutex);
  return _stopRequested;
}

uint32_t BMP180::_nowMs() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

bool BMP180::_isValidName(const char* name) {
  if (name == nullptr || name[0] == '\0') {
    return false;
  }
  return std::strlen(name) <= MAX_NAME_LEN;
}

}  // namespace BMP180
