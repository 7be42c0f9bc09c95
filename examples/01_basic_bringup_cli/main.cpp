/// @file main.cpp
/// @brief Basic bringup example for HTU21D
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <limits>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"
#include "common/I2cScanner.h"

#include "HTU21D/HTU21D.h"

// ============================================================================
// Globals
// ============================================================================

struct StressStats {
  bool active = false;
  uint32_t startMs = 0;
  int target = 0;
  int attempts = 0;
  int success = 0;
  uint32_t errors = 0;
  float minTemp = 0.0f;
  float maxTemp = 0.0f;
  double sumTemp = 0.0;
  HTU21D::Status lastError = HTU21D::Status::Ok();
};

HTU21D::HTU21D device;
HTU21D::Config gConfig;
bool gConfigReady = false;
HTU21D::MeasureMode gMode = HTU21D::MeasureMode::NO_HOLD;
bool streamMode = false;
uint32_t streamIntervalMs = 1000;
uint32_t lastStreamMs = 0;
StressStats stressStats;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(HTU21D::Err err) {
  using namespace HTU21D;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::TIMEOUT: return "TIMEOUT";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::CRC_MISMATCH: return "CRC_MISMATCH";
    case Err::MALFORMED_FRAME: return "MALFORMED_FRAME";
    case Err::UNSUPPORTED: return "UNSUPPORTED";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_NACK_READ: return "I2C_NACK_READ";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(HTU21D::DriverState st) {
  using namespace HTU21D;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

const char* resToStr(HTU21D::Resolution res) {
  using namespace HTU21D;
  switch (res) {
    case Resolution::RH12_T14: return "RH12/T14";
    case Resolution::RH10_T13: return "RH10/T13";
    case Resolution::RH8_T12: return "RH8/T12";
    case Resolution::RH11_T11: return "RH11/T11";
    default: return "UNKNOWN";
  }
}

const char* modeToStr(HTU21D::MeasureMode mode) {
  return (mode == HTU21D::MeasureMode::HOLD) ? "HOLD" : "NO_HOLD";
}

void printStatus(const HTU21D::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printDriverHealth() {
  Serial.println("=== Driver State ===");
  Serial.printf("  State: %s\n", stateToStr(device.state()));
  Serial.printf("  Online: %s\n", device.isOnline() ? "YES" : "NO");
  Serial.printf("  Defaults verified: %s\n", device.defaultsVerified() ? "YES" : "NO");
  Serial.printf("  Consecutive failures: %u\n", device.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(device.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(device.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(device.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != HTU21D::Err::OK) {
    Serial.printf("  Last error: %s\n", errToStr(device.lastError().code));
  }
}

void printUserRegister(const HTU21D::UserRegister& reg) {
  Serial.println("=== User Register ===");
  Serial.printf("  Raw: 0x%02X\n", reg.raw);
  Serial.printf("  Resolution: %s\n", resToStr(reg.resolution));
  Serial.printf("  End of battery: %s\n", reg.endOfBattery ? "YES" : "NO");
  Serial.printf("  Heater: %s\n", reg.heaterEnabled ? "ON" : "OFF");
  Serial.printf("  OTP reload: %s\n", reg.otpReloadEnabled ? "ENABLED" : "DISABLED");
}

void printConfig() {
  Serial.println("=== Config ===");
  Serial.printf("  Mode: %s\n", modeToStr(gMode));
  Serial.printf("  Hold settle: %lu ms\n", static_cast<unsigned long>(gConfig.holdSettleMs));
  if (gConfig.noHoldDelayMs == 0) {
    Serial.println("  No-hold delay: by resolution");
  } else {
    Serial.printf("  No-hold delay: %lu ms\n", static_cast<unsigned long>(gConfig.noHoldDelayMs));
  }
  Serial.printf("  Frame policy: %s\n",
                gConfig.framePolicy == HTU21D::FramePolicy::LEGACY_ZERO ? "LEGACY_ZERO"
                                                                        : "REPORT_ERROR");
  Serial.printf("  Stream: %s (%lu ms)\n", streamMode ? "ON" : "OFF",
                static_cast<unsigned long>(streamIntervalMs));
}

/// Read Celsius, Fahrenheit and humidity; prints them on success
bool readAll(float& tempC, float& humidity) {
  float tempF = 0.0f;
  HTU21D::Status st = device.readTemperature(gMode, HTU21D::TempUnit::CELSIUS, tempC);
  if (!st.ok()) {
    printStatus(st);
    return false;
  }
  st = device.readTemperature(gMode, HTU21D::TempUnit::FAHRENHEIT, tempF);
  if (!st.ok()) {
    printStatus(st);
    return false;
  }
  st = device.readHumidity(gMode, humidity);
  if (!st.ok()) {
    printStatus(st);
    return false;
  }

  Serial.printf("Temperature: %.2f C / %.2f F, Humidity: %.2f %%\n", tempC, tempF, humidity);
  return true;
}

void runStress(int count) {
  stressStats = StressStats{};
  stressStats.active = true;
  stressStats.startMs = millis();
  stressStats.target = count;
  stressStats.minTemp = std::numeric_limits<float>::max();
  stressStats.maxTemp = std::numeric_limits<float>::lowest();

  for (int i = 0; i < count; ++i) {
    float tempC = 0.0f;
    HTU21D::Status st = device.readTemperature(gMode, HTU21D::TempUnit::CELSIUS, tempC);
    stressStats.attempts++;
    if (!st.ok()) {
      stressStats.errors++;
      stressStats.lastError = st;
      continue;
    }
    stressStats.success++;
    stressStats.sumTemp += tempC;
    if (tempC < stressStats.minTemp) {
      stressStats.minTemp = tempC;
    }
    if (tempC > stressStats.maxTemp) {
      stressStats.maxTemp = tempC;
    }
  }

  const uint32_t durationMs = millis() - stressStats.startMs;
  stressStats.active = false;

  Serial.println("=== Stress Summary ===");
  Serial.printf("  Attempts: %d\n", stressStats.attempts);
  Serial.printf("  Success: %d\n", stressStats.success);
  Serial.printf("  Errors: %lu\n", static_cast<unsigned long>(stressStats.errors));
  Serial.printf("  Duration: %lu ms\n", static_cast<unsigned long>(durationMs));
  if (stressStats.success > 0) {
    const float avg = static_cast<float>(stressStats.sumTemp / stressStats.success);
    Serial.printf("  Temp C: min=%.2f avg=%.2f max=%.2f\n",
                  stressStats.minTemp, avg, stressStats.maxTemp);
  }
  if (!stressStats.lastError.ok()) {
    Serial.printf("  Last error: %s\n", errToStr(stressStats.lastError.code));
  }
}

bool parseU16(const String& token, uint16_t& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  unsigned long value = std::strtoul(str, &end, 0);
  if (end == str || *end != '\0') {
    return false;
  }
  if (value > 0xFFFFUL) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool parseResolution(const String& token, HTU21D::Resolution& out) {
  if (token == "14") {
    out = HTU21D::Resolution::RH12_T14;
    return true;
  }
  if (token == "13") {
    out = HTU21D::Resolution::RH10_T13;
    return true;
  }
  if (token == "12") {
    out = HTU21D::Resolution::RH8_T12;
    return true;
  }
  if (token == "11") {
    out = HTU21D::Resolution::RH11_T11;
    return true;
  }
  return false;
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  scan                     - Scan I2C bus");
  Serial.println("  read                     - Read temperature (C, F) and humidity");
  Serial.println("  temp [c|f]               - Read temperature");
  Serial.println("  hum                      - Read humidity");
  Serial.println("  raw                      - Read masked raw codes");
  Serial.println("  dew                      - Dew point and compensated humidity");
  Serial.println("  mode [hold|nohold]       - Set or show measurement mode");
  Serial.println("  reg                      - Read user register");
  Serial.println("  reg write <hex>          - Write user register");
  Serial.println("  res [14|13|12|11]        - Set or show resolution (temperature bits)");
  Serial.println("  heater [on|off|toggle]   - Control heater");
  Serial.println("  otp [toggle]             - Show or toggle OTP reload");
  Serial.println("  battery                  - Read end-of-battery flag");
  Serial.println("  convert <rawT> <rawRH>   - Convert raw values");
  Serial.println("  crc <hex16> <hex8>       - Check a value against a CRC byte");
  Serial.println("  reset                    - Soft reset device");
  Serial.println("  cfg                      - Show current config");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  begin                    - Re-initialize device");
  Serial.println("  end                      - End driver session");
  Serial.println("  probe                    - Probe device (no health tracking)");
  Serial.println("  stream [0|1]             - Periodic readings every second");
  Serial.println("  stress [N]               - Run N temperature reads");
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

  if (cmd == "scan") {
    i2c::scan();
    return;
  }

  if (cmd == "read") {
    float tempC = 0.0f;
    float humidity = 0.0f;
    (void)readAll(tempC, humidity);
    return;
  }

  if (cmd == "temp" || cmd.startsWith("temp ")) {
    HTU21D::TempUnit unit = HTU21D::TempUnit::CELSIUS;
    if (cmd.length() > 4) {
      String arg = cmd.substring(5);
      arg.trim();
      if (arg == "f") {
        unit = HTU21D::TempUnit::FAHRENHEIT;
      } else if (arg != "c") {
        LOGW("Usage: temp [c|f]");
        return;
      }
    }
    float value = 0.0f;
    HTU21D::Status st = device.readTemperature(gMode, unit, value);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Temperature: %.2f %s\n", value,
                  unit == HTU21D::TempUnit::CELSIUS ? "C" : "F");
    return;
  }

  if (cmd == "hum") {
    float value = 0.0f;
    HTU21D::Status st = device.readHumidity(gMode, value);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Humidity: %.2f %%\n", value);
    return;
  }

  if (cmd == "raw") {
    uint16_t rawT = 0;
    uint16_t rawRh = 0;
    HTU21D::Status st = device.readTemperatureRaw(gMode, rawT);
    if (st.ok()) {
      st = device.readHumidityRaw(gMode, rawRh);
    }
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Raw: T=0x%04X RH=0x%04X\n",
                  static_cast<unsigned>(rawT), static_cast<unsigned>(rawRh));
    return;
  }

  if (cmd == "dew") {
    float tempC = 0.0f;
    float humidity = 0.0f;
    if (!readAll(tempC, humidity)) {
      return;
    }
    Serial.printf("Dew point: %.2f C, Compensated RH: %.2f %%\n",
                  HTU21D::HTU21D::computeDewPointC(humidity, tempC),
                  HTU21D::HTU21D::computeCompensatedHumidity(humidity, tempC));
    return;
  }

  if (cmd == "mode") {
    Serial.printf("Mode: %s\n", modeToStr(gMode));
    return;
  }

  if (cmd.startsWith("mode ")) {
    String arg = cmd.substring(5);
    arg.trim();
    if (arg == "hold") {
      gMode = HTU21D::MeasureMode::HOLD;
    } else if (arg == "nohold") {
      gMode = HTU21D::MeasureMode::NO_HOLD;
    } else {
      LOGW("Invalid mode: %s", arg.c_str());
      return;
    }
    LOGI("Mode: %s", modeToStr(gMode));
    return;
  }

  if (cmd == "reg") {
    HTU21D::UserRegister reg;
    HTU21D::Status st = device.readUserRegister(reg);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printUserRegister(reg);
    return;
  }

  if (cmd.startsWith("reg write ")) {
    uint16_t value = 0;
    String arg = cmd.substring(10);
    arg.trim();
    if (!parseU16(arg, value) || value > 0xFF) {
      LOGW("Usage: reg write <hex8>");
      return;
    }
    HTU21D::Status st = device.writeUserRegister(static_cast<uint8_t>(value));
    printStatus(st);
    return;
  }

  if (cmd == "res") {
    HTU21D::Resolution res;
    HTU21D::Status st = device.getResolution(res);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Resolution: %s\n", resToStr(res));
    return;
  }

  if (cmd.startsWith("res ")) {
    String arg = cmd.substring(4);
    arg.trim();
    HTU21D::Resolution res;
    if (!parseResolution(arg, res)) {
      LOGW("Usage: res [14|13|12|11]");
      return;
    }
    HTU21D::Status st = device.setResolution(res);
    printStatus(st);
    return;
  }

  if (cmd == "heater") {
    bool enabled = false;
    HTU21D::Status st = device.readHeaterEnabled(enabled);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Heater: %s\n", enabled ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("heater ")) {
    String arg = cmd.substring(7);
    arg.trim();
    HTU21D::Status st;
    if (arg == "on") {
      st = device.setHeater(true);
    } else if (arg == "off") {
      st = device.setHeater(false);
    } else if (arg == "toggle") {
      st = device.toggleHeater();
    } else {
      LOGW("Usage: heater on|off|toggle");
      return;
    }
    printStatus(st);
    return;
  }

  if (cmd == "otp") {
    bool enabled = false;
    HTU21D::Status st = device.readOtpReloadEnabled(enabled);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("OTP reload: %s\n", enabled ? "ENABLED" : "DISABLED");
    return;
  }

  if (cmd == "otp toggle") {
    HTU21D::Status st = device.toggleOtpReload();
    printStatus(st);
    return;
  }

  if (cmd == "battery") {
    bool low = false;
    HTU21D::Status st = device.readEndOfBattery(low);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("End of battery: %s\n", low ? "YES (VDD < 2.25V)" : "NO");
    return;
  }

  if (cmd.startsWith("convert ")) {
    String args = cmd.substring(8);
    args.trim();
    const int split = args.indexOf(' ');
    if (split < 0) {
      LOGW("Usage: convert <rawT> <rawRH>");
      return;
    }
    const String tStr = args.substring(0, split);
    String rhStr = args.substring(split + 1);
    rhStr.trim();
    uint16_t rawT = 0;
    uint16_t rawRh = 0;
    if (!parseU16(tStr, rawT) || !parseU16(rhStr, rawRh)) {
      LOGW("Invalid raw values");
      return;
    }
    rawT = HTU21D::HTU21D::maskRaw(rawT);
    rawRh = HTU21D::HTU21D::maskRaw(rawRh);
    Serial.printf("Converted: T=%.2fC (%.2fF) RH=%.2f%%\n",
                  HTU21D::HTU21D::convertTemperatureC(rawT),
                  HTU21D::HTU21D::convertTemperatureF(rawT),
                  HTU21D::HTU21D::convertHumidityPct(rawRh));
    return;
  }

  if (cmd.startsWith("crc ")) {
    String args = cmd.substring(4);
    args.trim();
    const int split = args.indexOf(' ');
    if (split < 0) {
      LOGW("Usage: crc <hex16> <hex8>");
      return;
    }
    uint16_t value = 0;
    uint16_t crc = 0;
    String crcStr = args.substring(split + 1);
    crcStr.trim();
    if (!parseU16(args.substring(0, split), value) || !parseU16(crcStr, crc) || crc > 0xFF) {
      LOGW("Invalid values");
      return;
    }
    const bool valid = HTU21D::HTU21D::checkCrc(value, static_cast<uint8_t>(crc));
    Serial.printf("CRC %s (expected 0x%02X)\n", valid ? "OK" : "MISMATCH",
                  HTU21D::HTU21D::computeCrc(value));
    return;
  }

  if (cmd == "reset") {
    HTU21D::Status st = device.softReset();
    printStatus(st);
    return;
  }

  if (cmd == "cfg") {
    printConfig();
    return;
  }

  if (cmd == "drv") {
    printDriverHealth();
    return;
  }

  if (cmd == "begin") {
    if (!gConfigReady) {
      LOGW("Config not ready");
      return;
    }
    HTU21D::Status st = device.begin(gConfig);
    printStatus(st);
    return;
  }

  if (cmd == "end") {
    streamMode = false;
    device.end();
    LOGI("Driver ended");
    return;
  }

  if (cmd == "probe") {
    LOGI("Probing device (no health tracking)...");
    HTU21D::Status st = device.probe();
    printStatus(st);
    return;
  }

  if (cmd.startsWith("stream")) {
    if (cmd.length() > 6) {
      streamMode = (cmd.substring(7).toInt() != 0);
    } else {
      streamMode = !streamMode;
    }
    lastStreamMs = millis();
    LOGI("Stream: %s", streamMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("stress")) {
    int count = 10;
    if (cmd.length() > 6) {
      count = cmd.substring(6).toInt();
    }
    if (count <= 0) {
      LOGW("Invalid stress count");
      return;
    }
    LOGI("Starting stress test: %d cycles", count);
    runStress(count);
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== HTU21D Bringup Example (v%s) ===", HTU21D::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  i2c::scan();

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cWriteRead = transport::wireWriteRead;
  gConfig.i2cAddress = HTU21D::cmd::I2C_ADDR;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfig.offlineThreshold = 5;
  gConfigReady = true;

  HTU21D::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    printStatus(st);
    return;
  }
  if (!device.defaultsVerified()) {
    LOGW("User register did not match reset default");
  }

  st = device.setResolution(HTU21D::Resolution::RH12_T14);
  if (!st.ok()) {
    printStatus(st);
  }

  bool heater = false;
  st = device.readHeaterEnabled(heater);
  if (st.ok() && !heater) {
    st = device.toggleHeater();
  }
  if (st.ok()) {
    st = device.readHeaterEnabled(heater);
  }
  if (st.ok()) {
    LOGI("Heater enabled: %s", heater ? "true" : "false");
  } else {
    printStatus(st);
  }

  LOGI("Device initialized successfully");
  printDriverHealth();
  printHelp();
  streamMode = true;
  lastStreamMs = millis();
  Serial.print("> ");
}

void loop() {
  if (streamMode && (millis() - lastStreamMs) >= streamIntervalMs) {
    lastStreamMs = millis();
    float tempC = 0.0f;
    float humidity = 0.0f;
    (void)readAll(tempC, humidity);
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
