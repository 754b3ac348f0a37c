/**
 * @file BridgeConfig.cpp
 * @brief JSON config overlay and startup validation
 */

#include "app/BridgeConfig.h"

#include <ArduinoJson.h>

#include <errno.h>
#include <math.h>
#include <string.h>

#include <fstream>
#include <sstream>

Calibration BridgeConfig::calibration() const {
  return Calibration::fromTank(tank.height_cm,
                               tank.sensor_offset_cm,
                               tank.min_water_cm,
                               tank.max_water_cm,
                               pump_raw_min,
                               pump_raw_max);
}

static void readString(JsonObjectConst obj, const char* key, std::string& out) {
  const char* value = obj[key].as<const char*>();
  if (value) {
    out = value;
  }
}

bool loadConfigJson(const std::string& json, BridgeConfig& cfg, std::string& error) {
  StaticJsonDocument<CONFIG_JSON_DOC_BYTES> doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    error = std::string("invalid JSON: ") + err.c_str();
    return false;
  }

  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    error = "config root must be a JSON object";
    return false;
  }

  // Serial settings
  if (root.containsKey("serial")) {
    JsonObjectConst serial = root["serial"].as<JsonObjectConst>();
    readString(serial, "port", cfg.serial.device);
    cfg.serial.baud = serial["baud"] | cfg.serial.baud;
    cfg.serial.read_timeout_ms = serial["read_timeout_ms"] | cfg.serial.read_timeout_ms;
    cfg.serial.retry_delay_ms = serial["retry_delay_ms"] | cfg.serial.retry_delay_ms;
    cfg.serial.settle_ms = serial["settle_ms"] | cfg.serial.settle_ms;
  }

  // Task rates
  if (root.containsKey("timing")) {
    JsonObjectConst timing = root["timing"].as<JsonObjectConst>();
    cfg.timing.serial_read_ms = timing["serial_read_ms"] | cfg.timing.serial_read_ms;
    cfg.timing.push_ms = timing["push_ms"] | cfg.timing.push_ms;
    cfg.timing.pull_ms = timing["pull_ms"] | cfg.timing.pull_ms;
    cfg.timing.idle_ms = timing["idle_ms"] | cfg.timing.idle_ms;
  }

  // Control plane
  if (root.containsKey("http")) {
    JsonObjectConst http = root["http"].as<JsonObjectConst>();
    readString(http, "push_url", cfg.http.push_url);
    readString(http, "pull_url", cfg.http.pull_url);
    cfg.http.timeout_ms = http["timeout_ms"] | cfg.http.timeout_ms;
  }

  // Calibration
  if (root.containsKey("tank")) {
    JsonObjectConst tank = root["tank"].as<JsonObjectConst>();
    cfg.tank.height_cm = tank["height"] | cfg.tank.height_cm;
    cfg.tank.sensor_offset_cm = tank["sensor_offset"] | cfg.tank.sensor_offset_cm;
    cfg.tank.min_water_cm = tank["min_water"] | cfg.tank.min_water_cm;
    cfg.tank.max_water_cm = tank["max_water"] | cfg.tank.max_water_cm;
  }

  if (root.containsKey("pump")) {
    JsonObjectConst pump = root["pump"].as<JsonObjectConst>();
    cfg.pump_raw_min = pump["raw_min"] | cfg.pump_raw_min;
    cfg.pump_raw_max = pump["raw_max"] | cfg.pump_raw_max;
  }

  if (root.containsKey("audit")) {
    JsonObjectConst audit = root["audit"].as<JsonObjectConst>();
    readString(audit, "path", cfg.audit_path);
  }

  cfg.setpoint_default = root["setpoint_default"] | cfg.setpoint_default;

  const char* level = root["log_level"].as<const char*>();
  if (level && !logger_parseLevel(level, cfg.log_level)) {
    error = std::string("unknown log_level '") + level + "'";
    return false;
  }

  return true;
}

bool loadConfigFile(const std::string& path, BridgeConfig& cfg, std::string& error) {
  std::ifstream in(path.c_str());
  if (!in) {
    error = "cannot open " + path + ": " + strerror(errno);
    return false;
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    error = "cannot read " + path;
    return false;
  }

  if (!loadConfigJson(contents.str(), cfg, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

bool validateConfig(const BridgeConfig& cfg, std::string& error) {
  if (!validateCalibration(cfg.calibration(), error)) {
    return false;
  }

  if (cfg.serial.device.empty()) {
    error = "serial.port must be set";
    return false;
  }
  if (cfg.serial.baud == 0) {
    error = "serial.baud must be non-zero";
    return false;
  }
  if (cfg.serial.read_timeout_ms == 0) {
    error = "serial.read_timeout_ms must be non-zero";
    return false;
  }
  if (cfg.serial.retry_delay_ms == 0) {
    error = "serial.retry_delay_ms must be non-zero";
    return false;
  }
  if (cfg.timing.serial_read_ms == 0 || cfg.timing.push_ms == 0 || cfg.timing.pull_ms == 0) {
    error = "timing intervals must be non-zero";
    return false;
  }
  if (cfg.timing.idle_ms == 0) {
    error = "timing.idle_ms must be non-zero";
    return false;
  }
  if (cfg.http.push_url.empty() || cfg.http.pull_url.empty()) {
    error = "http.push_url and http.pull_url must be set";
    return false;
  }
  if (cfg.http.timeout_ms == 0) {
    error = "http.timeout_ms must be non-zero";
    return false;
  }
  if (cfg.audit_path.empty()) {
    error = "audit.path must be set";
    return false;
  }
  if (!isfinite(cfg.setpoint_default)) {
    error = "setpoint_default must be a finite number";
    return false;
  }

  return true;
}
