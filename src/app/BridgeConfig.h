/**
 * @file BridgeConfig.h
 * @brief Runtime configuration for the bridge
 *
 * Defaults come from Params.h. An optional JSON file overrides any subset:
 *
 * {
 *   "serial":  {"port": "/dev/ttyACM0", "baud": 9600, "read_timeout_ms": 1000,
 *               "retry_delay_ms": 5000, "settle_ms": 2000},
 *   "timing":  {"serial_read_ms": 100, "push_ms": 1000, "pull_ms": 1000, "idle_ms": 50},
 *   "http":    {"push_url": "...", "pull_url": "...", "timeout_ms": 2000},
 *   "tank":    {"height": 15.0, "sensor_offset": 1.3, "min_water": 2.5, "max_water": 10.0},
 *   "pump":    {"raw_min": 16, "raw_max": 50},
 *   "audit":   {"path": "pid_data.csv"},
 *   "setpoint_default": 85.0,
 *   "log_level": "info"
 * }
 *
 * Unknown keys are ignored; values of the wrong type keep their default.
 */

#pragma once

#include <string>

#include "Params.h"
#include "app/ControlLoop.h"
#include "comms/SerialLink.h"
#include "remote/RemoteSync.h"
#include "sensors/UnitConverter.h"
#include "utils/Logger.h"

struct TankGeometry {
  double height_cm = TANK_HEIGHT_CM;
  double sensor_offset_cm = SENSOR_OFFSET_CM;
  double min_water_cm = MIN_WATER_HEIGHT_CM;
  double max_water_cm = MAX_WATER_HEIGHT_CM;
};

struct BridgeConfig {
  SerialLinkConfig serial;
  ControlTiming timing;
  RemoteSyncConfig http;

  TankGeometry tank;
  double pump_raw_min = PUMP_RAW_MIN;
  double pump_raw_max = PUMP_RAW_MAX;

  std::string audit_path = AUDIT_LOG_PATH_DEFAULT;
  double setpoint_default = DEFAULT_SETPOINT_PCT;
  LogLevel log_level = LogLevel::INFO;

  Calibration calibration() const;
};

/**
 * @brief Overlay a JSON config file onto cfg
 *
 * @return false (with error set) if the file cannot be read or is not a
 *         JSON object, or log_level names no known level
 */
bool loadConfigFile(const std::string& path, BridgeConfig& cfg, std::string& error);

/**
 * @brief Same as loadConfigFile, from an in-memory document
 */
bool loadConfigJson(const std::string& json, BridgeConfig& cfg, std::string& error);

/**
 * @brief Startup validation; any failure here is fatal
 *
 * Checks the calibration invariants, non-zero intervals, idle sleep, retry
 * delay and timeouts, and that the port, URLs and audit path are set.
 * settle_ms may be 0 for a rig that does not reset on open.
 */
bool validateConfig(const BridgeConfig& cfg, std::string& error);
