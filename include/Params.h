#pragma once
#include <stdint.h>

/*
  Params.h

  Purpose:
  Central location for bridge constants and default tunable parameters.
  Every value here can be overridden at runtime from the JSON config file
  (see app/BridgeConfig.h); these are the values used when it is absent.

  Convention:
  - Distances: centimeters (cm), as reported by the tank rig
  - Levels / setpoint: percent (0-100 nominal)
  - Times: milliseconds (ms)
*/

/* ============================================================================
   TANK GEOMETRY
============================================================================ */

constexpr double TANK_HEIGHT_CM      = 15.0;
constexpr double SENSOR_OFFSET_CM    = 1.3;   // sensor face above tank rim
constexpr double MIN_WATER_HEIGHT_CM = 2.5;   // reads as 0 %
constexpr double MAX_WATER_HEIGHT_CM = 10.0;  // reads as 100 %

// Derived
constexpr double SENSOR_TO_BOTTOM_CM = TANK_HEIGHT_CM - SENSOR_OFFSET_CM;
constexpr double SENSOR_TO_EMPTY_CM  = SENSOR_TO_BOTTOM_CM - MIN_WATER_HEIGHT_CM;
constexpr double SENSOR_TO_FULL_CM   = SENSOR_TO_BOTTOM_CM - MAX_WATER_HEIGHT_CM;

/* ============================================================================
   PUMP CALIBRATION
============================================================================ */

// Raw actuation values reported by the rig that map to 0 % and 100 %.
constexpr double PUMP_RAW_MIN = 16.0;
constexpr double PUMP_RAW_MAX = 50.0;

/* ============================================================================
   SETPOINT
============================================================================ */

constexpr double DEFAULT_SETPOINT_PCT = 85.0;

/* ============================================================================
   SERIAL LINK
============================================================================ */

constexpr const char* SERIAL_PORT_DEFAULT = "/dev/ttyUSB0";
constexpr uint32_t SERIAL_BAUD = 9600;

// A partial line older than this is dropped (device stopped mid-frame).
constexpr uint32_t SERIAL_READ_TIMEOUT_MS = 1000;

constexpr uint32_t SERIAL_RETRY_DELAY_MS = 5000;

// Rig resets when the port opens; give it time before the init frame.
constexpr uint32_t SERIAL_SETTLE_MS = 2000;

constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 256;

// Sentinel the rig prints once it is ready to accept commands.
constexpr const char* HANDSHAKE_TOKEN = "INTERLOCK";

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint32_t SERIAL_READ_INTERVAL_MS = 100;
constexpr uint32_t PUSH_INTERVAL_MS        = 1000;
constexpr uint32_t PULL_INTERVAL_MS        = 1000;
constexpr uint32_t LOOP_IDLE_MS            = 50;

/* ============================================================================
   CONTROL PLANE (HTTP)
============================================================================ */

constexpr const char* PUSH_URL_DEFAULT = "http://127.0.0.1:2000/post";
constexpr const char* PULL_URL_DEFAULT = "http://127.0.0.1:2000/get";
constexpr uint32_t HTTP_TIMEOUT_MS = 2000;

// Pull responses are filtered down to the setpoint field before parsing.
constexpr size_t PULL_JSON_DOC_BYTES = 256;
constexpr size_t CONFIG_JSON_DOC_BYTES = 2048;

/* ============================================================================
   AUDIT LOG
============================================================================ */

constexpr const char* AUDIT_LOG_PATH_DEFAULT = "pid_data.csv";
