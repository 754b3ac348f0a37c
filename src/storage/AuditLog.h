#pragma once
#include <stdint.h>

#include <string>

#include "comms/Messages.h"

/**
 * @brief Append-only CSV audit trail, one row per push tick.
 *
 * Columns: timestamp,PV,CO,setpoint
 *   PV = upper tank level %, CO = pump output %, setpoint = setpoint in
 *   effect when the row was produced. Values carry one decimal.
 *
 * The header is written only when the file does not exist yet. No handle is
 * kept between calls: each append opens, writes and closes the file.
 */
class AuditLog {
public:
  explicit AuditLog(const std::string& path);

  /**
   * @brief Append one record for sample
   *
   * Never throws; failures are logged and reported as false so the control
   * loop can carry on.
   */
  bool append(const TelemetrySample& sample);

  const std::string& path() const { return _path; }
  uint32_t rowsWritten() const { return _rows; }
  uint32_t failures() const { return _failures; }

  static const char* header() { return "timestamp,PV,CO,setpoint"; }

private:
  std::string _path;
  uint32_t _rows = 0;
  uint32_t _failures = 0;
};
