/**
 * @file AuditLog.cpp
 * @brief CSV audit trail implementation
 */

#include "storage/AuditLog.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>

#include <fstream>

#include "utils/Logger.h"

static constexpr uint32_t kFailureLogIntervalMs = 10000;

static bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static std::string formatTimestamp(time_t ts) {
  struct tm local;
  if (localtime_r(&ts, &local) == nullptr) {
    return "";
  }
  char buf[32];
  if (strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0) {
    return "";
  }
  return std::string(buf);
}

AuditLog::AuditLog(const std::string& path)
: _path(path)
{
}

bool AuditLog::append(const TelemetrySample& sample) {
  // Decide on the header before opening: opening in append mode creates it
  const bool needHeader = !fileExists(_path);

  std::ofstream out(_path.c_str(), std::ios::out | std::ios::app);
  if (!out) {
    _failures++;
    LOG_WARN_EVERY("audit", kFailureLogIntervalMs, LogDomain::AUDIT,
                   "Cannot open %s: %s", _path.c_str(), strerror(errno));
    return false;
  }

  char row[128];
  snprintf(row, sizeof(row), "%s,%.1f,%.1f,%.1f",
           formatTimestamp(sample.timestamp).c_str(),
           sample.upper_pct,
           sample.pump_pct,
           sample.setpoint_pct);

  if (needHeader) {
    out << header() << '\n';
  }
  out << row << '\n';
  out.close();

  if (out.fail()) {
    _failures++;
    LOG_WARN_EVERY("audit", kFailureLogIntervalMs, LogDomain::AUDIT,
                   "Write to %s failed", _path.c_str());
    return false;
  }

  if (needHeader) {
    LOG_INFO(LogDomain::AUDIT, "Created %s", _path.c_str());
  }
  _rows++;
  return true;
}
