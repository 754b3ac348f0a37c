#include <stdlib.h>
#include <unistd.h>

#include <cassert>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "storage/AuditLog.h"
#include "utils/Logger.h"

static std::vector<std::string> readLines(const std::string& path) {
  std::vector<std::string> lines;
  std::ifstream in(path.c_str());
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool looksLikeTimestamp(const std::string& ts) {
  // YYYY-MM-DD HH:MM:SS
  if (ts.size() != 19) return false;
  for (size_t i = 0; i < ts.size(); ++i) {
    char c = ts[i];
    if (i == 4 || i == 7) { if (c != '-') return false; }
    else if (i == 10) { if (c != ' ') return false; }
    else if (i == 13 || i == 16) { if (c != ':') return false; }
    else if (c < '0' || c > '9') return false;
  }
  return true;
}

static TelemetrySample sample(double upper, double pump, double sp) {
  TelemetrySample s;
  s.upper_pct = upper;
  s.pump_pct = pump;
  s.lower_pct = 33.3;
  s.setpoint_pct = sp;
  s.timestamp = 1700000000;
  return s;
}

int main() {
  logger_begin(LogLevel::ERROR);

  char dirTemplate[] = "/tmp/tank_bridge_auditXXXXXX";
  char* dir = mkdtemp(dirTemplate);
  assert(dir != nullptr);
  const std::string base(dir);

  // New file: header once, then one row per append
  {
    const std::string path = base + "/pid_data.csv";
    AuditLog audit(path);
    assert(audit.append(sample(37.5, 41.17647, 85.0)));
    assert(audit.append(sample(40.04, 100.0, 90.0)));
    assert(audit.rowsWritten() == 2);
    assert(audit.failures() == 0);

    std::vector<std::string> lines = readLines(path);
    assert(lines.size() == 3);
    assert(lines[0] == "timestamp,PV,CO,setpoint");
    assert(lines[0] == AuditLog::header());
    assert(endsWith(lines[1], ",37.5,41.2,85.0"));
    assert(endsWith(lines[2], ",40.0,100.0,90.0"));
    assert(looksLikeTimestamp(lines[1].substr(0, lines[1].find(','))));

    // A second writer on the same file never repeats the header
    AuditLog again(path);
    assert(again.append(sample(1.0, 2.0, 3.0)));
    lines = readLines(path);
    assert(lines.size() == 4);
    assert(endsWith(lines[3], ",1.0,2.0,3.0"));

    unlink(path.c_str());
  }

  // Existing file (even empty) is appended to as-is
  {
    const std::string path = base + "/existing.csv";
    { std::ofstream touch(path.c_str()); }
    AuditLog audit(path);
    assert(audit.append(sample(50.0, 50.0, 50.0)));
    std::vector<std::string> lines = readLines(path);
    assert(lines.size() == 1);
    assert(endsWith(lines[0], ",50.0,50.0,50.0"));
    unlink(path.c_str());
  }

  // Unwritable location: reported, counted, never fatal
  {
    AuditLog audit(base + "/missing_dir/pid_data.csv");
    assert(!audit.append(sample(1.0, 1.0, 1.0)));
    assert(!audit.append(sample(1.0, 1.0, 1.0)));
    assert(audit.failures() == 2);
    assert(audit.rowsWritten() == 0);
  }

  rmdir(base.c_str());

  std::cout << "test_audit_log passed" << std::endl;
  return 0;
}
