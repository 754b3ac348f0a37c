#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "app/ControlLoop.h"
#include "stubs/FakeHttpClient.h"
#include "stubs/FakeSerialPort.h"
#include "utils/Logger.h"

static void noSleep(uint32_t) {}

static time_t fixedWallClock() {
  return 1700000000;
}

static std::string tempDir;

static SerialLinkConfig quickSerial() {
  SerialLinkConfig cfg;
  cfg.device = "/dev/ttyTEST";
  cfg.retry_delay_ms = 10;
  cfg.settle_ms = 0;
  return cfg;
}

static Calibration benchCalibration() {
  Calibration cal;
  cal.distance_to_empty_cm = 9.0;
  cal.distance_to_full_cm = 1.0;
  cal.pump_raw_min = 16;
  cal.pump_raw_max = 50;
  return cal;
}

// Everything the loop talks to, wired with fakes
struct Bench {
  FakeSerialPort port;
  SerialLink link;
  FakeHttpClient http;
  RemoteSync remote;
  AuditLog audit;
  UnitConverter converter;
  ControlLoop loop;

  explicit Bench(const std::string& auditName)
  : link(port, quickSerial(), &noSleep),
    remote(http, RemoteSyncConfig()),
    audit(tempDir + "/" + auditName),
    converter(benchCalibration()),
    loop(link, remote, audit, converter, ControlTiming(), 85.0, &fixedWallClock)
  {
  }
};

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

static double formField(const std::string& body, const std::string& name) {
  const std::string key = name + "=";
  size_t pos = body.find(key);
  assert(pos != std::string::npos);
  return std::strtod(body.c_str() + pos + key.size(), nullptr);
}

static void testSetpointChangeForwarded() {
  Bench b("change.csv");
  assert(b.loop.begin());
  assert(b.port.writes.size() == 1);
  assert(b.port.writes[0] == "SP:85.0\n");
  b.port.writes.clear();

  b.loop.resetTimers(0);
  b.http.get_body = "{\"setpoint\": 90.0}";

  // Nothing is due before the first period elapses
  b.loop.tick(500);
  assert(b.http.posts.empty());
  assert(b.http.get_urls.empty());

  b.loop.tick(1000);
  assert(b.loop.setpoint() == 90.0);
  assert(b.port.writes.size() == 1);
  assert(b.port.writes[0] == "SP:90.0\n");

  // Unchanged on the next pull: no further writes
  b.loop.tick(2000);
  assert(b.port.writes.size() == 1);
  assert(b.http.get_urls.size() == 2);
}

static void testSameSetpointNotWritten() {
  Bench b("same.csv");
  assert(b.loop.begin());
  b.port.writes.clear();
  b.loop.resetTimers(0);

  b.http.get_body = "{\"setpoint\": 85.0}";
  b.loop.tick(1000);
  b.loop.tick(2000);
  assert(b.port.writes.empty());
  assert(b.loop.setpoint() == 85.0);
}

static void testEndToEnd() {
  Bench b("e2e.csv");
  const std::string auditPath = tempDir + "/e2e.csv";
  assert(b.loop.begin());
  b.loop.resetTimers(0);

  b.port.input = "INTERLOCK\n6.0,9.0,30\n";

  // Serial read is not due yet at 50 ms
  b.loop.tick(50);
  assert(!b.port.input.empty());

  b.loop.tick(100);
  assert(b.port.input.empty());
  assert(b.loop.telemetry().upper_distance_cm == 6.0);
  assert(b.loop.telemetry().pump_raw == 30);

  b.loop.tick(1000);
  const TelemetrySample& s = b.loop.lastSample();
  assert(std::fabs(s.upper_pct - 37.5) < 1e-9);
  assert(std::fabs(s.pump_pct - 41.18) < 0.01);
  assert(s.lower_pct == 0.0);
  assert(s.setpoint_pct == 85.0);
  assert(s.timestamp == 1700000000);

  assert(b.http.posts.size() == 1);
  const std::string& body = b.http.posts[0].body;
  assert(body.find("upper_percent=37.5&") == 0);
  assert(std::fabs(formField(body, "pump_percent") - 41.18) < 0.01);
  assert(endsWith(body, "&lower_percent=0.0"));

  std::vector<std::string> lines = readLines(auditPath);
  assert(lines.size() == 2);
  assert(lines[0] == "timestamp,PV,CO,setpoint");
  assert(endsWith(lines[1], ",37.5,41.2,85.0"));

  unlink(auditPath.c_str());
}

static void testReconnectAfterWriteFailure() {
  Bench b("reconnect.csv");
  assert(b.loop.begin());
  b.port.writes.clear();
  b.loop.resetTimers(0);

  b.http.get_body = "{\"setpoint\": 90.0}";
  b.port.write_failures_left = 1;

  // Write fails, link drops, the same tick reconnects with the new value
  b.loop.tick(1000);
  assert(b.port.opens == 2);
  assert(b.link.isConnected());
  assert(b.port.writes.size() == 1);
  assert(b.port.writes[0] == "SP:90.0\n");
  assert(b.loop.setpoint() == 90.0);
}

static void testReconnectAfterReadFailure() {
  Bench b("readfail.csv");
  assert(b.loop.begin());
  b.loop.resetTimers(0);

  b.port.fail_available = true;
  b.port.open_failures_left = 2;
  b.loop.tick(100);
  b.port.fail_available = false;

  // Read error dropped the link; reconnect retried past two failed opens
  assert(b.port.open_calls == 4);
  assert(b.link.isConnected());
  assert(b.link.connectAttempts() == 4);
}

static void testControlPlaneDown() {
  Bench b("down.csv");
  const std::string auditPath = tempDir + "/down.csv";
  assert(b.loop.begin());
  b.port.writes.clear();
  b.loop.resetTimers(0);

  b.http.transport_down = true;
  b.loop.tick(1000);
  b.loop.tick(2000);

  // Audit keeps recording; setpoint and rig untouched
  assert(readLines(auditPath).size() == 3);
  assert(b.loop.setpoint() == 85.0);
  assert(b.port.writes.empty());
  assert(b.remote.pushFail() == 2);
  assert(b.remote.pullFail() == 2);

  unlink(auditPath.c_str());
}

static void testCancelledBegin() {
  Bench b("cancel.csv");
  volatile sig_atomic_t stop = 1;
  assert(!b.loop.begin(&stop));
  assert(b.port.open_calls == 0);

  // run() returns at once when already asked to stop
  b.loop.run(stop);
  assert(b.http.posts.empty());
}

int main() {
  logger_begin(LogLevel::ERROR);

  char dirTemplate[] = "/tmp/tank_bridge_loopXXXXXX";
  char* dir = mkdtemp(dirTemplate);
  assert(dir != nullptr);
  tempDir = dir;

  testSetpointChangeForwarded();
  testSameSetpointNotWritten();
  testEndToEnd();
  testReconnectAfterWriteFailure();
  testReconnectAfterReadFailure();
  testControlPlaneDown();
  testCancelledBegin();

  unlink((tempDir + "/change.csv").c_str());
  unlink((tempDir + "/same.csv").c_str());
  unlink((tempDir + "/reconnect.csv").c_str());
  unlink((tempDir + "/readfail.csv").c_str());
  rmdir(tempDir.c_str());

  std::cout << "test_control_loop passed" << std::endl;
  return 0;
}
