#include <cassert>
#include <iostream>
#include <string>

#include "remote/RemoteSync.h"
#include "stubs/FakeHttpClient.h"
#include "utils/Logger.h"

static RemoteSyncConfig testConfig() {
  RemoteSyncConfig cfg;
  cfg.push_url = "http://127.0.0.1:2000/post";
  cfg.pull_url = "http://127.0.0.1:2000/get";
  cfg.timeout_ms = 2000;
  return cfg;
}

static void testPush() {
  FakeHttpClient http;
  RemoteSync remote(http, testConfig());

  TelemetrySample s;
  s.upper_pct = 37.5;
  s.pump_pct = 50.0;
  s.lower_pct = 12.5;

  assert(remote.push(s));
  assert(http.posts.size() == 1);
  assert(http.posts[0].url == "http://127.0.0.1:2000/post");
  assert(http.posts[0].content_type == "application/x-www-form-urlencoded");
  assert(http.posts[0].body == "upper_percent=37.5&pump_percent=50.0&lower_percent=12.5");
  assert(http.last_timeout_ms == 2000);
  assert(remote.pushOk() == 1);

  // Server error and transport failure are both swallowed and counted
  http.post_status = 500;
  assert(!remote.push(s));
  http.transport_down = true;
  assert(!remote.push(s));
  assert(remote.pushFail() == 2);
  assert(remote.pushOk() == 1);
}

static void testPull() {
  FakeHttpClient http;
  RemoteSync remote(http, testConfig());
  double sp = 85.0;

  // Changed value is adopted
  http.get_body = "{\"setpoint\": 90.0}";
  assert(remote.pull(sp));
  assert(sp == 90.0);
  assert(http.get_urls.back() == "http://127.0.0.1:2000/get");

  // Same value again is not a change
  assert(!remote.pull(sp));
  assert(sp == 90.0);

  // No field: nothing requested, not a failure
  http.get_body = "{}";
  assert(!remote.pull(sp));
  assert(remote.pullFail() == 0);

  // Bad body, bad status, no server: setpoint untouched, counted
  http.get_body = "<html>oops</html>";
  assert(!remote.pull(sp));
  http.get_body = "{\"setpoint\": 70}";
  http.get_status = 503;
  assert(!remote.pull(sp));
  http.get_status = 200;
  http.transport_down = true;
  assert(!remote.pull(sp));
  assert(sp == 90.0);
  assert(remote.pullFail() == 3);

  // Recovers once the control plane is back
  http.transport_down = false;
  assert(remote.pull(sp));
  assert(sp == 70.0);
}

int main() {
  logger_begin(LogLevel::ERROR);

  testPush();
  testPull();

  std::cout << "test_remote_sync passed" << std::endl;
  return 0;
}
