#pragma once
#include <stdint.h>

#include <string>

#include "Params.h"
#include "comms/Messages.h"
#include "remote/HttpClient.h"

struct RemoteSyncConfig {
  std::string push_url = PUSH_URL_DEFAULT;
  std::string pull_url = PULL_URL_DEFAULT;
  uint32_t timeout_ms = HTTP_TIMEOUT_MS;
};

// The two control-plane exchanges. Neither ever fails the caller: problems
// are logged and the cycle is skipped, the next tick supersedes it.
class RemoteSync {
public:
  RemoteSync(HttpClient& http, const RemoteSyncConfig& cfg);

  // Fire-and-forget. Returns true on a 2xx answer (for stats/tests only).
  bool push(const TelemetrySample& sample);

  // Fetches the remote setpoint. If it is present, numeric and differs from
  // setpoint, setpoint is updated and true is returned.
  bool pull(double& setpoint);

  uint32_t pushOk() const { return _push_ok; }
  uint32_t pushFail() const { return _push_fail; }
  uint32_t pullFail() const { return _pull_fail; }

private:
  HttpClient& _http;
  RemoteSyncConfig _cfg;

  uint32_t _push_ok = 0;
  uint32_t _push_fail = 0;
  uint32_t _pull_fail = 0;
};
