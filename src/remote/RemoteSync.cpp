#include "remote/RemoteSync.h"

#include "comms/Protocol.h"
#include "utils/Logger.h"

// While the control plane is down, report failures at most this often
static constexpr uint32_t kFailureLogIntervalMs = 10000;

static bool isSuccess(long status) {
  return status >= 200 && status < 300;
}

RemoteSync::RemoteSync(HttpClient& http, const RemoteSyncConfig& cfg)
: _http(http),
  _cfg(cfg)
{
}

bool RemoteSync::push(const TelemetrySample& sample) {
  const std::string body = protocol::encodePushForm(sample);

  HttpResponse res;
  if (!_http.post(_cfg.push_url, "application/x-www-form-urlencoded", body, _cfg.timeout_ms, res)) {
    _push_fail++;
    LOG_WARN_EVERY("push", kFailureLogIntervalMs, LogDomain::HTTP,
                   "POST error: %s (failures=%lu)", _http.lastError().c_str(), (unsigned long)_push_fail);
    return false;
  }

  if (!isSuccess(res.status)) {
    _push_fail++;
    LOG_WARN_EVERY("push", kFailureLogIntervalMs, LogDomain::HTTP,
                   "POST status: %ld (failures=%lu)", res.status, (unsigned long)_push_fail);
    return false;
  }

  _push_ok++;
  LOG_DEBUG(LogDomain::HTTP, "POST status: %ld", res.status);
  return true;
}

bool RemoteSync::pull(double& setpoint) {
  HttpResponse res;
  if (!_http.get(_cfg.pull_url, _cfg.timeout_ms, res)) {
    _pull_fail++;
    LOG_WARN_EVERY("pull", kFailureLogIntervalMs, LogDomain::HTTP,
                   "GET error: %s", _http.lastError().c_str());
    return false;
  }

  if (!isSuccess(res.status)) {
    _pull_fail++;
    LOG_WARN_EVERY("pull", kFailureLogIntervalMs, LogDomain::HTTP, "GET status: %ld", res.status);
    return false;
  }

  double remote = 0.0;
  switch (protocol::decodePullResponse(res.body, remote)) {
    case protocol::PullStatus::NO_SETPOINT:
      return false;

    case protocol::PullStatus::MALFORMED:
      _pull_fail++;
      LOG_WARN_EVERY("pull-body", kFailureLogIntervalMs, LogDomain::HTTP,
                     "GET error: unusable response body (%lu bytes)", (unsigned long)res.body.size());
      return false;

    case protocol::PullStatus::SETPOINT:
    default:
      break;
  }

  if (remote == setpoint) return false;

  setpoint = remote;
  LOG_INFO(LogDomain::HTTP, "New setpoint: %s%%", protocol::formatNumber(setpoint).c_str());
  return true;
}
