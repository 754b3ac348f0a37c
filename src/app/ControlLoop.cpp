#include "app/ControlLoop.h"

#include "utils/Clock.h"
#include "utils/Logger.h"

static time_t systemWallClock() {
  return time(nullptr);
}

ControlLoop::ControlLoop(SerialLink& link,
                         RemoteSync& remote,
                         AuditLog& audit,
                         const UnitConverter& converter,
                         const ControlTiming& timing,
                         double initial_setpoint,
                         WallClockFn wall_clock)
: _link(link),
  _remote(remote),
  _audit(audit),
  _converter(converter),
  _timing(timing),
  _wall_clock(wall_clock ? wall_clock : &systemWallClock),
  _read_rate(timing.serial_read_ms),
  _push_rate(timing.push_ms),
  _pull_rate(timing.pull_ms),
  _setpoint(initial_setpoint)
{
}

bool ControlLoop::begin(const volatile sig_atomic_t* cancel) {
  return _link.connect(_setpoint, cancel);
}

void ControlLoop::resetTimers(uint32_t now_ms) {
  _read_rate.reset(now_ms);
  _push_rate.reset(now_ms);
  _pull_rate.reset(now_ms);
}

/*=============================================================================
  TICK
=============================================================================*/

void ControlLoop::tick(uint32_t now_ms, const volatile sig_atomic_t* cancel) {
  // 1. Serial drain, rate limited; each drain is exhaustive so nothing is lost
  if (_link.isConnected() && _read_rate.ready(now_ms)) {
    readSerial_(now_ms);
  }

  // 2. Telemetry push
  if (_push_rate.ready(now_ms)) {
    pushTelemetry_();
  }

  // 3. Setpoint pull
  if (_pull_rate.ready(now_ms)) {
    pullSetpoint_();
  }

  // 4. Reconnect if anything above dropped the link
  if (!_link.isConnected()) {
    _link.connect(_setpoint, cancel);
  }
}

void ControlLoop::readSerial_(uint32_t now_ms) {
  if (!_link.inputPending()) return;
  _link.readAvailable(_telemetry, now_ms);
}

void ControlLoop::pushTelemetry_() {
  _last_sample = _converter.toSample(_telemetry, _setpoint, _wall_clock());

  _audit.append(_last_sample);

  LOG_INFO(LogDomain::SYSTEM, "PV: %.1f%%, CO: %.1f%%, Setpoint: %.1f%%",
           _last_sample.upper_pct, _last_sample.pump_pct, _last_sample.setpoint_pct);

  _remote.push(_last_sample);
}

void ControlLoop::pullSetpoint_() {
  if (!_remote.pull(_setpoint)) return;

  // Not connected: the new value goes out as the init frame on reconnect
  if (!_link.isConnected()) return;

  if (!_link.write(_setpoint)) {
    LOG_WARN(LogDomain::SERIAL, "Connection lost while sending setpoint");
  }
}

/*=============================================================================
  RUN
=============================================================================*/

void ControlLoop::run(const volatile sig_atomic_t& stop) {
  resetTimers(millis());

  while (!stop) {
    tick(millis(), &stop);
    if (stop) break;
    delayMs(_timing.idle_ms);
  }
}
