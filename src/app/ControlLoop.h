#pragma once
#include <signal.h>
#include <stdint.h>
#include <time.h>

#include "Params.h"
#include "comms/Messages.h"
#include "comms/SerialLink.h"
#include "remote/RemoteSync.h"
#include "sensors/UnitConverter.h"
#include "storage/AuditLog.h"
#include "utils/Rate.h"

struct ControlTiming {
  uint32_t serial_read_ms = SERIAL_READ_INTERVAL_MS;
  uint32_t push_ms = PUSH_INTERVAL_MS;
  uint32_t pull_ms = PULL_INTERVAL_MS;
  uint32_t idle_ms = LOOP_IDLE_MS;
};

using WallClockFn = time_t (*)();

/*
  ControlLoop

  Single-threaded scheduler for the bridge. Owns the shared state (last rig
  reading, current setpoint) and one Rate per activity. Each tick runs, in
  order:

    1. serial drain   (fresh data feeds the same tick's push)
    2. telemetry push (audit row + control plane)
    3. setpoint pull  (write to rig on change)
    4. reconnect      (blocking; heals anything 1-3 broke before next read)
*/
class ControlLoop {
public:
  ControlLoop(SerialLink& link,
              RemoteSync& remote,
              AuditLog& audit,
              const UnitConverter& converter,
              const ControlTiming& timing,
              double initial_setpoint,
              WallClockFn wall_clock = nullptr);

  // Initial (blocking) connect. False only if cancelled.
  bool begin(const volatile sig_atomic_t* cancel = nullptr);

  // First firing of every activity one full period after now_ms.
  void resetTimers(uint32_t now_ms);

  void tick(uint32_t now_ms, const volatile sig_atomic_t* cancel = nullptr);

  // tick() + idle sleep until stop is raised.
  void run(const volatile sig_atomic_t& stop);

  double setpoint() const { return _setpoint; }
  const RawTelemetry& telemetry() const { return _telemetry; }
  const TelemetrySample& lastSample() const { return _last_sample; }

private:
  void readSerial_(uint32_t now_ms);
  void pushTelemetry_();
  void pullSetpoint_();

  SerialLink& _link;
  RemoteSync& _remote;
  AuditLog& _audit;
  const UnitConverter& _converter;
  ControlTiming _timing;
  WallClockFn _wall_clock;

  Rate _read_rate;
  Rate _push_rate;
  Rate _pull_rate;

  // Shared state, touched only from the control thread
  RawTelemetry _telemetry;
  double _setpoint;
  TelemetrySample _last_sample;
};
