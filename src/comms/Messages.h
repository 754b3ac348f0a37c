#pragma once
#include <stdint.h>
#include <time.h>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines the data structures exchanged between the tank rig, the bridge,
  and the control plane.

  Wire format (rig -> bridge), one ASCII line each:
    "INTERLOCK"                        handshake, rig ready for commands
    "<upper>,<lower>,<pumpRaw>"        distances in cm, pump raw integer

  Wire format (bridge -> rig):
    "SP:<setpoint>\n"
===============================================================================
*/


/*=============================================================================
  TELEMETRY (Rig -> Bridge)
=============================================================================*/

// Last decoded rig reading. Replaced as a whole on every successful decode.
struct RawTelemetry {
  double upper_distance_cm = 0.0;
  double lower_distance_cm = 0.0;
  int32_t pump_raw = 0;
};

// What a single decoded line turned out to be
enum class LineKind : uint8_t {
  NO_READING = 0,   // malformed / noise, discarded
  HANDSHAKE,        // rig ready, carries no telemetry
  READING,          // RawTelemetry was produced
};


/*=============================================================================
  SAMPLE (Bridge -> Control plane, audit log)
=============================================================================*/

// Computed fresh on every push tick.
struct TelemetrySample {
  double upper_pct = 0.0;     // PV
  double lower_pct = 0.0;
  double pump_pct = 0.0;      // CO
  double setpoint_pct = 0.0;  // setpoint in effect at push time

  time_t timestamp = 0;       // wall clock
};
