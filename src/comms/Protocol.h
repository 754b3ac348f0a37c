#pragma once
#include <string>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the two wires the bridge speaks:

    - Rig serial:  newline-delimited ASCII (see Messages.h)
    - Control plane: form-encoded push body, JSON pull response

  All helpers are pure; no I/O happens here.
===============================================================================
*/

namespace protocol {

/*=============================================================================
  DECODE (Rig -> Bridge)
=============================================================================*/

/*
  Classifies one serial line (line ending already stripped).

  Returns:
    - HANDSHAKE if the line contains the handshake token anywhere
    - READING if the line is exactly three comma-separated fields
      <float>,<float>,<int> with finite distances; out is overwritten in full
    - NO_READING otherwise; out is left untouched
*/
LineKind decodeTelemetryLine(const char* line, RawTelemetry& out);


/*=============================================================================
  ENCODE (Bridge -> Rig)
=============================================================================*/

// "SP:<setpoint>\n"
std::string encodeSetpointLine(double setpoint);

// Shortest decimal text that reads back as the same double, always with a
// fractional part or exponent ("90.0", "72.5", "1e+16").
std::string formatNumber(double value);


/*=============================================================================
  CONTROL PLANE
=============================================================================*/

// upper_percent=..&pump_percent=..&lower_percent=..
std::string encodePushForm(const TelemetrySample& s);

enum class PullStatus : uint8_t {
  SETPOINT = 0,   // out_setpoint holds the remote value
  NO_SETPOINT,    // well-formed, field absent: nothing requested
  MALFORMED,      // not JSON, or setpoint is not numeric
};

/*
  Extracts the optional "setpoint" field from a pull response body.
  A numeric string ("90.5") is accepted as a number.
*/
PullStatus decodePullResponse(const std::string& body, double& out_setpoint);

}  // namespace protocol
