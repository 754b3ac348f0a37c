#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements the serial line codec and the control-plane payload helpers.

  Notes:
  - Serial decoding is hand-rolled: the rig line is three bare fields.
  - Pull decoding uses ArduinoJson with a filter so unrelated fields in the
    response never consume document memory.
===============================================================================
*/

#include <ArduinoJson.h>

#include <errno.h>
#include <limits.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Trims [begin, end) in place
static void trim(const char*& begin, const char*& end) {
  while (begin < end && isBlank(*begin)) ++begin;
  while (end > begin && isBlank(*(end - 1))) --end;
}

// Whole-field float parse; rejects empty fields, trailing garbage and
// non-finite values
static bool parseDoubleField(const char* begin, const char* end, double& out) {
  trim(begin, end);
  if (begin == end) return false;

  const std::string field(begin, end);
  // strtod would accept hex floats; the rig never sends them
  if (field.find_first_of("xX") != std::string::npos) return false;

  char* parsed_end = nullptr;
  const double v = strtod(field.c_str(), &parsed_end);
  if (parsed_end != field.c_str() + field.size()) return false;
  if (!isfinite(v)) return false;

  out = v;
  return true;
}

// Whole-field base-10 integer parse
static bool parseIntField(const char* begin, const char* end, int32_t& out) {
  trim(begin, end);
  if (begin == end) return false;

  const std::string field(begin, end);
  char* parsed_end = nullptr;
  const long v = strtol(field.c_str(), &parsed_end, 10);
  if (parsed_end != field.c_str() + field.size()) return false;
  if (errno == ERANGE) return false;
  if (v < INT32_MIN || v > INT32_MAX) return false;

  out = (int32_t)v;
  return true;
}

// Form-urlencodes one value (numbers only need '+' and friends escaped)
static void appendFormValue(std::string& out, const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  for (size_t i = 0; i < value.size(); ++i) {
    const unsigned char c = (unsigned char)value[i];
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        c == '.' || c == '-' || c == '_' || c == '~') {
      out += (char)c;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
}


namespace protocol {

/*=============================================================================
  DECODE (Rig -> Bridge)
=============================================================================*/

LineKind decodeTelemetryLine(const char* line, RawTelemetry& out) {
  if (!line) return LineKind::NO_READING;

  if (strstr(line, HANDSHAKE_TOKEN) != nullptr) {
    return LineKind::HANDSHAKE;
  }

  const char* begin = line;
  const char* end = line + strlen(line);
  trim(begin, end);
  if (begin == end) return LineKind::NO_READING;

  // Exactly two separators -> three fields
  const char* comma1 = static_cast<const char*>(memchr(begin, ',', end - begin));
  if (!comma1) return LineKind::NO_READING;
  const char* comma2 = static_cast<const char*>(memchr(comma1 + 1, ',', end - (comma1 + 1)));
  if (!comma2) return LineKind::NO_READING;
  if (memchr(comma2 + 1, ',', end - (comma2 + 1)) != nullptr) return LineKind::NO_READING;

  RawTelemetry parsed;
  if (!parseDoubleField(begin, comma1, parsed.upper_distance_cm)) return LineKind::NO_READING;
  if (!parseDoubleField(comma1 + 1, comma2, parsed.lower_distance_cm)) return LineKind::NO_READING;
  if (!parseIntField(comma2 + 1, end, parsed.pump_raw)) return LineKind::NO_READING;

  out = parsed;   // all three fields at once
  return LineKind::READING;
}


/*=============================================================================
  ENCODE (Bridge -> Rig)
=============================================================================*/

std::string formatNumber(double value) {
  if (isnan(value)) return "nan";
  if (isinf(value)) return value < 0 ? "-inf" : "inf";

  // Find the fewest significant digits that survive a round trip
  char buf[40];
  int digits = 1;
  for (; digits <= 17; ++digits) {
    snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
    if (strtod(buf, nullptr) == value) break;
  }
  if (digits > 17) digits = 17;

  const char* e = strchr(buf, 'e');
  const int exponent = e ? atoi(e + 1) : 0;

  if (exponent < -4 || exponent >= 16) {
    return std::string(buf);
  }

  int decimals = digits - 1 - exponent;
  if (decimals < 1) decimals = 1;
  snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return std::string(buf);
}

std::string encodeSetpointLine(double setpoint) {
  return "SP:" + formatNumber(setpoint) + "\n";
}


/*=============================================================================
  CONTROL PLANE
=============================================================================*/

std::string encodePushForm(const TelemetrySample& s) {
  std::string body;
  body.reserve(96);

  body += "upper_percent=";
  appendFormValue(body, formatNumber(s.upper_pct));
  body += "&pump_percent=";
  appendFormValue(body, formatNumber(s.pump_pct));
  body += "&lower_percent=";
  appendFormValue(body, formatNumber(s.lower_pct));

  return body;
}

PullStatus decodePullResponse(const std::string& body, double& out_setpoint) {
  StaticJsonDocument<64> filter;
  filter["setpoint"] = true;

  StaticJsonDocument<PULL_JSON_DOC_BYTES> doc;
  DeserializationError err = deserializeJson(doc, body, DeserializationOption::Filter(filter));
  if (err) {
    return PullStatus::MALFORMED;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return PullStatus::MALFORMED;

  if (!obj.containsKey("setpoint")) return PullStatus::NO_SETPOINT;

  JsonVariant sp = obj["setpoint"];

  if (sp.is<bool>()) return PullStatus::MALFORMED;

  double v = 0.0;
  if (sp.is<double>() || sp.is<long>()) {
    v = sp.as<double>();
  } else {
    // Numeric strings are tolerated ("90", " 72.5 ")
    const char* text = sp.as<const char*>();
    if (!text || !parseDoubleField(text, text + strlen(text), v)) {
      return PullStatus::MALFORMED;
    }
  }

  // Never forward nan/inf to the rig (a JSON number can still overflow)
  if (!isfinite(v)) return PullStatus::MALFORMED;

  out_setpoint = v;
  return PullStatus::SETPOINT;
}

}  // namespace protocol
