#include "sensors/UnitConverter.h"

#include <math.h>
#include <stdio.h>

/*
  UnitConverter.cpp

  Maps raw rig readings to calibrated percentages.

  Level sensors are mounted above the tank looking down, so a shorter
  distance means more water: the mapping is inverted and clamped to the
  calibrated window.
*/

Calibration Calibration::fromTank(double tank_height_cm,
                                  double sensor_offset_cm,
                                  double min_water_cm,
                                  double max_water_cm,
                                  double pump_raw_min,
                                  double pump_raw_max)
{
  const double sensor_to_bottom = tank_height_cm - sensor_offset_cm;

  Calibration cal;
  cal.distance_to_empty_cm = sensor_to_bottom - min_water_cm;
  cal.distance_to_full_cm = sensor_to_bottom - max_water_cm;
  cal.pump_raw_min = pump_raw_min;
  cal.pump_raw_max = pump_raw_max;
  return cal;
}

bool validateCalibration(const Calibration& cal, std::string& error) {
  char buf[160];

  if (!isfinite(cal.distance_to_empty_cm) || !isfinite(cal.distance_to_full_cm) ||
      !isfinite(cal.pump_raw_min) || !isfinite(cal.pump_raw_max)) {
    error = "calibration constants must be finite";
    return false;
  }

  if (!(cal.distance_to_full_cm < cal.distance_to_empty_cm)) {
    snprintf(buf, sizeof(buf),
             "distance to full (%.3f cm) must be less than distance to empty (%.3f cm)",
             cal.distance_to_full_cm, cal.distance_to_empty_cm);
    error = buf;
    return false;
  }

  if (cal.pump_raw_max == cal.pump_raw_min) {
    snprintf(buf, sizeof(buf), "pump raw range is empty (%.3f..%.3f)",
             cal.pump_raw_min, cal.pump_raw_max);
    error = buf;
    return false;
  }

  return true;
}

UnitConverter::UnitConverter(const Calibration& cal)
: _cal(cal)
{
}

double UnitConverter::sensorToPercent(double distance_cm) const {
  double clamped = distance_cm;
  if (clamped > _cal.distance_to_empty_cm) clamped = _cal.distance_to_empty_cm;
  if (clamped < _cal.distance_to_full_cm) clamped = _cal.distance_to_full_cm;

  return (_cal.distance_to_empty_cm - clamped) /
         (_cal.distance_to_empty_cm - _cal.distance_to_full_cm) * 100.0;
}

double UnitConverter::pumpToPercent(int32_t raw) const {
  if (raw <= 0) return 0.0;
  return ((double)raw - _cal.pump_raw_min) / (_cal.pump_raw_max - _cal.pump_raw_min) * 100.0;
}

TelemetrySample UnitConverter::toSample(const RawTelemetry& raw, double setpoint_pct, time_t timestamp) const {
  TelemetrySample s;
  s.upper_pct = sensorToPercent(raw.upper_distance_cm);
  s.lower_pct = sensorToPercent(raw.lower_distance_cm);
  s.pump_pct = pumpToPercent(raw.pump_raw);
  s.setpoint_pct = setpoint_pct;
  s.timestamp = timestamp;
  return s;
}
