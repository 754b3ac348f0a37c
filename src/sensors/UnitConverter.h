#pragma once

#include <string>

#include "comms/Messages.h"

// Immutable calibration for the tank rig. Build once at startup, validate,
// then hand to UnitConverter.
struct Calibration {
  double distance_to_empty_cm = 0.0;   // sensor reading at 0 %
  double distance_to_full_cm = 0.0;    // sensor reading at 100 %
  double pump_raw_min = 0.0;           // L: raw value at 0 %
  double pump_raw_max = 0.0;           // U: raw value at 100 %

  // Derives the empty/full distances from tank geometry.
  static Calibration fromTank(double tank_height_cm,
                              double sensor_offset_cm,
                              double min_water_cm,
                              double max_water_cm,
                              double pump_raw_min,
                              double pump_raw_max);
};

// Returns false (with a reason) when the calibration would make a mapping
// degenerate: full must be strictly closer to the sensor than empty, and the
// pump range must be non-empty.
bool validateCalibration(const Calibration& cal, std::string& error);

class UnitConverter {
public:
  // cal must have passed validateCalibration().
  explicit UnitConverter(const Calibration& cal);

  // Clamped to [full, empty]; empty -> 0 %, full -> 100 %.
  double sensorToPercent(double distance_cm) const;

  // raw <= 0 -> 0 %. Otherwise linear over [L, U] and NOT clamped: the rig
  // can report past U during calibration overshoot and that is passed on.
  double pumpToPercent(int32_t raw) const;

  TelemetrySample toSample(const RawTelemetry& raw, double setpoint_pct, time_t timestamp) const;

  const Calibration& calibration() const { return _cal; }

private:
  Calibration _cal;
};
