#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "Params.h"
#include "sensors/UnitConverter.h"

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static Calibration benchCalibration() {
  Calibration cal;
  cal.distance_to_empty_cm = 9.0;
  cal.distance_to_full_cm = 1.0;
  cal.pump_raw_min = 16;
  cal.pump_raw_max = 50;
  return cal;
}

int main() {
  std::string error;

  // Default tank geometry derives the rig's window
  Calibration def = Calibration::fromTank(TANK_HEIGHT_CM, SENSOR_OFFSET_CM,
                                          MIN_WATER_HEIGHT_CM, MAX_WATER_HEIGHT_CM,
                                          PUMP_RAW_MIN, PUMP_RAW_MAX);
  assert(near(def.distance_to_empty_cm, 11.2));
  assert(near(def.distance_to_full_cm, 3.7));
  assert(near(def.distance_to_empty_cm, SENSOR_TO_EMPTY_CM));
  assert(near(def.distance_to_full_cm, SENSOR_TO_FULL_CM));
  assert(near(SENSOR_TO_BOTTOM_CM, 13.7));
  assert(validateCalibration(def, error));

  UnitConverter conv(def);

  // Endpoints
  assert(conv.sensorToPercent(def.distance_to_empty_cm) == 0.0);
  assert(conv.sensorToPercent(def.distance_to_full_cm) == 100.0);

  // Clamped outside the window
  assert(conv.sensorToPercent(20.0) == 0.0);
  assert(conv.sensorToPercent(0.5) == 100.0);
  assert(conv.sensorToPercent(-3.0) == 100.0);

  // Closer to the sensor means fuller: non-increasing over distance
  double previous = 101.0;
  for (double d = 0.0; d <= 15.0; d += 0.05) {
    double pct = conv.sensorToPercent(d);
    assert(pct >= 0.0 && pct <= 100.0);
    assert(pct <= previous);
    previous = pct;
  }

  // Pump: floor at zero for non-positive raw, linear, unclamped above U
  assert(conv.pumpToPercent(0) == 0.0);
  assert(conv.pumpToPercent(-5) == 0.0);
  assert(near(conv.pumpToPercent(16), 0.0));
  assert(near(conv.pumpToPercent(50), 100.0));
  assert(near(conv.pumpToPercent(33), 50.0));
  assert(near(conv.pumpToPercent(67), 150.0));
  assert(conv.pumpToPercent(8) < 0.0);

  // Bench calibration used by the end-to-end checks
  UnitConverter bench(benchCalibration());
  assert(near(bench.sensorToPercent(6.0), 37.5));
  assert(near(bench.pumpToPercent(30), 41.176470588, 1e-6));

  RawTelemetry raw;
  raw.upper_distance_cm = 6.0;
  raw.lower_distance_cm = 9.0;
  raw.pump_raw = 30;
  TelemetrySample s = bench.toSample(raw, 85.0, 1700000000);
  assert(near(s.upper_pct, 37.5));
  assert(near(s.lower_pct, 0.0));
  assert(near(s.pump_pct, 41.176470588, 1e-6));
  assert(s.setpoint_pct == 85.0);
  assert(s.timestamp == 1700000000);

  // Degenerate calibrations are rejected with a reason
  Calibration flat = benchCalibration();
  flat.distance_to_full_cm = flat.distance_to_empty_cm;
  error.clear();
  assert(!validateCalibration(flat, error));
  assert(!error.empty());

  Calibration inverted = benchCalibration();
  inverted.distance_to_full_cm = 10.0;
  assert(!validateCalibration(inverted, error));

  Calibration noPump = benchCalibration();
  noPump.pump_raw_max = noPump.pump_raw_min;
  assert(!validateCalibration(noPump, error));

  Calibration notFinite = benchCalibration();
  notFinite.distance_to_empty_cm = std::numeric_limits<double>::quiet_NaN();
  assert(!validateCalibration(notFinite, error));

  // Tank geometry with min water above max water
  Calibration badTank = Calibration::fromTank(15.0, 1.3, 10.0, 2.5, 16, 50);
  assert(!validateCalibration(badTank, error));

  std::cout << "test_unit_converter passed" << std::endl;
  return 0;
}
