#pragma once

#include <stdint.h>

class Rate {
public:
  explicit Rate(uint32_t period_ms = 1000) { setPeriodMs(period_ms); }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  // Schedules the first tick one full period after now_ms.
  void reset(uint32_t now_ms) {
    _next_ms = now_ms + _period_ms;
    _initialized = true;
  }

  // Returns true when it's time to run. If true, it schedules the next tick.
  bool ready(uint32_t now_ms) {
    if (!_initialized) {
      _next_ms = now_ms;      // run immediately on first call
      _initialized = true;
    }

    // Safe with millis() rollover because of signed subtraction trick
    if ((int32_t)(now_ms - _next_ms) >= 0) {
      _next_ms = now_ms + _period_ms;
      return true;
    }
    return false;
  }

private:
  uint32_t _period_ms = 1000;
  uint32_t _next_ms = 0;
  bool _initialized = false;
};
