#pragma once

#include <stdint.h>

// Milliseconds since process start on the monotonic clock. Wraps after
// ~49 days; compare with signed subtraction (see Rate).
uint32_t millis();

void delayMs(uint32_t ms);
