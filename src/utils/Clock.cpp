#include "utils/Clock.h"

#include <chrono>
#include <thread>

namespace {

const std::chrono::steady_clock::time_point kStart = std::chrono::steady_clock::now();

}  // namespace

uint32_t millis() {
  const auto elapsed = std::chrono::steady_clock::now() - kStart;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void delayMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
