#pragma once

#include <stdint.h>

// Contract: logger is intended for the single control thread (not signal-safe).

// Logging levels
enum class LogLevel : uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR
};

// Logging domains
enum class LogDomain : uint8_t {
  SYSTEM = 0,
  SERIAL,
  HTTP,
  AUDIT,
  CONFIG
};

void logger_begin(LogLevel minLevel = LogLevel::INFO, bool colorEnabled = false);

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
bool logger_parseLevel(const char* text, LogLevel& out);

void logger_log(LogLevel lvl, LogDomain dom, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));
void logger_logEvery(const char* key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char* fmt, ...)
  __attribute__((format(printf, 5, 6)));

#define LOG_DEBUG(dom, fmt, ...) logger_log(LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define LOG_INFO(dom, fmt, ...) logger_log(LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define LOG_WARN(dom, fmt, ...) logger_log(LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define LOG_ERROR(dom, fmt, ...) logger_log(LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)

#define LOG_DEBUG_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::DEBUG, dom, fmt, ##__VA_ARGS__)
#define LOG_INFO_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::INFO, dom, fmt, ##__VA_ARGS__)
#define LOG_WARN_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::WARN, dom, fmt, ##__VA_ARGS__)
#define LOG_ERROR_EVERY(key, intervalMs, dom, fmt, ...) logger_logEvery(key, intervalMs, LogLevel::ERROR, dom, fmt, ##__VA_ARGS__)
