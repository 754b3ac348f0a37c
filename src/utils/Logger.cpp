#include "utils/Logger.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

#include "utils/Clock.h"

static LogLevel s_minLevel = LogLevel::INFO;
static bool s_colorEnabled = false;

static constexpr size_t kThrottleSlots = 16;
static constexpr size_t kKeyTagLen = 12;
static constexpr size_t kMsgBufSize = 256;
static constexpr const char* kAnsiReset = "\x1B[0m";
static constexpr const char* kAnsiDim = "\x1B[2m\x1B[90m";

struct ThrottleEntry {
  uint32_t hash = 0;
  uint32_t lastMs = 0;
  char keyTag[kKeyTagLen] = {0};
};
static ThrottleEntry s_throttle[kThrottleSlots] = {};

static uint32_t fnv1a32(const char* s) {
  if (!s) return 0;
  uint32_t hash = 2166136261u;
  for (const uint8_t* p = (const uint8_t*)s; *p; ++p) {
    hash ^= *p;
    hash *= 16777619u;
  }
  return hash == 0 ? 1u : hash;
}

static void makeKeyTag(const char* key, char* outTag, size_t tagLen) {
  if (!outTag || tagLen == 0) return;
  if (!key) {
    outTag[0] = '\0';
    return;
  }
  strncpy(outTag, key, tagLen - 1);
  outTag[tagLen - 1] = '\0';
}

static const char* levelToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARNING";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNK";
  }
}

static const char* domainToString(LogDomain dom) {
  switch (dom) {
    case LogDomain::SYSTEM: return "SYSTEM";
    case LogDomain::SERIAL: return "SERIAL";
    case LogDomain::HTTP:   return "HTTP";
    case LogDomain::AUDIT:  return "AUDIT";
    case LogDomain::CONFIG: return "CONFIG";
    default:                return "UNK";
  }
}

static const char* levelToStyle(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::ERROR: return "\x1B[1m\x1B[31m";
    case LogLevel::WARN:  return "\x1B[1m\x1B[33m";
    case LogLevel::INFO:  return "";
    case LogLevel::DEBUG: return "\x1B[2m\x1B[36m";
    default:              return kAnsiDim;
  }
}

static void appendTruncMarker(char* buf, size_t bufSize) {
  if (!buf || bufSize < 4) return;
  const size_t end = bufSize - 1;
  buf[end - 3] = '.';
  buf[end - 2] = '.';
  buf[end - 1] = '.';
  buf[end] = '\0';
}

static void formatMessage(char* msgBuf, size_t bufSize, const char* fmt, va_list args) {
  const int needed = vsnprintf(msgBuf, bufSize, fmt, args);
  if (needed < 0) {
    msgBuf[0] = '\0';
  } else if ((size_t)needed >= bufSize) {
    appendTruncMarker(msgBuf, bufSize);
  }
}

static void logToConsole(uint32_t nowMs, LogLevel lvl, LogDomain dom, const char* msg) {
  char tsBuf[24];
  snprintf(tsBuf, sizeof(tsBuf), "[%6lu.%03lu]",
           (unsigned long)(nowMs / 1000), (unsigned long)(nowMs % 1000));

  if (s_colorEnabled) {
    fprintf(stderr, "%s%s%s %s%-7s%s %-6s: %s\n",
            kAnsiDim, tsBuf, kAnsiReset,
            levelToStyle(lvl), levelToString(lvl), kAnsiReset,
            domainToString(dom), msg ? msg : "");
  } else {
    fprintf(stderr, "%s %-7s %-6s: %s\n",
            tsBuf, levelToString(lvl), domainToString(dom), msg ? msg : "");
  }
}

void logger_begin(LogLevel minLevel, bool colorEnabled) {
  s_minLevel = minLevel;
  s_colorEnabled = colorEnabled;
}

bool logger_parseLevel(const char* text, LogLevel& out) {
  if (!text) return false;

  if (strcasecmp(text, "debug") == 0) {
    out = LogLevel::DEBUG;
  } else if (strcasecmp(text, "info") == 0) {
    out = LogLevel::INFO;
  } else if (strcasecmp(text, "warn") == 0 || strcasecmp(text, "warning") == 0) {
    out = LogLevel::WARN;
  } else if (strcasecmp(text, "error") == 0) {
    out = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

void logger_log(LogLevel lvl, LogDomain dom, const char* fmt, ...) {
  if ((uint8_t)lvl < (uint8_t)s_minLevel) return;

  char msgBuf[kMsgBufSize];
  va_list args;
  va_start(args, fmt);
  formatMessage(msgBuf, sizeof(msgBuf), fmt, args);
  va_end(args);

  logToConsole(millis(), lvl, dom, msgBuf);
}

void logger_logEvery(const char* key, uint32_t intervalMs, LogLevel lvl, LogDomain dom, const char* fmt, ...) {
  if ((uint8_t)lvl < (uint8_t)s_minLevel) return;

  const uint32_t now = millis();
  const uint32_t keyHash = fnv1a32(key);
  char keyTag[kKeyTagLen];
  makeKeyTag(key, keyTag, sizeof(keyTag));

  if (key && key[0] != '\0' && intervalMs > 0) {
    ThrottleEntry* slot = nullptr;
    ThrottleEntry* oldest = nullptr;
    uint32_t oldestAge = 0;

    for (size_t i = 0; i < kThrottleSlots; ++i) {
      ThrottleEntry& e = s_throttle[i];
      if (e.hash == keyHash && strncmp(e.keyTag, keyTag, sizeof(e.keyTag)) == 0) {
        slot = &e;
        break;
      }
      if (e.hash == 0 && slot == nullptr) {
        slot = &e;
      }
      if (e.hash != 0) {
        const uint32_t age = now - e.lastMs;
        if (!oldest || age > oldestAge) {
          oldest = &e;
          oldestAge = age;
        }
      }
    }

    // Table full: evict the slot silent the longest
    if (slot == nullptr) {
      slot = oldest ? oldest : &s_throttle[0];
    }

    if (slot->hash == keyHash && strncmp(slot->keyTag, keyTag, sizeof(slot->keyTag)) == 0) {
      if (now - slot->lastMs < intervalMs) return;
    }

    slot->hash = keyHash;
    makeKeyTag(key, slot->keyTag, sizeof(slot->keyTag));
    slot->lastMs = now;
  }

  char msgBuf[kMsgBufSize];
  va_list args;
  va_start(args, fmt);
  formatMessage(msgBuf, sizeof(msgBuf), fmt, args);
  va_end(args);

  logToConsole(now, lvl, dom, msgBuf);
}
