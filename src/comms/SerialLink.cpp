#include "comms/SerialLink.h"

#include <string.h>

#include "comms/Protocol.h"
#include "utils/Logger.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - A partial frame older than read_timeout_ms is dropped when more bytes
    arrive (rig stalled mid-line, e.g. during a reset)
===============================================================================
*/

// Longest single sleep while waiting, so a shutdown request is seen promptly
static constexpr uint32_t kSleepSliceMs = 100;

// Bytes pulled from the port per read() call
static constexpr size_t kReadChunk = 256;

const char* connectionStateName(ConnectionState s) {
  switch (s) {
    case ConnectionState::DISCONNECTED: return "DISCONNECTED";
    case ConnectionState::CONNECTING:   return "CONNECTING";
    case ConnectionState::CONNECTED:    return "CONNECTED";
    default:                            return "UNKNOWN";
  }
}

SerialLink::SerialLink(SerialPort& port, const SerialLinkConfig& cfg, SleepFn sleep)
: _port(port),
  _cfg(cfg),
  _sleep(sleep)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

/*=============================================================================
  CONNECTION LIFECYCLE
=============================================================================*/

bool SerialLink::connect(double setpoint, const volatile sig_atomic_t* cancel) {
  for (;;) {
    if (cancel && *cancel) {
      _state = ConnectionState::DISCONNECTED;
      return false;
    }

    if (attemptConnect_(setpoint)) {
      return true;
    }

    LOG_WARN(LogDomain::SERIAL, "Retrying in %.1fs...", _cfg.retry_delay_ms / 1000.0);
    if (!sleepUnlessCancelled_(_cfg.retry_delay_ms, cancel)) {
      _state = ConnectionState::DISCONNECTED;
      return false;
    }
  }
}

bool SerialLink::attemptConnect_(double setpoint) {
  // One handle at a time
  if (_port.isOpen()) _port.close();

  _state = ConnectionState::CONNECTING;
  _connect_attempts++;
  resetRx_();

  LOG_INFO(LogDomain::SERIAL, "Connecting to %s...", _cfg.device.c_str());

  if (!_port.open(_cfg.device, _cfg.baud)) {
    LOG_WARN(LogDomain::SERIAL, "Connection failed: %s", _port.lastError().c_str());
    _state = ConnectionState::DISCONNECTED;
    return false;
  }

  if (!_port.discardBuffers()) {
    LOG_WARN(LogDomain::SERIAL, "Connection failed: %s", _port.lastError().c_str());
    _port.close();
    _state = ConnectionState::DISCONNECTED;
    return false;
  }

  LOG_INFO(LogDomain::SERIAL, "Serial connected, initializing...");
  _sleep(_cfg.settle_ms);  // opening the port resets the rig

  if (!sendSetpoint_(setpoint)) {
    LOG_WARN(LogDomain::SERIAL, "Connection failed: %s", _port.lastError().c_str());
    _port.close();
    _state = ConnectionState::DISCONNECTED;
    return false;
  }

  _state = ConnectionState::CONNECTED;
  return true;
}

bool SerialLink::sleepUnlessCancelled_(uint32_t ms, const volatile sig_atomic_t* cancel) {
  uint32_t remaining = ms;
  while (remaining > 0) {
    if (cancel && *cancel) return false;
    const uint32_t step = (remaining < kSleepSliceMs) ? remaining : kSleepSliceMs;
    _sleep(step);
    remaining -= step;
  }
  return !(cancel && *cancel);
}

void SerialLink::markLost_(const char* what) {
  LOG_WARN(LogDomain::SERIAL, "Serial %s error: %s", what, _port.lastError().c_str());
  _port.close();
  _state = ConnectionState::DISCONNECTED;
  resetRx_();
}

void SerialLink::close() {
  if (_port.isOpen()) _port.close();
  _state = ConnectionState::DISCONNECTED;
}

/*=============================================================================
  TX
=============================================================================*/

bool SerialLink::sendSetpoint_(double setpoint) {
  if (!_port.discardBuffers()) return false;

  const std::string frame = protocol::encodeSetpointLine(setpoint);
  if (!_port.write(frame.data(), frame.size())) return false;

  LOG_INFO(LogDomain::SERIAL, "Setpoint sent: %s%%", protocol::formatNumber(setpoint).c_str());
  return true;
}

bool SerialLink::write(double setpoint) {
  if (!isConnected()) return false;

  if (!sendSetpoint_(setpoint)) {
    markLost_("write");
    return false;
  }
  return true;
}

/*=============================================================================
  RX
=============================================================================*/

bool SerialLink::inputPending() {
  if (!isConnected()) return false;

  const int n = _port.available();
  if (n < 0) {
    markLost_("read");
    return false;
  }
  return n > 0;
}

bool SerialLink::readAvailable(RawTelemetry& telemetry, uint32_t now_ms) {
  if (!isConnected()) return false;

  // Drop a fragment the rig never finished
  if (_rx_len > 0 && (now_ms - _rx_started_ms) > _cfg.read_timeout_ms) {
    _fail++;
    LOG_DEBUG(LogDomain::SERIAL, "RX stale fragment dropped len=%u", (unsigned)_rx_len);
    _rx_len = 0;
  }

  char chunk[kReadChunk];
  for (;;) {
    const int pending = _port.available();
    if (pending < 0) {
      markLost_("read");
      return false;
    }
    if (pending == 0) break;

    const size_t want = ((size_t)pending < sizeof(chunk)) ? (size_t)pending : sizeof(chunk);
    const int got = _port.read(chunk, want);
    if (got < 0) {
      markLost_("read");
      return false;
    }
    if (got == 0) break;

    for (int i = 0; i < got; ++i) {
      if (_rx_len == 0 && !_dropping) _rx_started_ms = now_ms;
      consume_(chunk[i], telemetry);
    }
  }

  return true;
}

void SerialLink::consume_(char ch, RawTelemetry& telemetry) {
  if (ch == '\r') return;

  if (_dropping) {
    // We overflowed earlier; discard until newline to resync
    if (ch == '\n') {
      _dropping = false;
      _rx_len = 0;
    }
    return;
  }

  if (ch == '\n') {
    // End of frame
    _rx_buf[_rx_len] = '\0';
    _lines++;
    handleLine_(telemetry);
    _rx_len = 0;
    return;
  }

  // Append to buffer if there is room (leave space for '\0')
  if (_rx_len + 1 < RX_BUF_SIZE) {
    _rx_buf[_rx_len++] = ch;
  } else {
    // Buffer overflow: discard remainder until newline
    _ovf++;
    _dropping = true;
    _rx_buf[RX_BUF_SIZE - 1] = '\0';
    LOG_DEBUG(LogDomain::SERIAL, "RX overflow (ovf=%lu) head=%.24s",
              (unsigned long)_ovf, _rx_buf);
    _rx_len = 0;
  }
}

void SerialLink::handleLine_(RawTelemetry& telemetry) {
  if (_rx_buf[0] == '\0') return;

  switch (protocol::decodeTelemetryLine(_rx_buf, telemetry)) {
    case LineKind::HANDSHAKE:
      _handshakes++;
      LOG_INFO(LogDomain::SERIAL, "Rig ready");
      break;

    case LineKind::READING:
      _ok++;
      break;

    case LineKind::NO_READING:
    default:
      // Electrical noise is expected; count it and move on
      _fail++;
      LOG_DEBUG(LogDomain::SERIAL, "RX discard len=%u head=%.24s", (unsigned)_rx_len, _rx_buf);
      break;
  }
}

void SerialLink::resetRx_() {
  _rx_len = 0;
  _dropping = false;
  _rx_started_ms = 0;
  memset(_rx_buf, 0, sizeof(_rx_buf));
}
