#pragma once
#include <signal.h>
#include <stdint.h>

#include <string>

#include "Params.h"
#include "comms/Messages.h"
#include "comms/SerialPort.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Bridge-side serial link to the tank rig:

    - Connection lifecycle (Disconnected -> Connecting -> Connected)
    - Blocking connect-with-retry, including the rig reset settle and the
      setpoint init frame
    - Non-blocking drain of every byte currently waiting
    - Accumulate bytes into a newline-delimited line buffer and decode each
      complete line into the caller's RawTelemetry
    - Setpoint command frames ("SP:<value>\n")

  IMPORTANT
  ---------
  Any I/O failure closes the port and drops to Disconnected. Nothing here
  retries a failed read/write; reconnecting is the caller's decision
  (ControlLoop calls connect() again).

  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

enum class ConnectionState : uint8_t {
  DISCONNECTED = 0,
  CONNECTING,
  CONNECTED,
};

const char* connectionStateName(ConnectionState s);

struct SerialLinkConfig {
  std::string device = SERIAL_PORT_DEFAULT;
  uint32_t baud = SERIAL_BAUD;
  uint32_t read_timeout_ms = SERIAL_READ_TIMEOUT_MS;
  uint32_t retry_delay_ms = SERIAL_RETRY_DELAY_MS;
  uint32_t settle_ms = SERIAL_SETTLE_MS;
};

using SleepFn = void (*)(uint32_t ms);

class SerialLink {
public:
  // sleep is used for the settle period and retry delay (tests pass a
  // recorder instead of really sleeping).
  SerialLink(SerialPort& port, const SerialLinkConfig& cfg, SleepFn sleep);

  // Blocks until connected, retrying every retry_delay_ms. The only way out
  // without a connection is *cancel becoming non-zero; then returns false.
  bool connect(double setpoint, const volatile sig_atomic_t* cancel = nullptr);

  // Discards pending I/O, then sends "SP:<setpoint>\n". On failure the link
  // is dropped to Disconnected and false is returned.
  bool write(double setpoint);

  // True if bytes are waiting. An I/O error drops the link.
  bool inputPending();

  // Reads everything currently waiting and decodes complete lines into
  // telemetry. Returns false if the link was lost while reading.
  bool readAvailable(RawTelemetry& telemetry, uint32_t now_ms);

  // Releases the port (shutdown).
  void close();

  ConnectionState state() const { return _state; }
  bool isConnected() const { return _state == ConnectionState::CONNECTED && _port.isOpen(); }

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }
  uint32_t rxHandshakes() const { return _handshakes; }
  uint32_t connectAttempts() const { return _connect_attempts; }

private:
  bool attemptConnect_(double setpoint);
  bool sendSetpoint_(double setpoint);
  void markLost_(const char* what);
  void resetRx_();
  void handleLine_(RawTelemetry& telemetry);
  void consume_(char ch, RawTelemetry& telemetry);
  bool sleepUnlessCancelled_(uint32_t ms, const volatile sig_atomic_t* cancel);

  SerialPort& _port;
  SerialLinkConfig _cfg;
  SleepFn _sleep;

  ConnectionState _state = ConnectionState::DISCONNECTED;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // millis() when the partial line in _rx_buf started
  uint32_t _rx_started_ms = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  // RX stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
  uint32_t _handshakes = 0;
  uint32_t _connect_attempts = 0;
};
