#pragma once
#include <limits.h>
#include <string.h>

#include <string>
#include <vector>

#include "comms/SerialPort.h"

// Scripted stand-in for a tty. Bytes queued in `input` are what the rig
// "sent"; every successful write() is recorded in `writes`.
class FakeSerialPort : public SerialPort {
public:
  // Next N open() calls fail
  int open_failures_left = 0;
  // Next N write() calls fail
  int write_failures_left = 0;
  // available() reports an I/O error while set
  bool fail_available = false;
  // Largest read() hands back per call
  size_t max_read = 0;

  std::string input;
  std::vector<std::string> writes;
  // "discard" / "write:<frame>" in call order, successful calls only
  std::vector<std::string> events;

  int opens = 0;
  int open_calls = 0;
  int closes = 0;
  int discards = 0;
  std::string device;
  uint32_t baud = 0;

  bool open(const std::string& dev, uint32_t b) override {
    open_calls++;
    device = dev;
    baud = b;
    if (open_failures_left > 0) {
      open_failures_left--;
      _error = "No such file or directory";
      return false;
    }
    opens++;
    _open = true;
    return true;
  }

  void close() override {
    if (_open) closes++;
    _open = false;
  }

  bool isOpen() const override { return _open; }

  int available() override {
    if (!_open || fail_available) {
      _error = "Input/output error";
      return -1;
    }
    return input.size() > (size_t)INT_MAX ? INT_MAX : (int)input.size();
  }

  int read(char* buf, size_t len) override {
    if (!_open) {
      _error = "Bad file descriptor";
      return -1;
    }
    size_t n = len < input.size() ? len : input.size();
    if (max_read > 0 && n > max_read) n = max_read;
    memcpy(buf, input.data(), n);
    input.erase(0, n);
    return (int)n;
  }

  bool write(const char* data, size_t len) override {
    if (!_open) {
      _error = "Bad file descriptor";
      return false;
    }
    if (write_failures_left > 0) {
      write_failures_left--;
      _error = "Input/output error";
      return false;
    }
    writes.push_back(std::string(data, len));
    events.push_back("write:" + writes.back());
    return true;
  }

  // Only the output side is touched so tests can queue input before connect
  bool discardBuffers() override {
    if (!_open) {
      _error = "Bad file descriptor";
      return false;
    }
    discards++;
    events.push_back("discard");
    return true;
  }

  const std::string& lastError() const override { return _error; }

private:
  bool _open = false;
  std::string _error;
};
