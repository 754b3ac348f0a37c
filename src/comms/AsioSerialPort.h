#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

#include "comms/SerialPort.h"

// tty-backed SerialPort (8N1, no flow control). All Boost.Asio calls use the
// error_code overloads; native_handle() covers what Asio does not expose
// (pending byte count, buffer discard).
class AsioSerialPort : public SerialPort {
public:
  AsioSerialPort();
  ~AsioSerialPort() override;

  bool open(const std::string& device, uint32_t baud) override;
  void close() override;
  bool isOpen() const override { return _port.is_open(); }

  int available() override;
  int read(char* buf, size_t len) override;
  bool write(const char* data, size_t len) override;
  bool discardBuffers() override;

  const std::string& lastError() const override { return _last_error; }

private:
  bool fail_(const char* what, const std::string& reason);

  boost::asio::io_context _io;
  boost::asio::serial_port _port;
  std::string _last_error;
};
