#include "comms/AsioSerialPort.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <sys/ioctl.h>
#include <termios.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>

namespace asio = boost::asio;

AsioSerialPort::AsioSerialPort()
: _port(_io)
{
}

AsioSerialPort::~AsioSerialPort() {
  close();
}

bool AsioSerialPort::fail_(const char* what, const std::string& reason) {
  _last_error = std::string(what) + ": " + reason;
  return false;
}

bool AsioSerialPort::open(const std::string& device, uint32_t baud) {
  if (_port.is_open()) close();

  boost::system::error_code ec;
  _port.open(device, ec);
  if (ec) return fail_(device.c_str(), ec.message());

  _port.set_option(asio::serial_port_base::baud_rate(baud), ec);
  if (!ec) _port.set_option(asio::serial_port_base::character_size(8), ec);
  if (!ec) _port.set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
  if (!ec) _port.set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
  if (!ec) _port.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);

  if (ec) {
    fail_("configure", ec.message());
    boost::system::error_code ignored;
    _port.close(ignored);
    return false;
  }

  _last_error.clear();
  return true;
}

void AsioSerialPort::close() {
  if (!_port.is_open()) return;

  boost::system::error_code ec;
  _port.close(ec);
  if (ec) fail_("close", ec.message());
}

int AsioSerialPort::available() {
  if (!_port.is_open()) {
    fail_("available", "port not open");
    return -1;
  }

  const int fd = _port.native_handle();

  // A yanked USB adapter shows up as HUP/ERR rather than a failing ioctl
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  if (::poll(&pfd, 1, 0) < 0) {
    fail_("poll", strerror(errno));
    return -1;
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    fail_("poll", "device hung up");
    return -1;
  }

  int pending = 0;
  if (::ioctl(fd, FIONREAD, &pending) < 0) {
    fail_("ioctl(FIONREAD)", strerror(errno));
    return -1;
  }
  return pending;
}

int AsioSerialPort::read(char* buf, size_t len) {
  boost::system::error_code ec;
  const size_t n = _port.read_some(asio::buffer(buf, len), ec);
  if (ec) {
    fail_("read", ec.message());
    return -1;
  }
  return (int)n;
}

bool AsioSerialPort::write(const char* data, size_t len) {
  boost::system::error_code ec;
  asio::write(_port, asio::buffer(data, len), ec);
  if (ec) return fail_("write", ec.message());
  return true;
}

bool AsioSerialPort::discardBuffers() {
  if (!_port.is_open()) return fail_("flush", "port not open");

  if (::tcflush(_port.native_handle(), TCIOFLUSH) != 0) {
    return fail_("tcflush", strerror(errno));
  }
  return true;
}
